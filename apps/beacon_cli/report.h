#pragma once

#include "beacon/app/app_service.h"

namespace beacon::cli {

// report_app_error prints the error to stderr and returns the process exit code.
int report_app_error(const app::AppError& error);

}  // namespace beacon::cli
