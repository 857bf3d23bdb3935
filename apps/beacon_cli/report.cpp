#include "report.h"

#include <iostream>

namespace beacon::cli {

int report_app_error(const app::AppError& error) {
  const char* label = "error";
  switch (error.code) {
    case app::AppErrorCode::kNotFound:
      label = "not found";
      break;
    case app::AppErrorCode::kConflict:
      label = "conflict";
      break;
    case app::AppErrorCode::kCancelled:
      label = "cancelled";
      break;
    case app::AppErrorCode::kStorage:
      label = "storage error";
      break;
    case app::AppErrorCode::kInvalidArgument:
      label = "invalid argument";
      break;
  }
  std::cerr << "Error (" << label << "): " << error.message << "\n";
  if (error.code == app::AppErrorCode::kCancelled) {
    return 130;
  }
  return error.code == app::AppErrorCode::kInvalidArgument ? 2 : 1;
}

}  // namespace beacon::cli
