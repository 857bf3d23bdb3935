#pragma once

#include "beacon/app/app_service.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/core/services.h"

// run_filter_command: screen candidates against score floors and print them as JSON.
int run_filter_command(const beacon::app::ThresholdRequest& req, beacon::core::Services& services,
                       const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
                       beacon::core::IClock& clock);
