#pragma once

#include "beacon/app/app_service.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/core/services.h"

// run_score: score one pair and print the result as JSON.
// Takes only interface types; no concrete storage headers in this TU.
int run_score(const beacon::app::ScoreRequest& req, beacon::core::Services& services,
              const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
              beacon::core::IClock& clock);
