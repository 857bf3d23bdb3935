#pragma once

#include "beacon/app/app_service.h"
#include "beacon/core/cancellation.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/core/services.h"

// run_feed_command: build a provider's feed and print it as JSON.
// Takes only interface types; no concrete storage headers in this TU.
int run_feed_command(const beacon::app::FeedRequest& req, beacon::core::Services& services,
                     const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
                     beacon::core::IClock& clock, const beacon::core::CancellationToken* cancel);
