#pragma once

#include "beacon/app/app_service.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/core/ids.h"
#include "beacon/core/services.h"
#include "beacon/domain/connection.h"

// run_connect: record a pending connection and print it as JSON.
int run_connect(const beacon::app::ConnectRequest& req, beacon::core::Services& services,
                const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
                beacon::core::IClock& clock);

// run_respond: apply an accept or decline and print the updated connection.
int run_respond(const beacon::core::ProviderId& provider_id,
                const beacon::core::SeekerId& seeker_id, beacon::domain::Party responder,
                beacon::domain::ConnectionResponse response, beacon::core::Services& services,
                beacon::core::IIdGenerator& id_gen, beacon::core::IClock& clock);
