#pragma once

#include "beacon/core/ids.h"
#include "beacon/core/services.h"

// run_sent_connections: print the provider's sent requests as a JSON array.
int run_sent_connections(const beacon::core::ProviderId& provider_id,
                         beacon::core::Services& services);

// run_received_connections: print the requests a seeker has received.
int run_received_connections(const beacon::core::SeekerId& seeker_id,
                             beacon::core::Services& services);
