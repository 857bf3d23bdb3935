#pragma once

#include "beacon/storage/audit_log.h"
#include "beacon/storage/repositories.h"

namespace beacon::core {

// Services bundles the stores every entry point needs.
// It holds references only; the CLI or test that builds it owns the instances.
struct Services {
  storage::IProfileRepository& profiles;        // NOLINT(readability-identifier-naming)
  storage::IConnectionRepository& connections;  // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;                // NOLINT(readability-identifier-naming)

  Services(storage::IProfileRepository& profiles, storage::IConnectionRepository& connections,
           storage::IAuditLog& audit_log)
      : profiles(profiles), connections(connections), audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace beacon::core
