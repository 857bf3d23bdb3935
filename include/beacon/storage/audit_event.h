#pragma once

#include <string>
#include <vector>

namespace beacon::storage {

// AuditEvent is one append-only record of a pipeline step.
// payload is a compact JSON object; refs lists the entity ids involved.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace beacon::storage
