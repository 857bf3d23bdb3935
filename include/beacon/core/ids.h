#pragma once

#include <string>

namespace beacon::core {

// Strong ID types (C.11). Regular value types so a provider id can never be
// passed where a seeker id is expected.

struct ProviderId {
  std::string value;
  auto operator<=>(const ProviderId&) const = default;
};

struct SeekerId {
  std::string value;
  auto operator<=>(const SeekerId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

}  // namespace beacon::core
