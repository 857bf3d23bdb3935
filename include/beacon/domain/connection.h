#pragma once

#include "beacon/core/ids.h"

#include <optional>
#include <string>
#include <string_view>

namespace beacon::domain {

enum class ConnectionStatus {
  kPending,
  kAccepted,
  kDeclined,
};

// A response can only accept or decline; kPending is never a reply.
enum class ConnectionResponse {
  kAccepted,
  kDeclined,
};

// Who acted on a connection.
enum class Party {
  kProvider,
  kSeeker,
};

[[nodiscard]] std::string_view to_string(ConnectionStatus status);
[[nodiscard]] std::optional<ConnectionStatus> parse_connection_status(std::string_view text);
[[nodiscard]] std::optional<ConnectionResponse> parse_connection_response(std::string_view text);
[[nodiscard]] std::optional<Party> parse_party(std::string_view text);
[[nodiscard]] std::string_view to_string(Party party);

// Connection records that a provider reached out to a seeker.
// Any connection, whatever its status, removes the seeker from that
// provider's future feeds. The scores are the ones shown to the provider when
// the request was made; goal_alignment is absent when none was computed.
struct Connection {
  core::ProviderId provider_id;
  core::SeekerId seeker_id;
  ConnectionStatus status{ConnectionStatus::kPending};
  double provider_score{0.0};
  double seeker_score{0.0};
  double bilateral_score{0.0};
  std::optional<double> goal_alignment;  // NOLINT(readability-identifier-naming)
  std::string created_at;
  std::optional<std::string> provider_decided_at;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> seeker_decided_at;    // NOLINT(readability-identifier-naming)
};

}  // namespace beacon::domain
