#include "beacon/domain/connection.h"

namespace beacon::domain {

std::string_view to_string(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kPending:
      return "pending";
    case ConnectionStatus::kAccepted:
      return "accepted";
    case ConnectionStatus::kDeclined:
      return "declined";
  }
  return "pending";
}

std::optional<ConnectionStatus> parse_connection_status(std::string_view text) {
  if (text == "pending") {
    return ConnectionStatus::kPending;
  }
  if (text == "accepted") {
    return ConnectionStatus::kAccepted;
  }
  if (text == "declined") {
    return ConnectionStatus::kDeclined;
  }
  return std::nullopt;
}

std::optional<ConnectionResponse> parse_connection_response(std::string_view text) {
  if (text == "accepted") {
    return ConnectionResponse::kAccepted;
  }
  if (text == "declined") {
    return ConnectionResponse::kDeclined;
  }
  return std::nullopt;
}

std::string_view to_string(Party party) {
  return party == Party::kProvider ? "provider" : "seeker";
}

std::optional<Party> parse_party(std::string_view text) {
  if (text == "provider") {
    return Party::kProvider;
  }
  if (text == "seeker") {
    return Party::kSeeker;
  }
  return std::nullopt;
}

}  // namespace beacon::domain
