#include "beacon/goals/goal_estimator.h"

namespace beacon::goals {

std::string_view to_string(ReasoningErrorKind kind) {
  switch (kind) {
    case ReasoningErrorKind::kNotConfigured:
      return "not_configured";
    case ReasoningErrorKind::kMissingCredential:
      return "missing_credential";
    case ReasoningErrorKind::kTimeout:
      return "timeout";
    case ReasoningErrorKind::kTransport:
      return "transport";
    case ReasoningErrorKind::kHttpStatus:
      return "http_status";
    case ReasoningErrorKind::kMalformedResponse:
      return "malformed_response";
    case ReasoningErrorKind::kOutOfRange:
      return "out_of_range";
    case ReasoningErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string describe(const ReasoningError& error) {
  std::string text(to_string(error.kind));
  if (!error.message.empty()) {
    text += ": " + error.message;
  }
  return text;
}

bool is_retryable(const ReasoningError& error) {
  switch (error.kind) {
    case ReasoningErrorKind::kTimeout:
    case ReasoningErrorKind::kTransport:
      return true;
    case ReasoningErrorKind::kHttpStatus:
      return error.http_status == 429 || error.http_status >= 500;
    case ReasoningErrorKind::kNotConfigured:
    case ReasoningErrorKind::kMissingCredential:
    case ReasoningErrorKind::kMalformedResponse:
    case ReasoningErrorKind::kOutOfRange:
    case ReasoningErrorKind::kCancelled:
      return false;
  }
  return false;
}

}  // namespace beacon::goals
