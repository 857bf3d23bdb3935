#pragma once

#include "beacon/core/cancellation.h"
#include "beacon/core/result.h"
#include "beacon/domain/goal_alignment.h"
#include "beacon/domain/profile.h"

#include <string>
#include <string_view>

namespace beacon::goals {

// ReasoningErrorKind classifies why a remote goal judgment was not obtained.
enum class ReasoningErrorKind {
  kNotConfigured,
  kMissingCredential,
  kTimeout,
  kTransport,
  kHttpStatus,
  kMalformedResponse,
  kOutOfRange,
  kCancelled,
};

struct ReasoningError {
  ReasoningErrorKind kind{ReasoningErrorKind::kTransport};
  std::string message;
  int http_status{0};  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string_view to_string(ReasoningErrorKind kind);

// describe renders "kind: message" for audit payloads and fallback causes.
[[nodiscard]] std::string describe(const ReasoningError& error);

// Timeouts, transport failures, HTTP 429 and 5xx may succeed on a later attempt.
// Everything else is a property of the request or the reply and will not.
[[nodiscard]] bool is_retryable(const ReasoningError& error);

// IGoalEstimator judges how well a provider can help a seeker reach their goal.
// Implementations must be safe to call concurrently from several threads.
class IGoalEstimator {
 public:
  virtual ~IGoalEstimator() = default;

  // cancel may be nullptr. Once it is cancelled, implementations issue no new
  // external calls.
  [[nodiscard]] virtual core::Result<domain::GoalAlignment, ReasoningError> estimate(
      const domain::Provider& provider, const domain::Seeker& seeker,
      const core::CancellationToken* cancel) = 0;

 protected:
  IGoalEstimator() = default;
  IGoalEstimator(const IGoalEstimator&) = default;
  IGoalEstimator& operator=(const IGoalEstimator&) = default;
  IGoalEstimator(IGoalEstimator&&) = default;
  IGoalEstimator& operator=(IGoalEstimator&&) = default;
};

}  // namespace beacon::goals
