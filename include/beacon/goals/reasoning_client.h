#pragma once

#include "beacon/core/result.h"
#include "beacon/goals/goal_estimator.h"

#include <optional>
#include <string>

namespace beacon::goals {

// ReasoningClientConfig addresses an Ollama-style generate endpoint.
struct ReasoningClientConfig {
  std::string host{"localhost"};       // NOLINT(readability-identifier-naming)
  int port{11434};                     // NOLINT(readability-identifier-naming)
  std::string path{"/api/generate"};   // NOLINT(readability-identifier-naming)
  std::string model{"llama3"};         // NOLINT(readability-identifier-naming)
  std::optional<std::string> api_key;  // NOLINT(readability-identifier-naming)
  bool require_api_key{false};         // NOLINT(readability-identifier-naming)
  int timeout_ms{10000};               // NOLINT(readability-identifier-naming)
};

// IReasoningClient sends one prompt and returns the model's raw text output.
// Implementations must be safe to call concurrently.
class IReasoningClient {
 public:
  virtual ~IReasoningClient() = default;

  [[nodiscard]] virtual core::Result<std::string, ReasoningError> complete(
      const std::string& prompt) = 0;

 protected:
  IReasoningClient() = default;
  IReasoningClient(const IReasoningClient&) = default;
  IReasoningClient& operator=(const IReasoningClient&) = default;
  IReasoningClient(IReasoningClient&&) = default;
  IReasoningClient& operator=(IReasoningClient&&) = default;
};

}  // namespace beacon::goals
