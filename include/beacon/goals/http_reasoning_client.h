#pragma once

#include "beacon/goals/reasoning_client.h"

namespace beacon::goals {

// HttpReasoningClient POSTs {"model", "prompt", "stream": false, "format": "json"}
// and returns the "response" field of the reply. A new connection is opened per
// call, so one instance may be shared across threads.
class HttpReasoningClient final : public IReasoningClient {
 public:
  explicit HttpReasoningClient(ReasoningClientConfig config);

  [[nodiscard]] core::Result<std::string, ReasoningError> complete(
      const std::string& prompt) override;

  [[nodiscard]] const ReasoningClientConfig& config() const { return config_; }

 private:
  ReasoningClientConfig config_;
};

}  // namespace beacon::goals
