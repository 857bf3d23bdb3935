#include "beacon/goals/http_reasoning_client.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace beacon::goals {

namespace {

using CompleteResult = core::Result<std::string, ReasoningError>;

CompleteResult fail(ReasoningErrorKind kind, std::string message, int status = 0) {
  return CompleteResult::err(ReasoningError{kind, std::move(message), status});
}

}  // namespace

HttpReasoningClient::HttpReasoningClient(ReasoningClientConfig config)
    : config_(std::move(config)) {}

core::Result<std::string, ReasoningError> HttpReasoningClient::complete(const std::string& prompt) {
  if (config_.require_api_key && (!config_.api_key.has_value() || config_.api_key->empty())) {
    return fail(ReasoningErrorKind::kMissingCredential, "reasoning service API key not set");
  }

  httplib::Client cli(config_.host, config_.port);
  const time_t seconds = config_.timeout_ms / 1000;
  const time_t micros = static_cast<time_t>(config_.timeout_ms % 1000) * 1000;
  cli.set_connection_timeout(seconds, micros);
  cli.set_read_timeout(seconds, micros);
  cli.set_write_timeout(seconds, micros);

  httplib::Headers headers;
  if (config_.api_key.has_value() && !config_.api_key->empty()) {
    headers.emplace("Authorization", "Bearer " + *config_.api_key);
  }

  const nlohmann::json request = {
      {"model", config_.model},
      {"prompt", prompt},
      {"stream", false},
      {"format", "json"},
  };

  auto res = cli.Post(config_.path, headers, request.dump(), "application/json");
  if (!res) {
    const auto error = res.error();
    std::cerr << "[HttpReasoningClient] Connection failed: " << static_cast<int>(error) << "\n";
    if (error == httplib::Error::Read) {
      return fail(ReasoningErrorKind::kTimeout,
                  "no reply within " + std::to_string(config_.timeout_ms) + " ms");
    }
    return fail(ReasoningErrorKind::kTransport,
                "connection to " + config_.host + ":" + std::to_string(config_.port) +
                    " failed (httplib error " + std::to_string(static_cast<int>(error)) + ")");
  }

  if (res->status != 200) {
    std::cerr << "[HttpReasoningClient] HTTP Error " << res->status << "\n";
    return fail(ReasoningErrorKind::kHttpStatus, "HTTP " + std::to_string(res->status),
                res->status);
  }

  try {
    const auto body = nlohmann::json::parse(res->body);
    if (!body.is_object() || !body.contains("response") || !body["response"].is_string()) {
      return fail(ReasoningErrorKind::kMalformedResponse, "reply has no \"response\" string");
    }
    return CompleteResult::ok(body["response"].get<std::string>());
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[HttpReasoningClient] JSON Parse Error: " << e.what() << "\n";
    return fail(ReasoningErrorKind::kMalformedResponse, e.what());
  }
}

}  // namespace beacon::goals
