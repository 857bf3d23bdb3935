#include "config.h"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace beacon::cli {

namespace {

std::optional<std::string> env(const char* name) {
  const char* value = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

constexpr const char* kGeneratePath = "/api/generate";

}  // namespace

ReasoningSettings reasoning_from_env() {
  ReasoningSettings settings;
  settings.url = env("BEACON_REASONING_URL");
  settings.api_key = env("BEACON_REASONING_API_KEY");
  if (auto model = env("BEACON_REASONING_MODEL")) {
    settings.model = *model;
  }
  if (auto timeout = env("BEACON_REASONING_TIMEOUT_MS")) {
    const auto ms = parse_int(*timeout);
    if (ms.has_value() && *ms > 0) {
      settings.timeout_ms = *ms;
    }
  }
  return settings;
}

core::Result<std::optional<goals::ReasoningClientConfig>, std::string> to_client_config(
    const ReasoningSettings& settings) {
  using R = core::Result<std::optional<goals::ReasoningClientConfig>, std::string>;

  if (!settings.url.has_value()) {
    return R::ok(std::nullopt);
  }

  std::string rest = *settings.url;
  const std::string scheme = "http://";
  if (rest.rfind("https://", 0) == 0) {
    return R::err("https reasoning URLs are not supported: " + rest);
  }
  if (rest.rfind(scheme, 0) == 0) {
    rest = rest.substr(scheme.size());
  }

  goals::ReasoningClientConfig config;
  std::string authority = rest;
  std::string base;
  const auto slash = rest.find('/');
  if (slash != std::string::npos) {
    authority = rest.substr(0, slash);
    base = rest.substr(slash);
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    const auto port = parse_int(authority.substr(colon + 1));
    if (!port.has_value() || *port <= 0 || *port > 65535) {
      return R::err("invalid port in reasoning URL: " + *settings.url);
    }
    config.port = *port;
    authority = authority.substr(0, colon);
  } else {
    config.port = 80;
  }
  if (authority.empty()) {
    return R::err("missing host in reasoning URL: " + *settings.url);
  }

  config.host = authority;
  config.path = base + kGeneratePath;
  config.model = settings.model;
  config.api_key = settings.api_key;
  config.timeout_ms = settings.timeout_ms;
  return R::ok(config);
}

goals::RetryPolicy to_retry_policy(const ReasoningSettings& settings) {
  goals::RetryPolicy policy;
  policy.max_attempts = settings.retries + 1;
  return policy;
}

std::optional<int> parse_int(const std::string& text) {
  int value = 0;
  const char* first = text.data();
  const char* last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_double(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_weight(const std::string& text) {
  const auto value = parse_double(text);
  if (!value.has_value() || !std::isfinite(*value) || *value < 0.0) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> items;
  std::string current;
  for (const char ch : text) {
    if (ch == ',') {
      if (!current.empty()) {
        items.push_back(current);
      }
      current.clear();
    } else if (ch != ' ') {
      current += ch;
    }
  }
  if (!current.empty()) {
    items.push_back(current);
  }
  return items;
}

}  // namespace beacon::cli
