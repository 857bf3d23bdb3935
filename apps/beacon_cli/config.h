#pragma once

#include "beacon/core/result.h"
#include "beacon/goals/reasoning_client.h"
#include "beacon/goals/remote_goal_estimator.h"

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace beacon::cli {

// StoreSettings selects where profiles come from. With db_path the SQLite
// store is used; the JSON files, when given, are imported into whichever
// store is open before the command runs.
struct StoreSettings {
  std::optional<std::string> db_path;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> providers_path;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> seekers_path;    // NOLINT(readability-identifier-naming)
};

// ReasoningSettings start from BEACON_REASONING_* and are overridden by flags.
// No url means goal alignment runs on the heuristic only.
struct ReasoningSettings {
  std::optional<std::string> url;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> api_key;  // NOLINT(readability-identifier-naming)
  std::string model{"llama3"};         // NOLINT(readability-identifier-naming)
  int timeout_ms{10000};               // NOLINT(readability-identifier-naming)
  int retries{1};                      // NOLINT(readability-identifier-naming)
};

// CommonConfig is embedded by every subcommand config.
struct CommonConfig {
  StoreSettings store;          // NOLINT(readability-identifier-naming)
  ReasoningSettings reasoning;  // NOLINT(readability-identifier-naming)
  bool help{false};             // NOLINT(readability-identifier-naming)
};

[[nodiscard]] ReasoningSettings reasoning_from_env();

// to_client_config parses "http://host[:port][/base]" into a client config.
// Returns nullopt when no url is set.
[[nodiscard]] core::Result<std::optional<goals::ReasoningClientConfig>, std::string>
to_client_config(const ReasoningSettings& settings);

[[nodiscard]] goals::RetryPolicy to_retry_policy(const ReasoningSettings& settings);

[[nodiscard]] std::optional<int> parse_int(const std::string& text);
[[nodiscard]] std::optional<double> parse_double(const std::string& text);

// parse_weight accepts a finite, non-negative factor weight.
[[nodiscard]] std::optional<double> parse_weight(const std::string& text);

// Comma-separated list; empty items are dropped.
[[nodiscard]] std::vector<std::string> split_list(const std::string& text);

// Store, reasoning and --help flags shared by every subcommand.
template <typename Config>
void add_common_options(std::vector<apps::Option<Config>>& options) {
  options.push_back({"--db", true, "Path to SQLite database file",
                     [](Config& c, const std::string& v) {
                       c.store.db_path = v;
                       return true;
                     }});
  options.push_back({"--providers", true, "Providers JSON file to load",
                     [](Config& c, const std::string& v) {
                       c.store.providers_path = v;
                       return true;
                     }});
  options.push_back({"--seekers", true, "Seekers JSON file to load",
                     [](Config& c, const std::string& v) {
                       c.store.seekers_path = v;
                       return true;
                     }});
  options.push_back({"--reasoning-url", true, "Reasoning service base URL (http://host:port)",
                     [](Config& c, const std::string& v) {
                       c.reasoning.url = v;
                       return true;
                     }});
  options.push_back({"--reasoning-model", true, "Model name sent to the reasoning service",
                     [](Config& c, const std::string& v) {
                       c.reasoning.model = v;
                       return !v.empty();
                     }});
  options.push_back({"--reasoning-timeout-ms", true, "Per-request timeout in milliseconds",
                     [](Config& c, const std::string& v) {
                       const auto ms = parse_int(v);
                       if (!ms.has_value() || *ms <= 0) {
                         return false;
                       }
                       c.reasoning.timeout_ms = *ms;
                       return true;
                     }});
  options.push_back({"--reasoning-retries", true, "Retries after a retryable failure",
                     [](Config& c, const std::string& v) {
                       const auto n = parse_int(v);
                       if (!n.has_value() || *n < 0) {
                         return false;
                       }
                       c.reasoning.retries = *n;
                       return true;
                     }});
  options.push_back({"--help", false, "Show this help",
                     [](Config& c, const std::string& /*v*/) {
                       c.help = true;
                       return true;
                     }});
}

}  // namespace beacon::cli
