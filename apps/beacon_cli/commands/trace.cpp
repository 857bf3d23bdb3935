#include "trace.h"

#include "../config.h"
#include "../runtime.h"

#include "beacon/app/app_service.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TraceCliConfig : beacon::cli::CommonConfig {
  std::string trace_id;  // NOLINT(readability-identifier-naming)
};

constexpr const char* kSynopsis = "beacon_cli trace --trace-id <id> --db <db-path>";

}  // namespace

int cmd_trace(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<beacon::apps::Option<TraceCliConfig>> options = {
      {"--trace-id", true, "Trace id printed by score, feed, filter, connect or respond",
       [](TraceCliConfig& c, const std::string& v) {
         c.trace_id = v;
         return !v.empty();
       }},
  };
  beacon::cli::add_common_options(options);

  auto parsed = beacon::apps::parse_options(argc, argv, options, 2);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << parsed.error() << "\n";
    beacon::apps::print_usage(std::cerr, kSynopsis, options);
    return 2;
  }
  const auto& config = parsed.value();
  if (config.help) {
    beacon::apps::print_usage(std::cout, kSynopsis, options);
    return 0;
  }
  if (config.trace_id.empty()) {
    std::cerr << "Error: --trace-id is required\n";
    return 2;
  }

  auto workspace = beacon::cli::Workspace::open(config.store);
  if (!workspace.has_value()) {
    std::cerr << "Error: " << workspace.error() << "\n";
    return 1;
  }

  const auto events =
      beacon::app::fetch_audit_trace(config.trace_id, workspace.value()->services());

  nlohmann::json out = nlohmann::json::array();
  for (const auto& event : events) {
    nlohmann::json payload;
    try {
      payload = nlohmann::json::parse(event.payload);
    } catch (const nlohmann::json::exception&) {
      payload = event.payload;
    }
    out.push_back({
        {"event_id", event.event_id},
        {"trace_id", event.trace_id},
        {"event_type", event.event_type},
        {"created_at", event.created_at},
        {"payload", payload},
        {"refs", event.refs},
    });
  }
  std::cout << out.dump(2) << "\n";
  return events.empty() ? 1 : 0;
}
