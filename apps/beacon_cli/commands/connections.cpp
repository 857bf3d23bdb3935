#include "connections.h"

#include "../config.h"
#include "../runtime.h"
#include "connections_logic.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ConnectionsCliConfig : beacon::cli::CommonConfig {
  std::string provider_id;  // NOLINT(readability-identifier-naming)
  std::string seeker_id;    // NOLINT(readability-identifier-naming)
};

constexpr const char* kSynopsis =
    "beacon_cli connections sent --provider <id> | received --seeker <id> [options]";

}  // namespace

int cmd_connections(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<beacon::apps::Option<ConnectionsCliConfig>> options = {
      {"--provider", true, "Provider id (with sent)",
       [](ConnectionsCliConfig& c, const std::string& v) {
         c.provider_id = v;
         return !v.empty();
       }},
      {"--seeker", true, "Seeker id (with received)",
       [](ConnectionsCliConfig& c, const std::string& v) {
         c.seeker_id = v;
         return !v.empty();
       }},
  };
  beacon::cli::add_common_options(options);

  if (argc < 3) {
    beacon::apps::print_usage(std::cerr, kSynopsis, options);
    return 2;
  }
  const std::string direction = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (direction == "--help") {
    beacon::apps::print_usage(std::cout, kSynopsis, options);
    return 0;
  }
  if (direction != "sent" && direction != "received") {
    std::cerr << "Error: expected 'sent' or 'received', got '" << direction << "'\n";
    beacon::apps::print_usage(std::cerr, kSynopsis, options);
    return 2;
  }

  auto parsed = beacon::apps::parse_options(argc, argv, options, 3);
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
  if (direction == "sent" && config.provider_id.empty()) {
    std::cerr << "Error: connections sent requires --provider\n";
    return 2;
  }
  if (direction == "received" && config.seeker_id.empty()) {
    std::cerr << "Error: connections received requires --seeker\n";
    return 2;
  }

  auto workspace = beacon::cli::Workspace::open(config.store);
  if (!workspace.has_value()) {
    std::cerr << "Error: " << workspace.error() << "\n";
    return 1;
  }

  if (direction == "sent") {
    return run_sent_connections(beacon::core::ProviderId{config.provider_id},
                                workspace.value()->services());
  }
  return run_received_connections(beacon::core::SeekerId{config.seeker_id},
                                  workspace.value()->services());
}
