#include "import.h"

#include "../config.h"
#include "../runtime.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ImportCliConfig : beacon::cli::CommonConfig {};

constexpr const char* kSynopsis =
    "beacon_cli import --providers <file> --seekers <file> [--db <db-path>]";

}  // namespace

int cmd_import(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<beacon::apps::Option<ImportCliConfig>> options;
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
  if (!config.store.providers_path.has_value() || !config.store.seekers_path.has_value()) {
    std::cerr << "Error: --providers and --seekers are required\n";
    return 2;
  }

  auto workspace = beacon::cli::Workspace::open(config.store);
  if (!workspace.has_value()) {
    std::cerr << "Error: " << workspace.error() << "\n";
    return 1;
  }

  auto& services = workspace.value()->services();
  nlohmann::json out;
  out["providers"] = services.profiles.list_providers().size();
  out["seekers"] = services.profiles.list_seekers().size();
  out["rejected"] = workspace.value()->rejected_records();
  out["persistent"] = workspace.value()->persistent();
  std::cout << out.dump(2) << "\n";
  return 0;
}
