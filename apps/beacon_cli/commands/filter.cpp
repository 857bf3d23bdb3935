#include "filter.h"

#include "../config.h"
#include "../runtime.h"
#include "filter_logic.h"

#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct FilterCliConfig : beacon::cli::CommonConfig {
  std::string provider_id;                                   // NOLINT(readability-identifier-naming)
  std::optional<std::vector<std::string>> candidates;        // NOLINT(readability-identifier-naming)
  beacon::feed::ThresholdOptions thresholds;                 // NOLINT(readability-identifier-naming)
};

constexpr const char* kSynopsis = "beacon_cli filter --provider <id> [options]";

bool parse_floor(const std::string& value, double& target) {
  const auto x = beacon::cli::parse_double(value);
  if (!x.has_value() || *x < 0.0 || *x > 100.0) {
    return false;
  }
  target = *x;
  return true;
}

}  // namespace

int cmd_filter(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<beacon::apps::Option<FilterCliConfig>> options = {
      {"--provider", true, "Provider id",
       [](FilterCliConfig& c, const std::string& v) {
         c.provider_id = v;
         return !v.empty();
       }},
      {"--candidates", true, "Comma-separated seeker ids to screen (default: all)",
       [](FilterCliConfig& c, const std::string& v) {
         c.candidates = beacon::cli::split_list(v);
         return true;
       }},
      {"--min-provider", true, "Minimum provider score",
       [](FilterCliConfig& c, const std::string& v) {
         return parse_floor(v, c.thresholds.min_provider);
       }},
      {"--min-seeker", true, "Minimum seeker score",
       [](FilterCliConfig& c, const std::string& v) {
         return parse_floor(v, c.thresholds.min_seeker);
       }},
      {"--min-bilateral", true, "Minimum bilateral score",
       [](FilterCliConfig& c, const std::string& v) {
         return parse_floor(v, c.thresholds.min_bilateral);
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
  if (config.provider_id.empty()) {
    std::cerr << "Error: --provider is required\n";
    return 2;
  }

  // Screening never consults the goal estimator, so no reasoning setup is needed.
  beacon::cli::ScoringStack stack(std::nullopt, beacon::goals::RetryPolicy{});
  auto workspace = beacon::cli::Workspace::open(config.store);
  if (!workspace.has_value()) {
    std::cerr << "Error: " << workspace.error() << "\n";
    return 1;
  }

  beacon::core::SystemIdGenerator id_gen;
  beacon::core::SystemClock clock;

  beacon::app::ThresholdRequest req;
  req.provider_id = beacon::core::ProviderId{config.provider_id};
  req.thresholds = config.thresholds;
  if (config.candidates.has_value()) {
    std::vector<beacon::core::SeekerId> ids;
    for (const auto& id : *config.candidates) {
      ids.push_back(beacon::core::SeekerId{id});
    }
    req.seeker_ids = std::move(ids);
  }

  return run_filter_command(req, workspace.value()->services(), stack.engine(), id_gen, clock);
}
