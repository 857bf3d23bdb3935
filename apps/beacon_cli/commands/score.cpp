#include "score.h"

#include "../config.h"
#include "../runtime.h"
#include "score_logic.h"

#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ScoreCliConfig : beacon::cli::CommonConfig {
  std::string provider_id;  // NOLINT(readability-identifier-naming)
  std::string seeker_id;    // NOLINT(readability-identifier-naming)
  bool with_goals{false};   // NOLINT(readability-identifier-naming)
  std::optional<double> goal_weight;  // NOLINT(readability-identifier-naming)
};

constexpr const char* kSynopsis =
    "beacon_cli score --provider <id> --seeker <id> [--goals [--goal-weight <w>]] "
    "[--db <path> | --providers <file> --seekers <file>]";

}  // namespace

int cmd_score(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<beacon::apps::Option<ScoreCliConfig>> options = {
      {"--provider", true, "Provider id",
       [](ScoreCliConfig& c, const std::string& v) {
         c.provider_id = v;
         return !v.empty();
       }},
      {"--seeker", true, "Seeker id",
       [](ScoreCliConfig& c, const std::string& v) {
         c.seeker_id = v;
         return !v.empty();
       }},
      {"--goals", false, "Include goal alignment as a scoring factor",
       [](ScoreCliConfig& c, const std::string& /*v*/) {
         c.with_goals = true;
         return true;
       }},
      {"--goal-weight", true, "Weight of goal alignment with --goals (default 5)",
       [](ScoreCliConfig& c, const std::string& v) {
         c.goal_weight = beacon::cli::parse_weight(v);
         return c.goal_weight.has_value();
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
  if (config.provider_id.empty() || config.seeker_id.empty()) {
    std::cerr << "Error: --provider and --seeker are required\n";
    return 2;
  }
  if (config.goal_weight.has_value() && !config.with_goals) {
    std::cerr << "Error: --goal-weight requires --goals\n";
    return 2;
  }

  auto stack = beacon::cli::build_scoring_stack(config.reasoning);
  if (!stack.has_value()) {
    std::cerr << "Error: " << stack.error() << "\n";
    return 2;
  }
  auto workspace = beacon::cli::Workspace::open(config.store);
  if (!workspace.has_value()) {
    std::cerr << "Error: " << workspace.error() << "\n";
    return 1;
  }

  beacon::core::SystemIdGenerator id_gen;
  beacon::core::SystemClock clock;

  beacon::app::ScoreRequest req;
  req.provider_id = beacon::core::ProviderId{config.provider_id};
  req.seeker_id = beacon::core::SeekerId{config.seeker_id};
  req.with_goals = config.with_goals;
  req.goal_weight = config.goal_weight;

  return run_score(req, workspace.value()->services(), stack.value()->engine(), id_gen, clock);
}
