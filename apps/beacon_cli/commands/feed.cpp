#include "feed.h"

#include "../config.h"
#include "../runtime.h"
#include "feed_logic.h"

#include "beacon/core/cancellation.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"

#include "shared/arg_parser.h"
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct FeedCliConfig : beacon::cli::CommonConfig {
  std::string provider_id;                                  // NOLINT(readability-identifier-naming)
  std::size_t feed_size{beacon::feed::kDefaultFeedSize};    // NOLINT(readability-identifier-naming)
  double min_bilateral{beacon::feed::kDefaultMinBilateral};  // NOLINT(readability-identifier-naming)
  std::vector<std::string> excluded;                        // NOLINT(readability-identifier-naming)
  std::size_t workers{0};                                   // NOLINT(readability-identifier-naming)
  std::optional<double> goal_weight;                        // NOLINT(readability-identifier-naming)
};

constexpr const char* kSynopsis = "beacon_cli feed --provider <id> [options]";

beacon::core::CancellationToken g_cancel;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void on_interrupt(int /*signal*/) {
  g_cancel.cancel();
}

}  // namespace

int cmd_feed(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<beacon::apps::Option<FeedCliConfig>> options = {
      {"--provider", true, "Provider id",
       [](FeedCliConfig& c, const std::string& v) {
         c.provider_id = v;
         return !v.empty();
       }},
      {"--size", true, "Maximum number of feed items",
       [](FeedCliConfig& c, const std::string& v) {
         const auto n = beacon::cli::parse_int(v);
         if (!n.has_value() || *n < 0) {
           return false;
         }
         c.feed_size = static_cast<std::size_t>(*n);
         return true;
       }},
      {"--min-score", true, "Minimum bilateral score (0-100)",
       [](FeedCliConfig& c, const std::string& v) {
         const auto x = beacon::cli::parse_double(v);
         if (!x.has_value() || *x < 0.0 || *x > 100.0) {
           return false;
         }
         c.min_bilateral = *x;
         return true;
       }},
      {"--exclude", true, "Comma-separated seeker ids to leave out",
       [](FeedCliConfig& c, const std::string& v) {
         const auto ids = beacon::cli::split_list(v);
         c.excluded.insert(c.excluded.end(), ids.begin(), ids.end());
         return true;
       }},
      {"--workers", true, "Concurrent scoring tasks (0 = hardware concurrency)",
       [](FeedCliConfig& c, const std::string& v) {
         const auto n = beacon::cli::parse_int(v);
         if (!n.has_value() || *n < 0) {
           return false;
         }
         c.workers = static_cast<std::size_t>(*n);
         return true;
       }},
      {"--goal-weight", true, "Weight of goal alignment for this feed (default 5)",
       [](FeedCliConfig& c, const std::string& v) {
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
  if (config.provider_id.empty()) {
    std::cerr << "Error: --provider is required\n";
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

  beacon::app::FeedRequest req;
  req.provider_id = beacon::core::ProviderId{config.provider_id};
  req.feed_size = config.feed_size;
  req.min_bilateral = config.min_bilateral;
  req.max_workers = config.workers;
  req.goal_weight = config.goal_weight;
  for (const auto& id : config.excluded) {
    req.excluded_ids.push_back(beacon::core::SeekerId{id});
  }

  std::signal(SIGINT, on_interrupt);
  const int rc = run_feed_command(req, workspace.value()->services(), stack.value()->engine(),
                                  id_gen, clock, &g_cancel);
  std::signal(SIGINT, SIG_DFL);
  return rc;
}
