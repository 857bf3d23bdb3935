#include "connect.h"

#include "../config.h"
#include "../runtime.h"
#include "connect_logic.h"

#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/domain/connection.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ConnectCliConfig : beacon::cli::CommonConfig {
  std::string provider_id;  // NOLINT(readability-identifier-naming)
  std::string seeker_id;    // NOLINT(readability-identifier-naming)
  std::optional<beacon::domain::Party> responder;                // NOLINT(readability-identifier-naming)
  std::optional<beacon::domain::ConnectionResponse> response;  // NOLINT(readability-identifier-naming)
  std::optional<double> provider_score;   // NOLINT(readability-identifier-naming)
  std::optional<double> seeker_score;     // NOLINT(readability-identifier-naming)
  std::optional<double> bilateral_score;  // NOLINT(readability-identifier-naming)
  std::optional<double> goal_alignment;   // NOLINT(readability-identifier-naming)
  std::optional<double> goal_weight;      // NOLINT(readability-identifier-naming)
};

std::optional<double> parse_score(const std::string& v, double high) {
  const auto x = beacon::cli::parse_double(v);
  if (!x.has_value() || *x < 0.0 || *x > high) {
    return std::nullopt;
  }
  return x;
}

std::vector<beacon::apps::Option<ConnectCliConfig>> pair_options() {
  std::vector<beacon::apps::Option<ConnectCliConfig>> options = {
      {"--provider", true, "Provider id",
       [](ConnectCliConfig& c, const std::string& v) {
         c.provider_id = v;
         return !v.empty();
       }},
      {"--seeker", true, "Seeker id",
       [](ConnectCliConfig& c, const std::string& v) {
         c.seeker_id = v;
         return !v.empty();
       }},
  };
  beacon::cli::add_common_options(options);
  return options;
}

}  // namespace

int cmd_connect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  constexpr const char* kSynopsis = "beacon_cli connect --provider <id> --seeker <id> [options]";
  auto options = pair_options();
  options.push_back({"--provider-score", true, "Provider score shown when connecting (0-100)",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.provider_score = parse_score(v, 100.0);
                       return c.provider_score.has_value();
                     }});
  options.push_back({"--seeker-score", true, "Seeker score shown when connecting (0-100)",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.seeker_score = parse_score(v, 100.0);
                       return c.seeker_score.has_value();
                     }});
  options.push_back({"--bilateral-score", true, "Bilateral score shown when connecting (0-100)",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.bilateral_score = parse_score(v, 100.0);
                       return c.bilateral_score.has_value();
                     }});
  options.push_back({"--goal-alignment", true, "Goal alignment shown when connecting (0-1)",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.goal_alignment = parse_score(v, 1.0);
                       return c.goal_alignment.has_value();
                     }});
  options.push_back({"--goal-weight", true, "Goal weight used when the pair is rescored",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.goal_weight = beacon::cli::parse_weight(v);
                       return c.goal_weight.has_value();
                     }});

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

  const int shown_count = static_cast<int>(config.provider_score.has_value()) +
                          static_cast<int>(config.seeker_score.has_value()) +
                          static_cast<int>(config.bilateral_score.has_value());
  if (shown_count != 0 && shown_count != 3) {
    std::cerr << "Error: --provider-score, --seeker-score and --bilateral-score go together\n";
    return 2;
  }
  if (config.goal_alignment.has_value() && shown_count == 0) {
    std::cerr << "Error: --goal-alignment needs the shown scores\n";
    return 2;
  }

  beacon::app::ConnectRequest req;
  req.provider_id = beacon::core::ProviderId{config.provider_id};
  req.seeker_id = beacon::core::SeekerId{config.seeker_id};
  req.goal_weight = config.goal_weight;
  if (shown_count == 3) {
    req.shown = beacon::app::ShownScores{
        .provider_score = *config.provider_score,
        .seeker_score = *config.seeker_score,
        .bilateral_score = *config.bilateral_score,
        .goal_alignment = config.goal_alignment,
    };
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
  return run_connect(req, workspace.value()->services(), stack.value()->engine(), id_gen, clock);
}

int cmd_respond(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  constexpr const char* kSynopsis =
      "beacon_cli respond --provider <id> --seeker <id> --as provider|seeker "
      "--response accepted|declined [options]";
  auto options = pair_options();
  options.push_back({"--as", true, "Responding party (provider|seeker)",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.responder = beacon::domain::parse_party(v);
                       return c.responder.has_value();
                     }});
  options.push_back({"--response", true, "Decision (accepted|declined)",
                     [](ConnectCliConfig& c, const std::string& v) {
                       c.response = beacon::domain::parse_connection_response(v);
                       return c.response.has_value();
                     }});

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
  if (config.provider_id.empty() || config.seeker_id.empty() || !config.responder.has_value() ||
      !config.response.has_value()) {
    std::cerr << "Error: --provider, --seeker, --as and --response are required\n";
    return 2;
  }

  auto workspace = beacon::cli::Workspace::open(config.store);
  if (!workspace.has_value()) {
    std::cerr << "Error: " << workspace.error() << "\n";
    return 1;
  }

  beacon::core::SystemIdGenerator id_gen;
  beacon::core::SystemClock clock;
  return run_respond(beacon::core::ProviderId{config.provider_id},
                     beacon::core::SeekerId{config.seeker_id}, *config.responder, *config.response,
                     workspace.value()->services(), id_gen, clock);
}
