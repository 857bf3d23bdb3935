#include "feed_logic.h"

#include "../report.h"

#include "beacon/domain/profile_json.h"

#include <nlohmann/json.hpp>

#include <iostream>

int run_feed_command(const beacon::app::FeedRequest& req, beacon::core::Services& services,
                     const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
                     beacon::core::IClock& clock, const beacon::core::CancellationToken* cancel) {
  auto response = beacon::app::run_feed(req, services, engine, id_gen, clock, cancel);
  if (!response.has_value()) {
    return beacon::cli::report_app_error(response.error());
  }

  const auto& feed = response.value();
  nlohmann::json out;
  out["trace_id"] = feed.trace_id;
  out["provider_id"] = req.provider_id.value;
  out["stats"] = {
      {"considered", feed.result.considered},
      {"excluded", feed.result.excluded},
      {"ineligible", feed.result.ineligible},
      {"below_floor", feed.result.below_floor},
      {"goal_fallbacks", feed.result.goal_fallbacks.size()},
  };
  out["feed"] = nlohmann::json::array();
  for (const auto& item : feed.result.items) {
    out["feed"].push_back(beacon::domain::to_json(item));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
