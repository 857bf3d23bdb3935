#include "score_logic.h"

#include "../report.h"

#include "beacon/domain/profile_json.h"

#include <nlohmann/json.hpp>

#include <iostream>

int run_score(const beacon::app::ScoreRequest& req, beacon::core::Services& services,
              const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
              beacon::core::IClock& clock) {
  auto response = beacon::app::run_score_pair(req, services, engine, id_gen, clock);
  if (!response.has_value()) {
    return beacon::cli::report_app_error(response.error());
  }

  const auto& scored = response.value();
  nlohmann::json out;
  out["trace_id"] = scored.trace_id;
  out["provider_id"] = req.provider_id.value;
  out["seeker_id"] = req.seeker_id.value;
  out["scores"] = beacon::domain::to_json(scored.result.score);
  if (scored.result.goal.has_value()) {
    out["goal_alignment"] = beacon::domain::to_json(*scored.result.goal);
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
