#include "filter_logic.h"

#include "../report.h"

#include "beacon/domain/profile_json.h"

#include <nlohmann/json.hpp>

#include <iostream>

int run_filter_command(const beacon::app::ThresholdRequest& req, beacon::core::Services& services,
                       const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
                       beacon::core::IClock& clock) {
  auto response = beacon::app::run_threshold_filter(req, services, engine, id_gen, clock);
  if (!response.has_value()) {
    return beacon::cli::report_app_error(response.error());
  }

  const auto& filtered = response.value();
  nlohmann::json out;
  out["trace_id"] = filtered.trace_id;
  out["provider_id"] = req.provider_id.value;
  out["thresholds"] = {
      {"min_provider", req.thresholds.min_provider},
      {"min_seeker", req.thresholds.min_seeker},
      {"min_bilateral", req.thresholds.min_bilateral},
  };
  out["candidates"] = nlohmann::json::array();
  for (const auto& candidate : filtered.candidates) {
    out["candidates"].push_back(beacon::domain::to_json(candidate));
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
