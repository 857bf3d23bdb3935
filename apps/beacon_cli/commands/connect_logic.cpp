#include "connect_logic.h"

#include "../report.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace {

nlohmann::json connection_to_json(const beacon::app::ConnectionOutcome& outcome) {
  const auto& c = outcome.connection;
  nlohmann::json out;
  out["trace_id"] = outcome.trace_id;
  out["provider_id"] = c.provider_id.value;
  out["seeker_id"] = c.seeker_id.value;
  out["status"] = std::string(beacon::domain::to_string(c.status));
  out["scores"] = {
      {"provider_score", c.provider_score},
      {"seeker_score", c.seeker_score},
      {"bilateral_score", c.bilateral_score},
  };
  out["goal_alignment"] =
      c.goal_alignment.has_value() ? nlohmann::json(*c.goal_alignment) : nullptr;
  out["created_at"] = c.created_at;
  out["provider_decided_at"] =
      c.provider_decided_at.has_value() ? nlohmann::json(*c.provider_decided_at) : nullptr;
  out["seeker_decided_at"] =
      c.seeker_decided_at.has_value() ? nlohmann::json(*c.seeker_decided_at) : nullptr;
  return out;
}

}  // namespace

int run_connect(const beacon::app::ConnectRequest& req, beacon::core::Services& services,
                const beacon::app::Engine& engine, beacon::core::IIdGenerator& id_gen,
                beacon::core::IClock& clock) {
  auto outcome = beacon::app::request_connection(req, services, engine, id_gen, clock);
  if (!outcome.has_value()) {
    return beacon::cli::report_app_error(outcome.error());
  }
  std::cout << connection_to_json(outcome.value()).dump(2) << "\n";
  return 0;
}

int run_respond(const beacon::core::ProviderId& provider_id,
                const beacon::core::SeekerId& seeker_id, beacon::domain::Party responder,
                beacon::domain::ConnectionResponse response, beacon::core::Services& services,
                beacon::core::IIdGenerator& id_gen, beacon::core::IClock& clock) {
  auto outcome = beacon::app::respond_to_connection(provider_id, seeker_id, responder, response,
                                                    services, id_gen, clock);
  if (!outcome.has_value()) {
    return beacon::cli::report_app_error(outcome.error());
  }
  std::cout << connection_to_json(outcome.value()).dump(2) << "\n";
  return 0;
}
