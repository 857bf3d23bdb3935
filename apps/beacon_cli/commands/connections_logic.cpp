#include "connections_logic.h"

#include "../report.h"

#include "beacon/app/app_service.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

nlohmann::json summaries_to_json(const std::vector<beacon::app::ConnectionSummary>& summaries) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& summary : summaries) {
    const auto& c = summary.connection;
    nlohmann::json item;
    item["provider_id"] = c.provider_id.value;
    item["seeker_id"] = c.seeker_id.value;
    item["status"] = std::string(beacon::domain::to_string(c.status));
    item["counterpart"] = {
        {"id", summary.counterpart_id},
        {"name", summary.counterpart_name},
        {"role", summary.counterpart_role},
        {"employer", summary.counterpart_employer},
        {"industry", summary.counterpart_industry},
        {"location", summary.counterpart_location},
    };
    item["scores"] = {
        {"provider_score", c.provider_score},
        {"seeker_score", c.seeker_score},
        {"bilateral_score", c.bilateral_score},
    };
    item["goal_alignment"] =
        c.goal_alignment.has_value() ? nlohmann::json(*c.goal_alignment) : nullptr;
    item["created_at"] = c.created_at;
    out.push_back(std::move(item));
  }
  return out;
}

}  // namespace

int run_sent_connections(const beacon::core::ProviderId& provider_id,
                         beacon::core::Services& services) {
  auto listed = beacon::app::list_sent_connections(provider_id, services);
  if (!listed.has_value()) {
    return beacon::cli::report_app_error(listed.error());
  }
  std::cout << summaries_to_json(listed.value()).dump(2) << "\n";
  return 0;
}

int run_received_connections(const beacon::core::SeekerId& seeker_id,
                             beacon::core::Services& services) {
  auto listed = beacon::app::list_received_connections(seeker_id, services);
  if (!listed.has_value()) {
    return beacon::cli::report_app_error(listed.error());
  }
  std::cout << summaries_to_json(listed.value()).dump(2) << "\n";
  return 0;
}
