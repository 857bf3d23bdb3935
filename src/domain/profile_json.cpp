#include "beacon/domain/profile_json.h"

#include "beacon/core/normalization.h"

#include <cmath>
#include <fstream>

namespace beacon::domain {

namespace {

constexpr const char* kNoPreference = "don't care";

// Missing and null string fields read as empty.
std::string string_field(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return "";
  }
  return j[key].get<std::string>();
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return {};
  }
  return j[key].get<std::vector<std::string>>();
}

// Rank 0, null and "Don't care" mean "no preference". Any other value must be
// a whole number in [1, 5]; the range is checked before converting to int.
core::Result<PreferenceRank, std::string> parse_rank(const nlohmann::json& value) {
  using R = core::Result<PreferenceRank, std::string>;

  if (value.is_null()) {
    return R::ok(std::nullopt);
  }

  double rank = 0.0;
  if (value.is_number()) {
    rank = value.get<double>();
  } else if (value.is_string()) {
    const std::string text = core::normalize_ascii_lower(core::trim(value.get<std::string>()));
    if (text.empty() || text == kNoPreference) {
      return R::ok(std::nullopt);
    }
    const auto parsed = core::first_integer(text);
    if (!parsed.has_value() || text.find_first_not_of("0123456789") != std::string::npos) {
      return R::err("unrecognized preference value: " + value.get<std::string>());
    }
    rank = *parsed;
  } else {
    return R::err("preference must be a number, a string or null");
  }

  if (rank == 0.0) {
    return R::ok(std::nullopt);
  }
  if (rank < kMinPreferenceRank || rank > kMaxPreferenceRank || rank != std::floor(rank)) {
    return R::err("rank must be a whole number in [1, 5], got " + value.dump());
  }
  return R::ok(static_cast<int>(rank));
}

core::Result<bool, std::string> read_profile(const nlohmann::json& j, Profile& profile) {
  profile.name = string_field(j, "name");
  profile.current_role = string_field(j, "current_position");
  profile.current_employer = string_field(j, "current_company");
  profile.current_industry = string_field(j, "current_industry");
  profile.location = string_field(j, "location");

  if (j.contains("past_positions") && !j["past_positions"].is_null()) {
    if (!j["past_positions"].is_array()) {
      return core::Result<bool, std::string>::err("past_positions must be an array");
    }
    int index = 0;
    for (const auto& p : j["past_positions"]) {
      PastPosition position;
      position.title = string_field(p, "title");
      position.organization = string_field(p, "company");
      position.duration = string_field(p, "duration");
      position.is_education = p.contains("is_education") && p["is_education"].is_boolean() &&
                              p["is_education"].get<bool>();
      position.order = p.contains("sort_order") && p["sort_order"].is_number_integer()
                           ? p["sort_order"].get<int>()
                           : index;
      profile.past_positions.push_back(std::move(position));
      ++index;
    }
    sort_positions(profile.past_positions);
  }

  return core::Result<bool, std::string>::ok(true);
}

nlohmann::json profile_fields_to_json(const Profile& profile) {
  nlohmann::json j;
  j["name"] = profile.name;
  j["current_position"] = profile.current_role;
  j["current_company"] = profile.current_employer;
  j["current_industry"] = profile.current_industry;
  j["location"] = profile.location;

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : profile.past_positions) {
    positions.push_back({{"title", p.title},
                         {"company", p.organization},
                         {"duration", p.duration},
                         {"is_education", p.is_education},
                         {"sort_order", p.order}});
  }
  j["past_positions"] = positions;
  return j;
}

nlohmann::json rank_to_json(const PreferenceRank& rank) {
  if (!rank.has_value()) {
    return "Don't care";
  }
  return *rank;
}

core::Result<std::vector<nlohmann::json>, std::string> read_array_file(const std::string& path) {
  using R = core::Result<std::vector<nlohmann::json>, std::string>;

  std::ifstream in(path);
  if (!in) {
    return R::err("cannot open " + path);
  }

  try {
    nlohmann::json j = nlohmann::json::parse(in);
    if (!j.is_array()) {
      return R::err(path + ": expected a JSON array of profiles");
    }
    return R::ok(j.get<std::vector<nlohmann::json>>());
  } catch (const nlohmann::json::exception& e) {
    return R::err(path + ": " + e.what());
  }
}

}  // namespace

core::Result<Provider, std::string> provider_from_json(const nlohmann::json& j) {
  using R = core::Result<Provider, std::string>;

  if (!j.is_object()) {
    return R::err("provider record must be an object");
  }

  try {
    Provider provider;
    provider.provider_id = core::ProviderId{string_field(j, "id")};

    auto profile_result = read_profile(j, provider);
    if (!profile_result.has_value()) {
      return R::err(profile_result.error());
    }

    if (j.contains("what_i_can_help_with") && j["what_i_can_help_with"].is_object()) {
      const auto& help = j["what_i_can_help_with"];
      provider.help_offered = string_list(help, "tags");
      provider.help_details = string_field(help, "details");
    }

    const std::string university = string_field(j, "university");
    if (!university.empty()) {
      provider.alma_mater = university;
    }

    if (j.contains("preferences") && j["preferences"].is_object()) {
      const auto& prefs = j["preferences"];
      const std::pair<const char*, PreferenceRank*> fields[] = {
          {"location", &provider.preferences.location},
          {"uni", &provider.preferences.alma_mater},
          {"gpa", &provider.preferences.gpa},
          {"industry_alignment", &provider.preferences.industry},
          {"help_type", &provider.preferences.help_type},
          {"path_alignment", &provider.preferences.path_alignment},
      };
      for (const auto& [key, target] : fields) {
        if (!prefs.contains(key)) {
          continue;
        }
        auto rank = parse_rank(prefs[key]);
        if (!rank.has_value()) {
          return R::err(std::string("preferences.") + key + ": " + rank.error());
        }
        *target = rank.value();
      }
    }

    auto valid = provider.validate();
    if (!valid.has_value()) {
      return R::err(valid.error());
    }
    return R::ok(std::move(provider));
  } catch (const nlohmann::json::exception& e) {
    return R::err(std::string("malformed provider record: ") + e.what());
  }
}

core::Result<Seeker, std::string> seeker_from_json(const nlohmann::json& j) {
  using R = core::Result<Seeker, std::string>;

  if (!j.is_object()) {
    return R::err("seeker record must be an object");
  }

  try {
    Seeker seeker;
    seeker.seeker_id = core::SeekerId{string_field(j, "id")};

    auto profile_result = read_profile(j, seeker);
    if (!profile_result.has_value()) {
      return R::err(profile_result.error());
    }

    seeker.help_needed = string_list(j, "what_i_need_help_with");
    // A negative GPA is unusable and reads as absent, like a missing one.
    if (j.contains("gpa") && j["gpa"].is_number() && j["gpa"].get<double>() >= 0.0) {
      seeker.gpa = j["gpa"].get<double>();
    }
    seeker.goal = string_field(j, "goals");
    seeker.context = string_field(j, "more_info");

    auto valid = seeker.validate();
    if (!valid.has_value()) {
      return R::err(valid.error());
    }
    return R::ok(std::move(seeker));
  } catch (const nlohmann::json::exception& e) {
    return R::err(std::string("malformed seeker record: ") + e.what());
  }
}

nlohmann::json provider_to_json(const Provider& provider) {
  nlohmann::json j = profile_fields_to_json(provider);
  j["id"] = provider.provider_id.value;
  j["what_i_can_help_with"] = {{"tags", provider.help_offered},
                               {"details", provider.help_details}};
  if (provider.alma_mater.has_value()) {
    j["university"] = *provider.alma_mater;
  }
  j["preferences"] = {
      {"location", rank_to_json(provider.preferences.location)},
      {"uni", rank_to_json(provider.preferences.alma_mater)},
      {"gpa", rank_to_json(provider.preferences.gpa)},
      {"industry_alignment", rank_to_json(provider.preferences.industry)},
      {"help_type", rank_to_json(provider.preferences.help_type)},
      {"path_alignment", rank_to_json(provider.preferences.path_alignment)},
  };
  return j;
}

nlohmann::json seeker_to_json(const Seeker& seeker) {
  nlohmann::json j = profile_fields_to_json(seeker);
  j["id"] = seeker.seeker_id.value;
  j["what_i_need_help_with"] = seeker.help_needed;
  j["gpa"] = seeker.gpa.has_value() ? nlohmann::json(*seeker.gpa) : nlohmann::json(nullptr);
  j["goals"] = seeker.goal;
  j["more_info"] = seeker.context;
  return j;
}

nlohmann::json to_json(const PairScore& score) {
  nlohmann::json j;
  j["provider_score"] = score.provider_score;
  j["seeker_score"] = score.seeker_score;
  j["bilateral_score"] = score.bilateral_score;
  j["eligible"] = score.eligible;
  if (score.ineligibility_reason.has_value()) {
    j["reason"] = *score.ineligibility_reason;
  }
  return j;
}

nlohmann::json to_json(const GoalAlignment& goal) {
  nlohmann::json j;
  j["score"] = goal.score;
  j["reasoning"] = goal.reasoning;
  j["source"] = std::string(to_string(goal.source));
  if (goal.fallback_cause.has_value()) {
    j["fallback_cause"] = *goal.fallback_cause;
  }
  return j;
}

nlohmann::json to_json(const SeekerView& view) {
  nlohmann::json j;
  j["seeker_id"] = view.seeker_id.value;
  j["name"] = view.name;
  j["university"] = view.alma_mater;
  j["location"] = view.location;
  j["gpa"] = view.gpa.has_value() ? nlohmann::json(*view.gpa) : nlohmann::json(nullptr);
  j["current_position"] = view.current_role;
  j["current_company"] = view.current_employer;
  j["current_industry"] = view.current_industry;
  j["total_experience"] = view.total_experience;

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : view.recent_positions) {
    positions.push_back({{"title", p.title}, {"company", p.organization}, {"duration", p.duration}});
  }
  j["past_positions"] = positions;
  j["help_seeking"] = view.help_needed;
  j["goals"] = view.goal;
  j["more_info"] = view.context;
  return j;
}

nlohmann::json to_json(const FeedItem& item) {
  nlohmann::json j = to_json(item.seeker);
  j["scores"] = to_json(item.score);
  j["goal_alignment"] = to_json(item.goal);
  j["acceptance_probability"] = item.acceptance_probability;
  j["best_pick"] = item.best_pick;
  return j;
}

nlohmann::json to_json(const ScoredCandidate& candidate) {
  nlohmann::json j = to_json(candidate.seeker);
  j["scores"] = to_json(candidate.score);
  j["acceptance_probability"] = candidate.acceptance_probability;
  return j;
}

std::string describe(const RejectedRecord& rejected) {
  return rejected.file + "[" + std::to_string(rejected.index) + "]: " + rejected.reason;
}

core::Result<Dataset, std::string> load_dataset(const std::string& providers_path,
                                                const std::string& seekers_path) {
  using R = core::Result<Dataset, std::string>;

  auto providers_json = read_array_file(providers_path);
  if (!providers_json.has_value()) {
    return R::err(providers_json.error());
  }
  auto seekers_json = read_array_file(seekers_path);
  if (!seekers_json.has_value()) {
    return R::err(seekers_json.error());
  }

  Dataset dataset;
  std::size_t index = 0;
  for (const auto& record : providers_json.value()) {
    auto provider = provider_from_json(record);
    if (provider.has_value()) {
      dataset.providers.push_back(provider.value());
    } else {
      dataset.rejected.push_back({providers_path, index, provider.error()});
    }
    ++index;
  }

  index = 0;
  for (const auto& record : seekers_json.value()) {
    auto seeker = seeker_from_json(record);
    if (seeker.has_value()) {
      dataset.seekers.push_back(seeker.value());
    } else {
      dataset.rejected.push_back({seekers_path, index, seeker.error()});
    }
    ++index;
  }

  return R::ok(std::move(dataset));
}

}  // namespace beacon::domain
