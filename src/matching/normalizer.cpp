#include "beacon/matching/normalizer.h"

#include "beacon/core/normalization.h"

namespace beacon::matching {

double parse_duration_years(std::string_view duration) {
  const std::string text = core::normalize_ascii_lower(core::trim(duration));
  if (text.empty()) {
    return 0.0;
  }

  const auto number = core::first_integer(text);
  if (!number.has_value()) {
    return 0.0;
  }

  if (text.find("year") != std::string::npos) {
    return static_cast<double>(*number);
  }
  if (text.find("month") != std::string::npos) {
    return static_cast<double>(*number) / 12.0;
  }
  return 0.0;
}

Location parse_location(std::string_view location) {
  const auto comma = location.find(',');
  if (comma == std::string_view::npos || location.find(',', comma + 1) != std::string_view::npos) {
    return {};
  }

  return Location{core::trim(location.substr(0, comma)), core::trim(location.substr(comma + 1))};
}

double compare_locations(const Location& a, const Location& b) {
  if (!a.known() || !b.known()) {
    return 0.0;
  }
  if (a.region != b.region) {
    return 0.0;
  }
  return a.city == b.city ? 1.0 : 0.5;
}

ProfileNormalizer::ProfileNormalizer(const ScoringTables& tables) : tables_(tables) {}

bool ProfileNormalizer::is_education(const domain::PastPosition& position) const {
  if (position.is_education) {
    return true;
  }
  for (const auto& prefix : tables_.degree_prefixes) {
    if (position.title.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> ProfileNormalizer::alma_mater(
    const domain::Profile& profile, const std::optional<std::string>& fallback) const {
  // The first education entry decides, even when its organization is blank.
  for (const auto& position : profile.past_positions) {
    if (is_education(position)) {
      if (position.organization.empty()) {
        return std::nullopt;
      }
      return position.organization;
    }
  }
  if (fallback.has_value() && !fallback->empty()) {
    return fallback;
  }
  return std::nullopt;
}

double ProfileNormalizer::total_experience(const domain::Profile& profile) const {
  double total = 0.0;
  for (const auto& position : profile.past_positions) {
    if (!is_education(position)) {
      total += parse_duration_years(position.duration);
    }
  }
  return core::round_to(total, 2);
}

NormalizedProfile ProfileNormalizer::normalize(const domain::Provider& provider) const {
  return NormalizedProfile{
      .alma_mater = alma_mater(provider, provider.alma_mater),
      .total_experience = total_experience(provider),
      .location = parse_location(provider.location),
  };
}

NormalizedProfile ProfileNormalizer::normalize(const domain::Seeker& seeker) const {
  return NormalizedProfile{
      .alma_mater = alma_mater(seeker, std::nullopt),
      .total_experience = total_experience(seeker),
      .location = parse_location(seeker.location),
  };
}

}  // namespace beacon::matching
