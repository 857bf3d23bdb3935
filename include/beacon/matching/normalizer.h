#pragma once

#include "beacon/domain/profile.h"
#include "beacon/matching/scorer.h"

#include <optional>
#include <string>
#include <string_view>

namespace beacon::matching {

// Location is a "City, Region" string split into its two components.
// Both are nullopt unless the input had exactly one comma.
struct Location {
  std::optional<std::string> city;
  std::optional<std::string> region;

  [[nodiscard]] bool known() const { return city.has_value() && region.has_value(); }
};

// NormalizedProfile holds the derived values scoring needs from a profile.
struct NormalizedProfile {
  std::optional<std::string> alma_mater;
  double total_experience{0.0};  // years, rounded to 2 decimals
  Location location;
};

// parse_duration_years reads free-text durations: the first integer is years
// when the text mentions "year", twelfths of a year for "month", else 0.
[[nodiscard]] double parse_duration_years(std::string_view duration);

[[nodiscard]] Location parse_location(std::string_view location);

// compare_locations: 1.0 same city and region, 0.5 same region, 0.0 otherwise
// (including when either side is unknown).
[[nodiscard]] double compare_locations(const Location& a, const Location& b);

class ProfileNormalizer {
 public:
  explicit ProfileNormalizer(const ScoringTables& tables);

  // An entry is a degree if flagged as education or its title starts with a
  // degree prefix.
  [[nodiscard]] bool is_education(const domain::PastPosition& position) const;

  // First degree entry's institution (none if blank). The explicit fallback
  // applies only when there is no degree entry.
  [[nodiscard]] std::optional<std::string> alma_mater(
      const domain::Profile& profile, const std::optional<std::string>& fallback) const;

  // Sum of non-degree durations, rounded to 2 decimals.
  [[nodiscard]] double total_experience(const domain::Profile& profile) const;

  [[nodiscard]] NormalizedProfile normalize(const domain::Provider& provider) const;
  [[nodiscard]] NormalizedProfile normalize(const domain::Seeker& seeker) const;

 private:
  const ScoringTables& tables_;
};

}  // namespace beacon::matching
