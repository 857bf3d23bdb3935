#include "beacon/matching/eligibility.h"
#include "beacon/matching/presets.h"

#include "fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace beacon;

namespace {

matching::EligibilityResult check(const domain::Provider& provider, const domain::Seeker& seeker) {
  const matching::ProfileNormalizer normalizer(matching::default_scoring_tables());
  return matching::check_eligibility(provider, normalizer.normalize(provider), seeker,
                                     normalizer.normalize(seeker));
}

}  // namespace

TEST_CASE("count_help_overlap counts distinct shared tags", "[eligibility]") {
  CHECK(matching::count_help_overlap({"A", "B", "C"}, {"B", "C", "D"}) == 2);
  CHECK(matching::count_help_overlap({"A", "A"}, {"A", "A"}) == 1);
  CHECK(matching::count_help_overlap({}, {"A"}) == 0);
  CHECK(matching::count_help_overlap({"a"}, {"A"}) == 0);
}

TEST_CASE("check_eligibility gates", "[eligibility]") {
  const auto provider = testing::make_provider();

  SECTION("overlap and a positive gap pass") {
    const auto result = check(provider, testing::make_seeker());
    CHECK(result.eligible);
    CHECK_FALSE(result.reason.has_value());
  }

  SECTION("no shared help type fails first") {
    domain::Seeker seeker = testing::make_seeker();
    seeker.help_needed = {"Networking"};
    seeker.past_positions = {{"Director", "Acme", "20 years", false, 0}};
    const auto result = check(provider, seeker);
    CHECK_FALSE(result.eligible);
    REQUIRE(result.reason.has_value());
    CHECK(*result.reason == matching::kReasonNoHelpOverlap);
  }

  SECTION("equal experience fails the gap gate") {
    domain::Seeker seeker = testing::make_seeker();
    seeker.past_positions = {{"Engineer", "Acme", "8 years", false, 0}};
    const auto result = check(provider, seeker);
    CHECK_FALSE(result.eligible);
    REQUIRE(result.reason.has_value());
    CHECK(*result.reason == matching::kReasonExperienceGap);
  }

  SECTION("empty help lists are never eligible") {
    domain::Seeker seeker = testing::make_seeker();
    seeker.help_needed.clear();
    CHECK_FALSE(check(provider, seeker).eligible);
  }
}
