#include "beacon/matching/normalizer.h"
#include "beacon/matching/presets.h"

#include "fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace beacon;
using Catch::Matchers::WithinAbs;

TEST_CASE("parse_duration_years reads years and months", "[normalizer]") {
  CHECK_THAT(matching::parse_duration_years("3 years"), WithinAbs(3.0, 1e-9));
  CHECK_THAT(matching::parse_duration_years("1 Year"), WithinAbs(1.0, 1e-9));
  CHECK_THAT(matching::parse_duration_years("18 months"), WithinAbs(1.5, 1e-9));
  CHECK_THAT(matching::parse_duration_years("about 6 Months"), WithinAbs(0.5, 1e-9));

  SECTION("unrecognized text is zero") {
    CHECK(matching::parse_duration_years("") == 0.0);
    CHECK(matching::parse_duration_years("a long time") == 0.0);
    CHECK(matching::parse_duration_years("5") == 0.0);
    CHECK(matching::parse_duration_years("years") == 0.0);
  }
}

TEST_CASE("parse_location splits on exactly one comma", "[normalizer]") {
  SECTION("city and region are trimmed") {
    const auto loc = matching::parse_location("  New York ,  NY ");
    REQUIRE(loc.known());
    CHECK(*loc.city == "New York");
    CHECK(*loc.region == "NY");
  }

  SECTION("no comma or several commas are unknown") {
    CHECK_FALSE(matching::parse_location("Remote").known());
    CHECK_FALSE(matching::parse_location("Austin, TX, USA").known());
    CHECK_FALSE(matching::parse_location("").known());
  }
}

TEST_CASE("compare_locations", "[normalizer]") {
  const auto sf = matching::parse_location("San Francisco, CA");
  const auto oakland = matching::parse_location("Oakland, CA");
  const auto austin = matching::parse_location("Austin, TX");
  const auto unknown = matching::parse_location("Remote");

  CHECK(matching::compare_locations(sf, sf) == 1.0);
  CHECK(matching::compare_locations(sf, oakland) == 0.5);
  CHECK(matching::compare_locations(sf, austin) == 0.0);

  SECTION("unknown on either side scores zero") {
    CHECK(matching::compare_locations(sf, unknown) == 0.0);
    CHECK(matching::compare_locations(unknown, sf) == 0.0);
    CHECK(matching::compare_locations(unknown, unknown) == 0.0);
  }
}

TEST_CASE("ProfileNormalizer derives alma mater and experience", "[normalizer]") {
  const matching::ProfileNormalizer normalizer(matching::default_scoring_tables());

  SECTION("degree entries are excluded from experience") {
    const auto provider = testing::make_provider();
    const auto norm = normalizer.normalize(provider);
    REQUIRE(norm.alma_mater.has_value());
    CHECK(*norm.alma_mater == "Stanford University");
    CHECK_THAT(norm.total_experience, WithinAbs(8.0, 1e-9));
    CHECK(norm.location.known());
  }

  SECTION("is_education flag marks a degree without a prefix") {
    domain::Seeker seeker = testing::make_seeker();
    seeker.past_positions = {
        {"Computer Science", "Georgia Tech", "4 years", true, 0},
        {"Intern", "Acme", "6 months", false, 1},
    };
    const auto norm = normalizer.normalize(seeker);
    REQUIRE(norm.alma_mater.has_value());
    CHECK(*norm.alma_mater == "Georgia Tech");
    CHECK_THAT(norm.total_experience, WithinAbs(0.5, 1e-9));
  }

  SECTION("prefix match is case-sensitive") {
    const domain::PastPosition lower{"bs economics", "Somewhere", "4 years", false, 0};
    const domain::PastPosition mba{"MBA", "Duke University", "2 years", false, 0};
    CHECK_FALSE(normalizer.is_education(lower));
    CHECK(normalizer.is_education(mba));
  }

  SECTION("first degree entry decides even with a blank school") {
    domain::Provider provider = testing::make_provider();
    provider.past_positions = {
        {"MBA", "", "2 years", false, 0},
        {"BS Computer Science", "Stanford University", "4 years", false, 1},
    };
    provider.alma_mater = "Rice University";
    const auto norm = normalizer.normalize(provider);
    CHECK_FALSE(norm.alma_mater.has_value());
  }

  SECTION("provider falls back to the declared university") {
    domain::Provider provider = testing::make_provider();
    provider.past_positions = {{"Engineer", "Meta", "3 years", false, 0}};
    provider.alma_mater = "Rice University";
    const auto norm = normalizer.normalize(provider);
    REQUIRE(norm.alma_mater.has_value());
    CHECK(*norm.alma_mater == "Rice University");
  }

  SECTION("no degree and no fallback leaves alma mater unknown") {
    domain::Seeker seeker = testing::make_seeker();
    seeker.past_positions = {{"Analyst", "Acme", "2 years", false, 0}};
    CHECK_FALSE(normalizer.normalize(seeker).alma_mater.has_value());
  }

  SECTION("experience is rounded to two decimals") {
    domain::Seeker seeker = testing::make_seeker();
    seeker.past_positions = {{"Analyst", "Acme", "7 months", false, 0}};
    CHECK_THAT(normalizer.total_experience(seeker), WithinAbs(0.58, 1e-9));
  }
}

TEST_CASE("institution tiers", "[normalizer][tiers]") {
  const auto& tables = matching::default_scoring_tables();
  CHECK(tables.tier_of("MIT") == 1);
  CHECK(tables.tier_of("UCLA") == 2);
  CHECK(tables.tier_of("Purdue University") == 3);
  CHECK(tables.tier_of("Springfield Community College") == 4);
  CHECK(tables.tier_of("mit") == 4);
}
