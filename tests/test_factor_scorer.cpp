#include "beacon/matching/factor_scorer.h"
#include "beacon/matching/presets.h"

#include "fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace beacon;
using Catch::Matchers::WithinAbs;
using domain::FactorId;

TEST_CASE("score_experience_gap curve", "[factors]") {
  CHECK(matching::score_experience_gap(-1.0) == 0.0);
  CHECK(matching::score_experience_gap(0.0) == 0.0);
  CHECK_THAT(matching::score_experience_gap(1.5), WithinAbs(0.5, 1e-9));
  CHECK(matching::score_experience_gap(3.0) == 1.0);
  CHECK(matching::score_experience_gap(7.0) == 1.0);
  CHECK_THAT(matching::score_experience_gap(10.0), WithinAbs(1.0 / 1.3, 1e-9));
  CHECK_THAT(matching::score_experience_gap(17.0), WithinAbs(0.5, 1e-9));
}

TEST_CASE("score_tier_distance", "[factors]") {
  CHECK(matching::score_tier_distance(2, 2) == 1.0);
  CHECK_THAT(matching::score_tier_distance(1, 3), WithinAbs(1.0 / 3.0, 1e-9));
  CHECK(matching::score_tier_distance(1, 4) == 0.0);
  CHECK(matching::score_tier_distance(4, 1) == 0.0);
}

TEST_CASE("FactorScorer computes base factors", "[factors]") {
  const auto& tables = matching::default_scoring_tables();
  const matching::ProfileNormalizer normalizer(tables);
  const matching::FactorScorer scorer(tables);

  auto provider = testing::make_provider();
  auto seeker = testing::make_seeker();

  const auto run = [&]() {
    return scorer.score(provider, normalizer.normalize(provider), seeker,
                        normalizer.normalize(seeker));
  };

  SECTION("reference pair") {
    const auto factors = run();
    CHECK(factors.at(FactorId::kSharedInstitution) == 0.0);
    CHECK_THAT(factors.at(FactorId::kInstitutionTier), WithinAbs(2.0 / 3.0, 1e-9));
    CHECK(factors.at(FactorId::kIndustryAlignment) == 1.0);
    CHECK_THAT(factors.at(FactorId::kHelpTypeMatch), WithinAbs(0.5, 1e-9));
    CHECK(factors.at(FactorId::kLocationProximity) == 0.5);
    CHECK(factors.at(FactorId::kExperienceGap) == 1.0);
    CHECK_FALSE(factors.contains(FactorId::kGpa));
    CHECK_FALSE(factors.contains(FactorId::kGoalAlignment));
  }

  SECTION("gpa appears only when the provider ranks it") {
    provider.preferences.gpa = 3;
    const auto factors = run();
    REQUIRE(factors.contains(FactorId::kGpa));
    CHECK_THAT(factors.at(FactorId::kGpa), WithinAbs(0.9, 1e-9));

    seeker.gpa = 4.3;
    CHECK(run().at(FactorId::kGpa) == 1.0);

    seeker.gpa.reset();
    CHECK(run().at(FactorId::kGpa) == 0.0);
  }

  SECTION("shared institution") {
    seeker.past_positions[1].organization = "Stanford University";
    const auto factors = run();
    CHECK(factors.at(FactorId::kSharedInstitution) == 1.0);
    CHECK(factors.at(FactorId::kInstitutionTier) == 1.0);
  }

  SECTION("empty industries never align") {
    provider.current_industry.clear();
    seeker.current_industry.clear();
    CHECK(run().at(FactorId::kIndustryAlignment) == 0.0);
  }

  SECTION("duplicate needs count once") {
    seeker.help_needed = {"Resume Review", "Resume Review"};
    CHECK(run().at(FactorId::kHelpTypeMatch) == 1.0);
  }
}
