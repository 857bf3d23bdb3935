#include "beacon/feed/feed_generator.h"

#include "fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace beacon;
using Catch::Matchers::WithinAbs;

TEST_CASE("filter_by_thresholds applies three floors", "[feed][filter]") {
  const matching::BilateralScorer scorer;
  goals::FallbackGoalEstimator goal_estimator(nullptr);
  const feed::FeedGenerator generator(scorer, goal_estimator);
  const auto provider = testing::make_provider();

  auto finance = testing::make_seeker("s-b");
  finance.current_industry = "Finance";
  auto unrelated = testing::make_seeker("s-c");
  unrelated.help_needed = {"Networking"};
  const std::vector<domain::Seeker> candidates{testing::make_seeker("s-z"), finance, unrelated,
                                               testing::make_seeker("s-a")};

  SECTION("default floors") {
    const auto qualified = generator.filter_by_thresholds(provider, candidates, {});
    REQUIRE(qualified.size() == 2);
    CHECK(qualified[0].seeker.seeker_id.value == "s-a");
    CHECK(qualified[1].seeker.seeker_id.value == "s-z");
    CHECK_THAT(qualified[0].score.bilateral_score, WithinAbs(72.7, 1e-9));
    CHECK(qualified[0].acceptance_probability == 0.50);
  }

  SECTION("each floor is independent") {
    CHECK(generator.filter_by_thresholds(provider, candidates, {75.1, 0.0, 0.0}).empty());
    CHECK(generator.filter_by_thresholds(provider, candidates, {0.0, 69.4, 0.0}).empty());
    CHECK(generator.filter_by_thresholds(provider, candidates, {0.0, 0.0, 72.8}).empty());
  }

  SECTION("zero floors keep every eligible pair") {
    const auto qualified = generator.filter_by_thresholds(provider, candidates, {0.0, 0.0, 0.0});
    CHECK(qualified.size() == 3);
  }

  SECTION("the goal estimator is never consulted") {
    const auto qualified = generator.filter_by_thresholds(provider, candidates, {});
    CHECK_THAT(qualified[0].score.provider_score, WithinAbs(75.0, 1e-9));
  }
}
