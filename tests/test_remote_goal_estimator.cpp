#include "beacon/goals/remote_goal_estimator.h"
#include "beacon/matching/presets.h"

#include "fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <atomic>
#include <utility>
#include <vector>

using namespace beacon;
using Catch::Matchers::WithinAbs;
using goals::ReasoningError;
using goals::ReasoningErrorKind;

namespace {

using Reply = core::Result<std::string, ReasoningError>;

// Replays a fixed script of replies; the last one repeats.
class ScriptedReasoningClient final : public goals::IReasoningClient {
 public:
  explicit ScriptedReasoningClient(std::vector<Reply> script) : script_(std::move(script)) {}

  Reply complete(const std::string& prompt) override {
    last_prompt_ = prompt;
    const auto index = calls_.fetch_add(1);
    return index < script_.size() ? script_[index] : script_.back();
  }

  [[nodiscard]] std::size_t calls() const { return calls_.load(); }
  [[nodiscard]] const std::string& last_prompt() const { return last_prompt_; }

 private:
  std::vector<Reply> script_;
  std::atomic<std::size_t> calls_{0};
  std::string last_prompt_;
};

Reply ok(std::string text) {
  return Reply::ok(std::move(text));
}

Reply fail(ReasoningErrorKind kind, int status = 0) {
  return Reply::err(ReasoningError{kind, "scripted", status});
}

goals::RetryPolicy no_wait(int attempts) {
  return goals::RetryPolicy{attempts, std::chrono::milliseconds{0}};
}

}  // namespace

TEST_CASE("RemoteGoalEstimator returns the parsed judgment", "[goals][remote]") {
  ScriptedReasoningClient client({ok(R"({"score": 0.9, "reasoning": "Same path"})")});
  goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(2));

  const auto result =
      estimator.estimate(testing::make_provider(), testing::make_seeker(), nullptr);
  REQUIRE(result.has_value());
  CHECK_THAT(result.value().score, WithinAbs(0.9, 1e-12));
  CHECK(result.value().reasoning == "Same path");
  CHECK(result.value().source == domain::GoalSource::kRemote);
  CHECK_FALSE(result.value().fallback_cause.has_value());
  CHECK(client.calls() == 1);
  CHECK(client.last_prompt().find("Goal: Become a product manager") != std::string::npos);
}

TEST_CASE("RemoteGoalEstimator retries transient failures", "[goals][remote]") {
  const auto provider = testing::make_provider();
  const auto seeker = testing::make_seeker();

  SECTION("timeout then success") {
    ScriptedReasoningClient client({fail(ReasoningErrorKind::kTimeout),
                                    ok(R"({"score": 0.4, "reasoning": "ok"})")});
    goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(2));
    const auto result = estimator.estimate(provider, seeker, nullptr);
    REQUIRE(result.has_value());
    CHECK_THAT(result.value().score, WithinAbs(0.4, 1e-12));
    CHECK(client.calls() == 2);
  }

  SECTION("attempts are bounded") {
    ScriptedReasoningClient client({fail(ReasoningErrorKind::kHttpStatus, 503)});
    goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(3));
    const auto result = estimator.estimate(provider, seeker, nullptr);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ReasoningErrorKind::kHttpStatus);
    CHECK(result.error().http_status == 503);
    CHECK(client.calls() == 3);
  }

  SECTION("a zero attempt policy still tries once") {
    ScriptedReasoningClient client({fail(ReasoningErrorKind::kTransport)});
    goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(0));
    CHECK_FALSE(estimator.estimate(provider, seeker, nullptr).has_value());
    CHECK(client.calls() == 1);
  }
}

TEST_CASE("RemoteGoalEstimator does not retry permanent failures", "[goals][remote]") {
  const auto provider = testing::make_provider();
  const auto seeker = testing::make_seeker();

  SECTION("client error status") {
    ScriptedReasoningClient client({fail(ReasoningErrorKind::kHttpStatus, 401)});
    goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(3));
    CHECK_FALSE(estimator.estimate(provider, seeker, nullptr).has_value());
    CHECK(client.calls() == 1);
  }

  SECTION("malformed reply") {
    ScriptedReasoningClient client(
        {ok("I think they are a great match!"), ok(R"({"score": 0.5, "reasoning": "x"})")});
    goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(3));
    const auto result = estimator.estimate(provider, seeker, nullptr);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ReasoningErrorKind::kMalformedResponse);
    CHECK(client.calls() == 1);
  }

  SECTION("out of range score") {
    ScriptedReasoningClient client({ok(R"({"score": 7, "reasoning": "x"})")});
    goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(3));
    const auto result = estimator.estimate(provider, seeker, nullptr);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ReasoningErrorKind::kOutOfRange);
  }
}

TEST_CASE("RemoteGoalEstimator honours cancellation", "[goals][remote][cancel]") {
  ScriptedReasoningClient client({ok(R"({"score": 0.5, "reasoning": "x"})")});
  goals::RemoteGoalEstimator estimator(client, matching::default_scoring_tables(), no_wait(2));

  core::CancellationToken cancel;
  cancel.cancel();
  const auto result = estimator.estimate(testing::make_provider(), testing::make_seeker(), &cancel);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ReasoningErrorKind::kCancelled);
  CHECK(client.calls() == 0);
}
