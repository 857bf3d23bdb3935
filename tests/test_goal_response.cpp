#include "beacon/goals/goal_response.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace beacon;
using Catch::Matchers::WithinAbs;
using goals::ReasoningErrorKind;

TEST_CASE("extract_json_object", "[goals][response]") {
  CHECK(goals::extract_json_object(R"({"a": 1})") == R"({"a": 1})");
  CHECK(goals::extract_json_object(R"(Sure! {"a": 1} Hope that helps.)") == R"({"a": 1})");
  CHECK(goals::extract_json_object("```json\n{\"a\": 1}\n```") == R"({"a": 1})");
  CHECK(goals::extract_json_object("no object here").empty());
  CHECK(goals::extract_json_object("} backwards {").empty());
}

TEST_CASE("parse_goal_response accepts well-formed replies", "[goals][response]") {
  SECTION("plain object") {
    const auto result = goals::parse_goal_response(
        R"({"score": 0.75, "reasoning": "Made the same transition"})");
    REQUIRE(result.has_value());
    CHECK_THAT(result.value().score, WithinAbs(0.75, 1e-12));
    CHECK(result.value().reasoning == "Made the same transition");
  }

  SECTION("fenced object") {
    const auto result =
        goals::parse_goal_response("```json\n{\"score\": 1, \"reasoning\": \"ok\"}\n```");
    REQUIRE(result.has_value());
    CHECK(result.value().score == 1.0);
  }

  SECTION("rounding noise is clamped") {
    const auto result =
        goals::parse_goal_response(R"({"score": 1.0000001, "reasoning": "x"})");
    REQUIRE(result.has_value());
    CHECK(result.value().score == 1.0);

    const auto low = goals::parse_goal_response(R"({"score": -0.0000001, "reasoning": "x"})");
    REQUIRE(low.has_value());
    CHECK(low.value().score == 0.0);
  }
}

TEST_CASE("parse_goal_response rejects bad replies", "[goals][response]") {
  const auto kind_of = [](std::string_view text) {
    const auto result = goals::parse_goal_response(text);
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
  };

  CHECK(kind_of("I cannot rate this pair.") == ReasoningErrorKind::kMalformedResponse);
  CHECK(kind_of(R"({"score": 0.5, "reasoning": )") == ReasoningErrorKind::kMalformedResponse);
  CHECK(kind_of(R"({"reasoning": "x"})") == ReasoningErrorKind::kMalformedResponse);
  CHECK(kind_of(R"({"score": "0.5", "reasoning": "x"})") ==
        ReasoningErrorKind::kMalformedResponse);
  CHECK(kind_of(R"({"score": 0.5})") == ReasoningErrorKind::kMalformedResponse);
  CHECK(kind_of(R"({"score": 0.5, "reasoning": 3})") == ReasoningErrorKind::kMalformedResponse);
  CHECK(kind_of(R"({"score": 1.5, "reasoning": "x"})") == ReasoningErrorKind::kOutOfRange);
  CHECK(kind_of(R"({"score": -0.2, "reasoning": "x"})") == ReasoningErrorKind::kOutOfRange);
}

TEST_CASE("is_retryable", "[goals][response]") {
  using goals::ReasoningError;
  CHECK(goals::is_retryable(ReasoningError{ReasoningErrorKind::kTimeout, "", 0}));
  CHECK(goals::is_retryable(ReasoningError{ReasoningErrorKind::kTransport, "", 0}));
  CHECK(goals::is_retryable(ReasoningError{ReasoningErrorKind::kHttpStatus, "", 429}));
  CHECK(goals::is_retryable(ReasoningError{ReasoningErrorKind::kHttpStatus, "", 503}));
  CHECK_FALSE(goals::is_retryable(ReasoningError{ReasoningErrorKind::kHttpStatus, "", 400}));
  CHECK_FALSE(goals::is_retryable(ReasoningError{ReasoningErrorKind::kMalformedResponse, "", 0}));
  CHECK_FALSE(goals::is_retryable(ReasoningError{ReasoningErrorKind::kOutOfRange, "", 0}));
  CHECK_FALSE(goals::is_retryable(ReasoningError{ReasoningErrorKind::kMissingCredential, "", 0}));
  CHECK_FALSE(goals::is_retryable(ReasoningError{ReasoningErrorKind::kCancelled, "", 0}));
}

TEST_CASE("describe renders kind and message", "[goals][response]") {
  CHECK(goals::describe(goals::ReasoningError{ReasoningErrorKind::kTimeout, "after 10000ms", 0}) ==
        "timeout: after 10000ms");
  CHECK(goals::describe(goals::ReasoningError{ReasoningErrorKind::kCancelled, "", 0}) ==
        "cancelled");
}
