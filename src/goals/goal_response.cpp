#include "beacon/goals/goal_response.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>

namespace beacon::goals {

namespace {

using ParseResult = core::Result<GoalJudgment, ReasoningError>;

ParseResult malformed(std::string message) {
  return ParseResult::err(
      ReasoningError{ReasoningErrorKind::kMalformedResponse, std::move(message), 0});
}

// Returns the body of the first fenced block, or text unchanged when unfenced.
std::string_view strip_code_fence(std::string_view text) {
  const auto open = text.find("```");
  if (open == std::string_view::npos) {
    return text;
  }
  auto body_start = text.find('\n', open);
  if (body_start == std::string_view::npos) {
    body_start = open + 3;
  } else {
    ++body_start;
  }
  const auto close = text.find("```", body_start);
  if (close == std::string_view::npos) {
    return text.substr(body_start);
  }
  return text.substr(body_start, close - body_start);
}

}  // namespace

std::string_view extract_json_object(std::string_view text) {
  const std::string_view body = strip_code_fence(text);
  const auto first = body.find('{');
  const auto last = body.rfind('}');
  if (first == std::string_view::npos || last == std::string_view::npos || last < first) {
    return {};
  }
  return body.substr(first, last - first + 1);
}

core::Result<GoalJudgment, ReasoningError> parse_goal_response(std::string_view text) {
  const std::string_view object_text = extract_json_object(text);
  if (object_text.empty()) {
    return malformed("no JSON object in response");
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(object_text);
  } catch (const nlohmann::json::parse_error& e) {
    return malformed(std::string("invalid JSON: ") + e.what());
  }

  if (!j.is_object()) {
    return malformed("response is not a JSON object");
  }
  if (!j.contains("score") || !j["score"].is_number()) {
    return malformed("missing numeric \"score\"");
  }
  if (!j.contains("reasoning") || !j["reasoning"].is_string()) {
    return malformed("missing string \"reasoning\"");
  }

  double score = j["score"].get<double>();
  if (!std::isfinite(score) || score < -kScoreTolerance || score > 1.0 + kScoreTolerance) {
    return ParseResult::err(ReasoningError{ReasoningErrorKind::kOutOfRange,
                                           "score " + std::to_string(score) + " outside [0, 1]",
                                           0});
  }
  score = std::clamp(score, 0.0, 1.0);

  return ParseResult::ok(GoalJudgment{score, j["reasoning"].get<std::string>()});
}

}  // namespace beacon::goals
