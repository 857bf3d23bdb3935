#pragma once

#include "beacon/core/result.h"
#include "beacon/goals/goal_estimator.h"

#include <string>
#include <string_view>

namespace beacon::goals {

// Scores this far outside [0, 1] are rounding noise and get clamped; anything
// further out is rejected as kOutOfRange.
constexpr double kScoreTolerance = 1e-6;

struct GoalJudgment {
  double score{0.0};
  std::string reasoning;
};

// extract_json_object strips Markdown code fences and returns the text from
// the first '{' to the last '}'. Returns an empty view when there is none.
[[nodiscard]] std::string_view extract_json_object(std::string_view text);

// parse_goal_response requires a JSON object with a numeric "score" and a
// string "reasoning". Errors are kMalformedResponse or kOutOfRange.
[[nodiscard]] core::Result<GoalJudgment, ReasoningError> parse_goal_response(
    std::string_view text);

}  // namespace beacon::goals
