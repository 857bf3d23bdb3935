#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace beacon::domain {

enum class GoalSource {
  kRemote,
  kHeuristic,
};

[[nodiscard]] inline std::string_view to_string(GoalSource source) {
  switch (source) {
    case GoalSource::kRemote:
      return "remote";
    case GoalSource::kHeuristic:
      return "heuristic";
  }
  return "heuristic";
}

// GoalAlignment is the judged fit between a seeker's stated goal and a provider.
struct GoalAlignment {
  double score{0.0};  // [0, 1]
  std::string reasoning;
  GoalSource source{GoalSource::kHeuristic};
  // Set when the remote judgment failed and the heuristic stood in.
  std::optional<std::string> fallback_cause;  // NOLINT(readability-identifier-naming)
};

}  // namespace beacon::domain
