#pragma once

#include "beacon/core/ids.h"
#include "beacon/domain/goal_alignment.h"
#include "beacon/domain/pair_score.h"
#include "beacon/domain/past_position.h"

#include <optional>
#include <string>
#include <vector>

namespace beacon::domain {

constexpr const char* kUnknownAlmaMater = "Unknown";
constexpr std::size_t kRecentPositionCount = 2;

// SeekerView is the denormalized seeker card shown to a provider.
struct SeekerView {
  core::SeekerId seeker_id;
  std::string name;
  std::string alma_mater;  // kUnknownAlmaMater when none found
  std::string location;
  std::optional<double> gpa;
  std::string current_role;
  std::string current_employer;
  std::string current_industry;
  double total_experience{0.0};
  std::vector<PastPosition> recent_positions;  // first kRecentPositionCount entries
  std::vector<std::string> help_needed;
  std::string goal;
  std::string context;
};

struct FeedItem {
  SeekerView seeker;
  PairScore score;
  GoalAlignment goal;
  double acceptance_probability{0.0};
  // Placeholder for a stable-matching pick: true only for the top-ranked item.
  bool best_pick{false};
};

// ScoredCandidate is a three-stage screening result. It carries no goal
// alignment and no best-pick flag.
struct ScoredCandidate {
  SeekerView seeker;
  PairScore score;
  double acceptance_probability{0.0};
};

}  // namespace beacon::domain
