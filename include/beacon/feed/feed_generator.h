#pragma once

#include "beacon/core/cancellation.h"
#include "beacon/core/ids.h"
#include "beacon/core/result.h"
#include "beacon/domain/feed_item.h"
#include "beacon/domain/profile.h"
#include "beacon/goals/fallback_goal_estimator.h"
#include "beacon/matching/bilateral_scorer.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace beacon::feed {

constexpr std::size_t kDefaultFeedSize = 5;
constexpr std::size_t kServiceFeedSize = 20;
constexpr double kDefaultMinBilateral = 50.0;

enum class FeedError {
  kCancelled,
};

struct FeedOptions {
  std::size_t feed_size{kDefaultFeedSize};     // NOLINT(readability-identifier-naming)
  double min_bilateral{kDefaultMinBilateral};  // NOLINT(readability-identifier-naming)
  // Upper bound on concurrent scoring tasks; 0 means hardware concurrency.
  std::size_t max_workers{0};  // NOLINT(readability-identifier-naming)
  // Overrides the scorer's goal weight for this feed.
  std::optional<double> goal_weight;  // NOLINT(readability-identifier-naming)
};

// Three independent floors; a candidate must clear all of them.
struct ThresholdOptions {
  double min_provider{60.0};   // NOLINT(readability-identifier-naming)
  double min_seeker{50.0};     // NOLINT(readability-identifier-naming)
  double min_bilateral{55.0};  // NOLINT(readability-identifier-naming)
};

struct GoalFallback {
  core::SeekerId seeker_id;
  std::string cause;
};

struct FeedResult {
  std::vector<domain::FeedItem> items;
  std::size_t considered{0};   // NOLINT(readability-identifier-naming)
  std::size_t excluded{0};     // NOLINT(readability-identifier-naming)
  std::size_t ineligible{0};   // NOLINT(readability-identifier-naming)
  std::size_t below_floor{0};  // NOLINT(readability-identifier-naming)
  // Pairs whose goal alignment came from the heuristic, in candidate order.
  std::vector<GoalFallback> goal_fallbacks;  // NOLINT(readability-identifier-naming)
};

// make_seeker_view builds the denormalized card for a seeker.
[[nodiscard]] domain::SeekerView make_seeker_view(const domain::Seeker& seeker,
                                                  const matching::NormalizedProfile& normalized);

// FeedGenerator assembles a ranked, size-bounded candidate feed for one provider.
// Candidates are scored concurrently; ordering is bilateral score descending,
// then seeker id ascending, so output does not depend on scheduling.
class FeedGenerator {
 public:
  FeedGenerator(const matching::BilateralScorer& scorer, goals::FallbackGoalEstimator& goals);

  // generate skips excluded ids, keeps eligible pairs at or above the floor,
  // truncates to feed_size and flags the first item as best pick.
  // Returns kCancelled, never a partial feed, once cancel is set.
  [[nodiscard]] core::Result<FeedResult, FeedError> generate(
      const domain::Provider& provider, const std::vector<domain::Seeker>& candidates,
      const std::set<core::SeekerId>& excluded, const FeedOptions& options,
      const core::CancellationToken* cancel = nullptr) const;

  // filter_by_thresholds screens candidates without goal alignment and
  // without truncation, sorted like the feed.
  [[nodiscard]] std::vector<domain::ScoredCandidate> filter_by_thresholds(
      const domain::Provider& provider, const std::vector<domain::Seeker>& candidates,
      const ThresholdOptions& options) const;

 private:
  const matching::BilateralScorer& scorer_;
  goals::FallbackGoalEstimator& goals_;
};

}  // namespace beacon::feed
