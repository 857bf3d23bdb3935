#include "beacon/feed/feed_generator.h"

#include "beacon/matching/acceptance.h"

#include <algorithm>
#include <future>
#include <optional>
#include <thread>

namespace beacon::feed {

namespace {

enum class Outcome {
  kPending,
  kIneligible,
  kBelowFloor,
  kIncluded,
};

struct Slot {
  Outcome outcome{Outcome::kPending};
  std::optional<domain::FeedItem> item;
  std::optional<std::string> fallback_cause;
};

// Higher bilateral first; equal scores by ascending seeker id.
template <typename Item>
bool ranks_before(const Item& a, const Item& b) {
  if (a.score.bilateral_score != b.score.bilateral_score) {
    return a.score.bilateral_score > b.score.bilateral_score;
  }
  return a.seeker.seeker_id < b.seeker.seeker_id;
}

std::size_t worker_count(std::size_t requested, std::size_t jobs) {
  std::size_t workers = requested;
  if (workers == 0) {
    workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1, std::min(workers, jobs));
}

}  // namespace

domain::SeekerView make_seeker_view(const domain::Seeker& seeker,
                                    const matching::NormalizedProfile& normalized) {
  domain::SeekerView view;
  view.seeker_id = seeker.seeker_id;
  view.name = seeker.name;
  view.alma_mater = normalized.alma_mater.value_or(domain::kUnknownAlmaMater);
  view.location = seeker.location;
  view.gpa = seeker.gpa;
  view.current_role = seeker.current_role;
  view.current_employer = seeker.current_employer;
  view.current_industry = seeker.current_industry;
  view.total_experience = normalized.total_experience;
  const auto recent = std::min(domain::kRecentPositionCount, seeker.past_positions.size());
  view.recent_positions.assign(seeker.past_positions.begin(),
                               seeker.past_positions.begin() + static_cast<std::ptrdiff_t>(recent));
  view.help_needed = seeker.help_needed;
  view.goal = seeker.goal;
  view.context = seeker.context;
  return view;
}

FeedGenerator::FeedGenerator(const matching::BilateralScorer& scorer,
                             goals::FallbackGoalEstimator& goals)
    : scorer_(scorer), goals_(goals) {}

core::Result<FeedResult, FeedError> FeedGenerator::generate(
    const domain::Provider& provider, const std::vector<domain::Seeker>& candidates,
    const std::set<core::SeekerId>& excluded, const FeedOptions& options,
    const core::CancellationToken* cancel) const {
  using R = core::Result<FeedResult, FeedError>;

  FeedResult result;
  result.considered = candidates.size();

  std::vector<const domain::Seeker*> jobs;
  jobs.reserve(candidates.size());
  for (const auto& seeker : candidates) {
    if (excluded.contains(seeker.seeker_id)) {
      ++result.excluded;
    } else {
      jobs.push_back(&seeker);
    }
  }

  std::vector<Slot> slots(jobs.size());

  const auto score_one = [&](std::size_t index) {
    const domain::Seeker& seeker = *jobs[index];
    Slot& slot = slots[index];

    const auto base = scorer_.evaluate(provider, seeker);
    if (!base.eligibility.eligible) {
      slot.outcome = Outcome::kIneligible;
      return;
    }

    domain::GoalAlignment goal = goals_.judge(provider, seeker, cancel);
    if (goal.fallback_cause.has_value()) {
      slot.fallback_cause = goal.fallback_cause;
    }

    const auto evaluation = matching::BilateralScorer::with_goal_alignment(base, goal.score);
    const auto score =
        scorer_.aggregate(provider, evaluation,
                          options.goal_weight.value_or(scorer_.weights().goal_weight));
    if (score.bilateral_score < options.min_bilateral) {
      slot.outcome = Outcome::kBelowFloor;
      return;
    }

    domain::FeedItem item;
    item.seeker = make_seeker_view(seeker, evaluation.seeker);
    item.score = score;
    item.goal = std::move(goal);
    item.acceptance_probability = matching::estimate_acceptance(score.seeker_score);
    slot.item = std::move(item);
    slot.outcome = Outcome::kIncluded;
  };

  // Each worker owns a strided subset of slots, so no slot is written twice.
  const std::size_t workers = worker_count(options.max_workers, jobs.size());
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [&, w]() {
      for (std::size_t i = w; i < jobs.size(); i += workers) {
        if (cancel != nullptr && cancel->is_cancelled()) {
          return;
        }
        score_one(i);
      }
    }));
  }
  for (auto& f : futures) {
    f.get();
  }

  if (cancel != nullptr && cancel->is_cancelled()) {
    return R::err(FeedError::kCancelled);
  }

  for (std::size_t i = 0; i < slots.size(); ++i) {
    auto& slot = slots[i];
    if (slot.fallback_cause.has_value()) {
      result.goal_fallbacks.push_back(GoalFallback{jobs[i]->seeker_id, *slot.fallback_cause});
    }
    switch (slot.outcome) {
      case Outcome::kIneligible:
        ++result.ineligible;
        break;
      case Outcome::kBelowFloor:
        ++result.below_floor;
        break;
      case Outcome::kIncluded:
        result.items.push_back(std::move(*slot.item));
        break;
      case Outcome::kPending:
        break;
    }
  }

  std::sort(result.items.begin(), result.items.end(),
            ranks_before<domain::FeedItem>);
  if (result.items.size() > options.feed_size) {
    result.items.resize(options.feed_size);
  }
  for (std::size_t i = 0; i < result.items.size(); ++i) {
    result.items[i].best_pick = (i == 0);
  }

  return R::ok(std::move(result));
}

std::vector<domain::ScoredCandidate> FeedGenerator::filter_by_thresholds(
    const domain::Provider& provider, const std::vector<domain::Seeker>& candidates,
    const ThresholdOptions& options) const {
  std::vector<domain::ScoredCandidate> qualified;

  for (const auto& seeker : candidates) {
    const auto evaluation = scorer_.evaluate(provider, seeker);
    if (!evaluation.eligibility.eligible) {
      continue;
    }

    const auto score = scorer_.aggregate(provider, evaluation);
    if (score.provider_score < options.min_provider || score.seeker_score < options.min_seeker ||
        score.bilateral_score < options.min_bilateral) {
      continue;
    }

    domain::ScoredCandidate candidate;
    candidate.seeker = make_seeker_view(seeker, evaluation.seeker);
    candidate.score = score;
    candidate.acceptance_probability = matching::estimate_acceptance(score.seeker_score);
    qualified.push_back(std::move(candidate));
  }

  std::sort(qualified.begin(), qualified.end(), ranks_before<domain::ScoredCandidate>);
  return qualified;
}

}  // namespace beacon::feed
