#pragma once

#include "beacon/core/cancellation.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/core/ids.h"
#include "beacon/core/result.h"
#include "beacon/core/services.h"
#include "beacon/domain/connection.h"
#include "beacon/domain/feed_item.h"
#include "beacon/domain/pair_score.h"
#include "beacon/feed/feed_generator.h"
#include "beacon/goals/fallback_goal_estimator.h"
#include "beacon/matching/bilateral_scorer.h"
#include "beacon/storage/audit_event.h"

#include <optional>
#include <string>
#include <vector>

namespace beacon::app {

enum class AppErrorCode {
  kNotFound,
  kConflict,
  kCancelled,
  kStorage,
  kInvalidArgument,
};

struct AppError {
  AppErrorCode code{AppErrorCode::kStorage};
  std::string message;
};

// Engine bundles the scoring components shared by every pipeline.
// References only; the caller owns the scorer and the estimator.
struct Engine {
  const matching::BilateralScorer& scorer;  // NOLINT(readability-identifier-naming)
  goals::FallbackGoalEstimator& goals;      // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Pair scoring
// ────────────────────────────────────────────────────────────────

struct ScoreRequest {
  core::ProviderId provider_id;         // NOLINT(readability-identifier-naming)
  core::SeekerId seeker_id;             // NOLINT(readability-identifier-naming)
  bool with_goals{false};               // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
  // Weight of goal_alignment on both sides; the engine's default when absent.
  std::optional<double> goal_weight;  // NOLINT(readability-identifier-naming)
};

struct ScoreResponse {
  std::string trace_id;         // NOLINT(readability-identifier-naming)
  domain::GoalPairScore result;  // NOLINT(readability-identifier-naming)
};

// Score one stored pair. With with_goals set, eligible pairs are rescored
// with goal alignment as an extra factor.
// kNotFound for unknown profiles, kInvalidArgument for a negative goal weight.
// Emits audit events: ScoreStarted, GoalAlignmentFallback (when used), PairScored
[[nodiscard]] core::Result<ScoreResponse, AppError> run_score_pair(const ScoreRequest& req,
                                                                   core::Services& services,
                                                                   const Engine& engine,
                                                                   core::IIdGenerator& id_gen,
                                                                   core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Feed
// ────────────────────────────────────────────────────────────────

struct FeedRequest {
  core::ProviderId provider_id;                      // NOLINT(readability-identifier-naming)
  std::size_t feed_size{feed::kServiceFeedSize};     // NOLINT(readability-identifier-naming)
  double min_bilateral{feed::kDefaultMinBilateral};  // NOLINT(readability-identifier-naming)
  std::vector<core::SeekerId> excluded_ids;          // NOLINT(readability-identifier-naming)
  std::size_t max_workers{0};                        // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;               // NOLINT(readability-identifier-naming)
  std::optional<double> goal_weight;                 // NOLINT(readability-identifier-naming)
};

struct FeedResponse {
  std::string trace_id;       // NOLINT(readability-identifier-naming)
  feed::FeedResult result;    // NOLINT(readability-identifier-naming)
};

// Build a feed for a stored provider over every stored seeker. Seekers the
// provider already contacted are excluded along with req.excluded_ids.
// kStorage when the contacted set cannot be read; the feed is never built
// without it.
// Emits audit events: FeedStarted, GoalAlignmentFallback (per pair), FeedCompleted
[[nodiscard]] core::Result<FeedResponse, AppError> run_feed(
    const FeedRequest& req, core::Services& services, const Engine& engine,
    core::IIdGenerator& id_gen, core::IClock& clock,
    const core::CancellationToken* cancel = nullptr);

// ────────────────────────────────────────────────────────────────
// Threshold filter
// ────────────────────────────────────────────────────────────────

struct ThresholdRequest {
  core::ProviderId provider_id;  // NOLINT(readability-identifier-naming)
  // Candidate subset; all stored seekers when absent. Unknown ids fail the
  // request with kNotFound.
  std::optional<std::vector<core::SeekerId>> seeker_ids;  // NOLINT(readability-identifier-naming)
  feed::ThresholdOptions thresholds;                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;                    // NOLINT(readability-identifier-naming)
};

struct ThresholdResponse {
  std::string trace_id;                             // NOLINT(readability-identifier-naming)
  std::vector<domain::ScoredCandidate> candidates;  // NOLINT(readability-identifier-naming)
};

// Emits audit event: FilterCompleted
[[nodiscard]] core::Result<ThresholdResponse, AppError> run_threshold_filter(
    const ThresholdRequest& req, core::Services& services, const Engine& engine,
    core::IIdGenerator& id_gen, core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Connections
// ────────────────────────────────────────────────────────────────

struct ConnectionOutcome {
  std::string trace_id;           // NOLINT(readability-identifier-naming)
  domain::Connection connection;  // NOLINT(readability-identifier-naming)
};

// ShownScores are the scores a provider saw, for example on a feed item, when
// deciding to connect. Scores are on the 0-100 scale, goal_alignment on 0-1.
struct ShownScores {
  double provider_score{0.0};           // NOLINT(readability-identifier-naming)
  double seeker_score{0.0};             // NOLINT(readability-identifier-naming)
  double bilateral_score{0.0};          // NOLINT(readability-identifier-naming)
  std::optional<double> goal_alignment;  // NOLINT(readability-identifier-naming)
};

struct ConnectRequest {
  core::ProviderId provider_id;  // NOLINT(readability-identifier-naming)
  core::SeekerId seeker_id;      // NOLINT(readability-identifier-naming)
  // Recorded as given. When absent the pair is scored the way the feed scores
  // it, goal alignment included for eligible pairs.
  std::optional<ShownScores> shown;     // NOLINT(readability-identifier-naming)
  std::optional<double> goal_weight;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Record a pending connection carrying the scores the provider acted on.
// kNotFound for unknown profiles, kConflict if the pair is already connected,
// kInvalidArgument for shown scores out of range.
// Emits audit events: GoalAlignmentFallback (when used), ConnectionRequested
[[nodiscard]] core::Result<ConnectionOutcome, AppError> request_connection(
    const ConnectRequest& req, core::Services& services, const Engine& engine,
    core::IIdGenerator& id_gen, core::IClock& clock);

// Set the status and stamp the responder's decision time.
// kNotFound if the pair has no connection.
// Emits audit event: ConnectionResponded
[[nodiscard]] core::Result<ConnectionOutcome, AppError> respond_to_connection(
    const core::ProviderId& provider_id, const core::SeekerId& seeker_id, domain::Party responder,
    domain::ConnectionResponse response, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ConnectionSummary pairs a connection with the other party's card. When that
// profile is gone the name reads "Unknown" and the other fields are empty.
struct ConnectionSummary {
  domain::Connection connection;   // NOLINT(readability-identifier-naming)
  std::string counterpart_id;      // NOLINT(readability-identifier-naming)
  std::string counterpart_name;    // NOLINT(readability-identifier-naming)
  std::string counterpart_role;    // NOLINT(readability-identifier-naming)
  std::string counterpart_employer;  // NOLINT(readability-identifier-naming)
  std::string counterpart_industry;  // NOLINT(readability-identifier-naming)
  std::string counterpart_location;  // NOLINT(readability-identifier-naming)
};

// Connections a provider has sent, newest first; ties by seeker id.
[[nodiscard]] core::Result<std::vector<ConnectionSummary>, AppError> list_sent_connections(
    const core::ProviderId& provider_id, core::Services& services);

// Requests a seeker has received, newest first; ties by provider id.
[[nodiscard]] core::Result<std::vector<ConnectionSummary>, AppError> list_received_connections(
    const core::SeekerId& seeker_id, core::Services& services);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace beacon::app
