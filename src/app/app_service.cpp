#include "beacon/app/app_service.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <set>

namespace beacon::app {

namespace {

std::string resolve_trace_id(const std::optional<std::string>& requested,
                             core::IIdGenerator& id_gen) {
  if (requested.has_value() && !requested->empty()) {
    return *requested;
  }
  return core::TraceId{id_gen.next("trace")}.value;
}

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const char* event_type, const nlohmann::json& payload,
          std::vector<std::string> refs) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

AppError not_found(const std::string& what, const std::string& id) {
  return AppError{AppErrorCode::kNotFound, what + " not found: " + id};
}

AppError storage_failure(core::StorageError error, const std::string& context) {
  switch (error) {
    case core::StorageError::kNotFound:
      return AppError{AppErrorCode::kNotFound, context + ": no such record"};
    case core::StorageError::kConflict:
      return AppError{AppErrorCode::kConflict, context + ": already exists"};
    case core::StorageError::kUnavailable:
      break;
  }
  return AppError{AppErrorCode::kStorage, context + ": storage unavailable"};
}

AppError invalid(const std::string& message) {
  return AppError{AppErrorCode::kInvalidArgument, message};
}

bool valid_goal_weight(const std::optional<double>& weight) {
  return !weight.has_value() || (std::isfinite(*weight) && *weight >= 0.0);
}

bool valid_shown_scores(const ShownScores& shown) {
  const auto in_range = [](double value, double high) {
    return std::isfinite(value) && value >= 0.0 && value <= high;
  };
  return in_range(shown.provider_score, 100.0) && in_range(shown.seeker_score, 100.0) &&
         in_range(shown.bilateral_score, 100.0) &&
         (!shown.goal_alignment.has_value() || in_range(*shown.goal_alignment, 1.0));
}

// Scores an eligible pair with goal alignment merged in; ineligible pairs get
// base aggregation and no goal. The fallback cause, if any, is left on goal.
domain::GoalPairScore score_with_goals(const domain::Provider& provider,
                                       const domain::Seeker& seeker, const Engine& engine,
                                       const std::optional<double>& goal_weight) {
  domain::GoalPairScore result;
  const auto evaluation = engine.scorer.evaluate(provider, seeker);
  if (!evaluation.eligibility.eligible) {
    result.score = engine.scorer.aggregate(provider, evaluation);
    return result;
  }

  auto goal = engine.goals.judge(provider, seeker, nullptr);
  result.score = engine.scorer.aggregate(
      provider, matching::BilateralScorer::with_goal_alignment(evaluation, goal.score),
      goal_weight.value_or(engine.scorer.weights().goal_weight));
  result.goal = std::move(goal);
  return result;
}

void emit_goal_fallback(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
                        const std::string& trace_id, const core::ProviderId& provider_id,
                        const core::SeekerId& seeker_id,
                        const std::optional<domain::GoalAlignment>& goal) {
  if (!goal.has_value() || !goal->fallback_cause.has_value()) {
    return;
  }
  emit(services, id_gen, clock, trace_id, "GoalAlignmentFallback",
       {{"seeker_id", seeker_id.value}, {"cause", *goal->fallback_cause}},
       {provider_id.value, seeker_id.value});
}

nlohmann::json score_payload(const domain::PairScore& score) {
  nlohmann::json j = {
      {"provider_score", score.provider_score},
      {"seeker_score", score.seeker_score},
      {"bilateral_score", score.bilateral_score},
      {"eligible", score.eligible},
  };
  if (score.ineligibility_reason.has_value()) {
    j["reason"] = *score.ineligibility_reason;
  }
  return j;
}

}  // namespace

core::Result<ScoreResponse, AppError> run_score_pair(const ScoreRequest& req,
                                                     core::Services& services,
                                                     const Engine& engine,
                                                     core::IIdGenerator& id_gen,
                                                     core::IClock& clock) {
  using R = core::Result<ScoreResponse, AppError>;

  if (!valid_goal_weight(req.goal_weight)) {
    return R::err(invalid("goal weight must be a non-negative number"));
  }

  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);
  emit(services, id_gen, clock, trace_id, "ScoreStarted",
       {{"source", "app_service"}, {"operation", "score_pair"}, {"with_goals", req.with_goals}},
       {req.provider_id.value, req.seeker_id.value});

  const auto provider = services.profiles.get_provider(req.provider_id);
  if (!provider.has_value()) {
    return R::err(not_found("provider", req.provider_id.value));
  }
  const auto seeker = services.profiles.get_seeker(req.seeker_id);
  if (!seeker.has_value()) {
    return R::err(not_found("seeker", req.seeker_id.value));
  }

  domain::GoalPairScore result;
  if (req.with_goals) {
    result = score_with_goals(*provider, *seeker, engine, req.goal_weight);
    emit_goal_fallback(services, id_gen, clock, trace_id, req.provider_id, req.seeker_id,
                       result.goal);
  } else {
    result.score = engine.scorer.score(*provider, *seeker);
  }

  nlohmann::json payload = score_payload(result.score);
  if (result.goal.has_value()) {
    payload["goal_score"] = result.goal->score;
    payload["goal_source"] = std::string(domain::to_string(result.goal->source));
    payload["goal_weight"] = req.goal_weight.value_or(engine.scorer.weights().goal_weight);
  }
  emit(services, id_gen, clock, trace_id, "PairScored", payload,
       {provider->provider_id.value, seeker->seeker_id.value});

  return R::ok(ScoreResponse{
      .trace_id = trace_id,
      .result = std::move(result),
  });
}

core::Result<FeedResponse, AppError> run_feed(const FeedRequest& req, core::Services& services,
                                              const Engine& engine, core::IIdGenerator& id_gen,
                                              core::IClock& clock,
                                              const core::CancellationToken* cancel) {
  using R = core::Result<FeedResponse, AppError>;

  if (!valid_goal_weight(req.goal_weight)) {
    return R::err(invalid("goal weight must be a non-negative number"));
  }

  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);
  emit(services, id_gen, clock, trace_id, "FeedStarted",
       {{"source", "app_service"},
        {"operation", "feed"},
        {"feed_size", req.feed_size},
        {"min_bilateral", req.min_bilateral}},
       {req.provider_id.value});

  const auto provider = services.profiles.get_provider(req.provider_id);
  if (!provider.has_value()) {
    return R::err(not_found("provider", req.provider_id.value));
  }

  auto contacted = services.connections.contacted_seekers(req.provider_id);
  if (!contacted.has_value()) {
    emit(services, id_gen, clock, trace_id, "FeedCompleted", {{"status", "storage_error"}},
         {req.provider_id.value});
    return R::err(
        storage_failure(contacted.error(), "contacted seekers of " + req.provider_id.value));
  }
  std::set<core::SeekerId> excluded = contacted.value();
  excluded.insert(req.excluded_ids.begin(), req.excluded_ids.end());

  const auto candidates = services.profiles.list_seekers();

  feed::FeedOptions options;
  options.feed_size = req.feed_size;
  options.min_bilateral = req.min_bilateral;
  options.max_workers = req.max_workers;
  options.goal_weight = req.goal_weight;

  const feed::FeedGenerator generator(engine.scorer, engine.goals);
  auto generated = generator.generate(*provider, candidates, excluded, options, cancel);
  if (!generated.has_value()) {
    emit(services, id_gen, clock, trace_id, "FeedCompleted", {{"status", "cancelled"}},
         {req.provider_id.value});
    return R::err(AppError{AppErrorCode::kCancelled, "feed generation cancelled"});
  }

  const feed::FeedResult& result = generated.value();
  for (const auto& fallback : result.goal_fallbacks) {
    emit(services, id_gen, clock, trace_id, "GoalAlignmentFallback",
         {{"seeker_id", fallback.seeker_id.value}, {"cause", fallback.cause}},
         {req.provider_id.value, fallback.seeker_id.value});
  }

  std::vector<std::string> refs{req.provider_id.value};
  for (const auto& item : result.items) {
    refs.push_back(item.seeker.seeker_id.value);
  }
  emit(services, id_gen, clock, trace_id, "FeedCompleted",
       {{"status", "success"},
        {"considered", result.considered},
        {"excluded", result.excluded},
        {"ineligible", result.ineligible},
        {"below_floor", result.below_floor},
        {"returned", result.items.size()},
        {"goal_fallbacks", result.goal_fallbacks.size()}},
       std::move(refs));

  return R::ok(FeedResponse{
      .trace_id = trace_id,
      .result = result,
  });
}

core::Result<ThresholdResponse, AppError> run_threshold_filter(const ThresholdRequest& req,
                                                               core::Services& services,
                                                               const Engine& engine,
                                                               core::IIdGenerator& id_gen,
                                                               core::IClock& clock) {
  using R = core::Result<ThresholdResponse, AppError>;

  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);

  const auto provider = services.profiles.get_provider(req.provider_id);
  if (!provider.has_value()) {
    return R::err(not_found("provider", req.provider_id.value));
  }

  std::vector<domain::Seeker> candidates;
  if (req.seeker_ids.has_value()) {
    for (const auto& id : *req.seeker_ids) {
      auto seeker = services.profiles.get_seeker(id);
      if (!seeker.has_value()) {
        return R::err(not_found("seeker", id.value));
      }
      candidates.push_back(std::move(*seeker));
    }
  } else {
    candidates = services.profiles.list_seekers();
  }

  const feed::FeedGenerator generator(engine.scorer, engine.goals);
  auto qualified = generator.filter_by_thresholds(*provider, candidates, req.thresholds);

  emit(services, id_gen, clock, trace_id, "FilterCompleted",
       {{"source", "app_service"},
        {"candidates", candidates.size()},
        {"qualified", qualified.size()},
        {"min_provider", req.thresholds.min_provider},
        {"min_seeker", req.thresholds.min_seeker},
        {"min_bilateral", req.thresholds.min_bilateral}},
       {req.provider_id.value});

  return R::ok(ThresholdResponse{
      .trace_id = trace_id,
      .candidates = std::move(qualified),
  });
}

core::Result<ConnectionOutcome, AppError> request_connection(const ConnectRequest& req,
                                                             core::Services& services,
                                                             const Engine& engine,
                                                             core::IIdGenerator& id_gen,
                                                             core::IClock& clock) {
  using R = core::Result<ConnectionOutcome, AppError>;

  if (req.shown.has_value() && !valid_shown_scores(*req.shown)) {
    return R::err(invalid("shown scores must be in [0, 100] and goal alignment in [0, 1]"));
  }
  if (!valid_goal_weight(req.goal_weight)) {
    return R::err(invalid("goal weight must be a non-negative number"));
  }

  const auto provider = services.profiles.get_provider(req.provider_id);
  if (!provider.has_value()) {
    return R::err(not_found("provider", req.provider_id.value));
  }
  const auto seeker = services.profiles.get_seeker(req.seeker_id);
  if (!seeker.has_value()) {
    return R::err(not_found("seeker", req.seeker_id.value));
  }

  const std::string pair = req.provider_id.value + "/" + req.seeker_id.value;
  auto existing = services.connections.get(req.provider_id, req.seeker_id);
  if (!existing.has_value()) {
    return R::err(storage_failure(existing.error(), "connection " + pair));
  }
  if (existing.value().has_value()) {
    return R::err(storage_failure(core::StorageError::kConflict, "connection " + pair));
  }

  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);

  domain::Connection connection;
  connection.provider_id = req.provider_id;
  connection.seeker_id = req.seeker_id;
  connection.status = domain::ConnectionStatus::kPending;
  if (req.shown.has_value()) {
    connection.provider_score = req.shown->provider_score;
    connection.seeker_score = req.shown->seeker_score;
    connection.bilateral_score = req.shown->bilateral_score;
    connection.goal_alignment = req.shown->goal_alignment;
  } else {
    const auto scored = score_with_goals(*provider, *seeker, engine, req.goal_weight);
    emit_goal_fallback(services, id_gen, clock, trace_id, req.provider_id, req.seeker_id,
                       scored.goal);
    connection.provider_score = scored.score.provider_score;
    connection.seeker_score = scored.score.seeker_score;
    connection.bilateral_score = scored.score.bilateral_score;
    if (scored.goal.has_value()) {
      connection.goal_alignment = scored.goal->score;
    }
  }
  const std::string now = clock.now_iso8601();
  connection.created_at = now;
  connection.provider_decided_at = now;

  auto inserted = services.connections.insert(connection);
  if (!inserted.has_value()) {
    return R::err(storage_failure(inserted.error(), "connection " + pair));
  }

  nlohmann::json payload = {
      {"status", std::string(domain::to_string(connection.status))},
      {"bilateral_score", connection.bilateral_score},
      {"scores_source", req.shown.has_value() ? "shown" : "computed"},
  };
  payload["goal_alignment"] = connection.goal_alignment.has_value()
                                  ? nlohmann::json(*connection.goal_alignment)
                                  : nlohmann::json(nullptr);
  emit(services, id_gen, clock, trace_id, "ConnectionRequested", payload,
       {req.provider_id.value, req.seeker_id.value});

  return R::ok(ConnectionOutcome{
      .trace_id = trace_id,
      .connection = std::move(connection),
  });
}

core::Result<ConnectionOutcome, AppError> respond_to_connection(
    const core::ProviderId& provider_id, const core::SeekerId& seeker_id, domain::Party responder,
    domain::ConnectionResponse response, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock) {
  using R = core::Result<ConnectionOutcome, AppError>;

  const std::string pair = provider_id.value + "/" + seeker_id.value;
  auto existing = services.connections.get(provider_id, seeker_id);
  if (!existing.has_value()) {
    return R::err(storage_failure(existing.error(), "connection " + pair));
  }
  if (!existing.value().has_value()) {
    return R::err(not_found("connection", pair));
  }

  domain::Connection connection = *existing.value();
  connection.status = response == domain::ConnectionResponse::kAccepted
                          ? domain::ConnectionStatus::kAccepted
                          : domain::ConnectionStatus::kDeclined;
  const std::string now = clock.now_iso8601();
  if (responder == domain::Party::kProvider) {
    connection.provider_decided_at = now;
  } else {
    connection.seeker_decided_at = now;
  }

  auto updated = services.connections.update(connection);
  if (!updated.has_value()) {
    return R::err(storage_failure(updated.error(), "connection " + pair));
  }

  const std::string trace_id = core::TraceId{id_gen.next("trace")}.value;
  emit(services, id_gen, clock, trace_id, "ConnectionResponded",
       {{"status", std::string(domain::to_string(connection.status))},
        {"responder", std::string(domain::to_string(responder))}},
       {provider_id.value, seeker_id.value});

  return R::ok(ConnectionOutcome{
      .trace_id = trace_id,
      .connection = std::move(connection),
  });
}

namespace {

ConnectionSummary summarize(domain::Connection connection, const std::string& counterpart_id,
                            const std::optional<domain::Profile>& counterpart) {
  ConnectionSummary summary;
  summary.counterpart_id = counterpart_id;
  summary.counterpart_name = "Unknown";
  if (counterpart.has_value()) {
    if (!counterpart->name.empty()) {
      summary.counterpart_name = counterpart->name;
    }
    summary.counterpart_role = counterpart->current_role;
    summary.counterpart_employer = counterpart->current_employer;
    summary.counterpart_industry = counterpart->current_industry;
    summary.counterpart_location = counterpart->location;
  }
  summary.connection = std::move(connection);
  return summary;
}

// Newest first. Input arrives ordered by counterpart id, which the stable
// sort keeps for equal timestamps.
void order_newest_first(std::vector<ConnectionSummary>& summaries) {
  std::stable_sort(summaries.begin(), summaries.end(),
                   [](const ConnectionSummary& a, const ConnectionSummary& b) {
                     return a.connection.created_at > b.connection.created_at;
                   });
}

}  // namespace

core::Result<std::vector<ConnectionSummary>, AppError> list_sent_connections(
    const core::ProviderId& provider_id, core::Services& services) {
  using R = core::Result<std::vector<ConnectionSummary>, AppError>;

  auto connections = services.connections.list_for_provider(provider_id);
  if (!connections.has_value()) {
    return R::err(storage_failure(connections.error(), "connections of " + provider_id.value));
  }

  std::vector<ConnectionSummary> summaries;
  for (const auto& connection : connections.value()) {
    std::optional<domain::Profile> seeker;
    if (auto found = services.profiles.get_seeker(connection.seeker_id); found.has_value()) {
      seeker = std::move(*found);
    }
    summaries.push_back(summarize(connection, connection.seeker_id.value, seeker));
  }
  order_newest_first(summaries);
  return R::ok(std::move(summaries));
}

core::Result<std::vector<ConnectionSummary>, AppError> list_received_connections(
    const core::SeekerId& seeker_id, core::Services& services) {
  using R = core::Result<std::vector<ConnectionSummary>, AppError>;

  auto connections = services.connections.list_for_seeker(seeker_id);
  if (!connections.has_value()) {
    return R::err(storage_failure(connections.error(), "connections of " + seeker_id.value));
  }

  std::vector<ConnectionSummary> summaries;
  for (const auto& connection : connections.value()) {
    // Only requests the provider has actually sent.
    if (!connection.provider_decided_at.has_value()) {
      continue;
    }
    std::optional<domain::Profile> provider;
    if (auto found = services.profiles.get_provider(connection.provider_id); found.has_value()) {
      provider = std::move(*found);
    }
    summaries.push_back(summarize(connection, connection.provider_id.value, provider));
  }
  order_newest_first(summaries);
  return R::ok(std::move(summaries));
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace beacon::app
