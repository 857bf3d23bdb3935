#include "beacon/app/app_service.h"
#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/storage/audit_log.h"
#include "beacon/storage/inmemory_connection_repository.h"
#include "beacon/storage/inmemory_profile_repository.h"

#include "fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace beacon;
using Catch::Matchers::WithinAbs;

namespace {

// Stores, scoring engine and deterministic ids wired the way the CLI wires them.
struct Harness {
  storage::InMemoryProfileRepository profiles;
  storage::InMemoryConnectionRepository connections;
  storage::InMemoryAuditLog audit_log;
  core::Services services{profiles, connections, audit_log};

  matching::BilateralScorer scorer;
  goals::FallbackGoalEstimator goals{nullptr};
  app::Engine engine{scorer, goals};

  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};

  Harness() {
    auto finance = testing::make_seeker("s-3");
    finance.current_industry = "Finance";

    REQUIRE(profiles.upsert_provider(testing::make_provider("p-1")).has_value());
    REQUIRE(profiles.upsert_seeker(testing::make_seeker("s-1")).has_value());
    REQUIRE(profiles.upsert_seeker(testing::make_seeker("s-2")).has_value());
    REQUIRE(profiles.upsert_seeker(finance).has_value());
  }

  [[nodiscard]] std::vector<std::string> event_types(const std::string& trace_id) const {
    std::vector<std::string> types;
    for (const auto& event : audit_log.query(trace_id)) {
      types.push_back(event.event_type);
    }
    return types;
  }
};

// Connection store whose reads always fail, as a locked or corrupt database would.
class UnavailableConnectionRepository : public storage::IConnectionRepository {
 public:
  core::Result<bool, core::StorageError> insert(const domain::Connection& /*connection*/) override {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }
  core::Result<bool, core::StorageError> update(const domain::Connection& /*connection*/) override {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }
  core::Result<std::optional<domain::Connection>, core::StorageError> get(
      const core::ProviderId& /*provider_id*/, const core::SeekerId& /*seeker_id*/) const override {
    return core::Result<std::optional<domain::Connection>, core::StorageError>::err(
        core::StorageError::kUnavailable);
  }
  core::Result<std::vector<domain::Connection>, core::StorageError> list_for_provider(
      const core::ProviderId& /*provider_id*/) const override {
    return core::Result<std::vector<domain::Connection>, core::StorageError>::err(
        core::StorageError::kUnavailable);
  }
  core::Result<std::vector<domain::Connection>, core::StorageError> list_for_seeker(
      const core::SeekerId& /*seeker_id*/) const override {
    return core::Result<std::vector<domain::Connection>, core::StorageError>::err(
        core::StorageError::kUnavailable);
  }
  core::Result<std::set<core::SeekerId>, core::StorageError> contacted_seekers(
      const core::ProviderId& /*provider_id*/) const override {
    return core::Result<std::set<core::SeekerId>, core::StorageError>::err(
        core::StorageError::kUnavailable);
  }
};

domain::Connection stored_connection(const std::string& provider_id, const std::string& seeker_id,
                                     const std::string& created_at) {
  domain::Connection connection;
  connection.provider_id = core::ProviderId{provider_id};
  connection.seeker_id = core::SeekerId{seeker_id};
  connection.status = domain::ConnectionStatus::kPending;
  connection.bilateral_score = 60.0;
  connection.created_at = created_at;
  connection.provider_decided_at = created_at;
  return connection;
}

}  // namespace

TEST_CASE("run_score_pair", "[app][score]") {
  Harness h;

  SECTION("base scores") {
    const auto result = app::run_score_pair({core::ProviderId{"p-1"}, core::SeekerId{"s-1"}},
                                            h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    const auto& response = result.value();
    CHECK(response.trace_id == "trace-0");
    CHECK_THAT(response.result.score.bilateral_score, WithinAbs(72.7, 1e-9));
    CHECK_FALSE(response.result.goal.has_value());
    CHECK(h.event_types("trace-0") == std::vector<std::string>{"ScoreStarted", "PairScored"});

    const auto events = h.audit_log.query("trace-0");
    const auto payload = nlohmann::json::parse(events[1].payload);
    CHECK(payload["bilateral_score"] == 72.7);
    CHECK(events[1].refs == std::vector<std::string>{"p-1", "s-1"});
    CHECK(events[1].created_at == "2026-01-01T00:00:00Z");
  }

  SECTION("with goals falls back to the heuristic") {
    app::ScoreRequest req{core::ProviderId{"p-1"}, core::SeekerId{"s-1"}, true, "trace-custom"};
    const auto result = app::run_score_pair(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    CHECK(result.value().trace_id == "trace-custom");
    CHECK_THAT(result.value().result.score.bilateral_score, WithinAbs(74.6, 1e-9));
    REQUIRE(result.value().result.goal.has_value());
    CHECK(result.value().result.goal->source == domain::GoalSource::kHeuristic);
    CHECK(h.event_types("trace-custom") ==
          std::vector<std::string>{"ScoreStarted", "GoalAlignmentFallback", "PairScored"});
  }

  SECTION("per-call goal weight") {
    app::ScoreRequest req{core::ProviderId{"p-1"}, core::SeekerId{"s-1"}, true};
    req.goal_weight = 10.0;
    const auto result = app::run_score_pair(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    const auto& score = result.value().result.score;
    CHECK_THAT(score.provider_score, WithinAbs(77.5, 1e-9));
    CHECK_THAT(score.seeker_score, WithinAbs(73.0, 1e-9));
    CHECK_THAT(score.bilateral_score, WithinAbs(75.7, 1e-9));
    CHECK(h.scorer.weights().goal_weight == 5.0);

    const auto events = h.audit_log.query(result.value().trace_id);
    CHECK(nlohmann::json::parse(events.back().payload)["goal_weight"] == 10.0);
  }

  SECTION("zero goal weight leaves the base scores") {
    app::ScoreRequest req{core::ProviderId{"p-1"}, core::SeekerId{"s-1"}, true};
    req.goal_weight = 0.0;
    const auto result = app::run_score_pair(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    CHECK_THAT(result.value().result.score.bilateral_score, WithinAbs(72.7, 1e-9));
  }

  SECTION("negative goal weight is rejected before any event") {
    app::ScoreRequest req{core::ProviderId{"p-1"}, core::SeekerId{"s-1"}, true, "trace-neg"};
    req.goal_weight = -1.0;
    const auto result = app::run_score_pair(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kInvalidArgument);
    CHECK(h.audit_log.query("trace-neg").empty());
  }

  SECTION("unknown seeker") {
    const auto result = app::run_score_pair({core::ProviderId{"p-1"}, core::SeekerId{"s-404"}},
                                            h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kNotFound);
    CHECK(result.error().message == "seeker not found: s-404");
  }
}

TEST_CASE("run_feed", "[app][feed]") {
  Harness h;

  app::FeedRequest req;
  req.provider_id = core::ProviderId{"p-1"};
  req.max_workers = 2;

  SECTION("ranks stored seekers and audits fallbacks") {
    const auto result = app::run_feed(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    const auto& feed = result.value().result;
    REQUIRE(feed.items.size() == 2);
    CHECK(feed.items[0].seeker.seeker_id.value == "s-1");
    CHECK(feed.items[0].best_pick);
    CHECK(feed.below_floor == 1);

    CHECK(h.event_types(result.value().trace_id) ==
          std::vector<std::string>{"FeedStarted", "GoalAlignmentFallback",
                                   "GoalAlignmentFallback", "GoalAlignmentFallback",
                                   "FeedCompleted"});

    const auto events = h.audit_log.query(result.value().trace_id);
    const auto completed = nlohmann::json::parse(events.back().payload);
    CHECK(completed["status"] == "success");
    CHECK(completed["returned"] == 2);
    CHECK(events.back().refs == std::vector<std::string>{"p-1", "s-1", "s-2"});
  }

  SECTION("request exclusions") {
    req.excluded_ids = {core::SeekerId{"s-1"}};
    const auto result = app::run_feed(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    REQUIRE(result.value().result.items.size() == 1);
    CHECK(result.value().result.items[0].seeker.seeker_id.value == "s-2");
    CHECK(result.value().result.excluded == 1);
  }

  SECTION("per-call goal weight reaches every item") {
    req.goal_weight = 10.0;
    const auto result = app::run_feed(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result.value().result.items.empty());
    CHECK_THAT(result.value().result.items[0].score.bilateral_score, WithinAbs(75.7, 1e-9));
  }

  SECTION("contacted seekers leave the feed") {
    app::ConnectRequest connect;
    connect.provider_id = core::ProviderId{"p-1"};
    connect.seeker_id = core::SeekerId{"s-2"};
    REQUIRE(app::request_connection(connect, h.services, h.engine, h.id_gen, h.clock).has_value());
    const auto result = app::run_feed(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    REQUIRE(result.value().result.items.size() == 1);
    CHECK(result.value().result.items[0].seeker.seeker_id.value == "s-1");
  }

  SECTION("cancelled") {
    core::CancellationToken cancel;
    cancel.cancel();
    req.trace_id = "trace-cancel";
    const auto result = app::run_feed(req, h.services, h.engine, h.id_gen, h.clock, &cancel);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kCancelled);

    const auto events = h.audit_log.query("trace-cancel");
    REQUIRE(events.size() == 2);
    CHECK(nlohmann::json::parse(events[1].payload)["status"] == "cancelled");
  }

  SECTION("unknown provider") {
    req.provider_id = core::ProviderId{"p-404"};
    const auto result = app::run_feed(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kNotFound);
  }

  SECTION("unreadable connection store fails the feed") {
    UnavailableConnectionRepository unavailable;
    core::Services services{h.profiles, unavailable, h.audit_log};
    req.trace_id = "trace-storage";
    const auto result = app::run_feed(req, services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kStorage);
    CHECK(result.error().message == "contacted seekers of p-1: storage unavailable");

    const auto events = h.audit_log.query("trace-storage");
    REQUIRE(events.size() == 2);
    CHECK(nlohmann::json::parse(events[1].payload)["status"] == "storage_error");
  }
}

TEST_CASE("run_threshold_filter", "[app][filter]") {
  Harness h;

  app::ThresholdRequest req;
  req.provider_id = core::ProviderId{"p-1"};

  SECTION("all stored seekers") {
    const auto result = app::run_threshold_filter(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    REQUIRE(result.value().candidates.size() == 2);
    CHECK(result.value().candidates[0].seeker.seeker_id.value == "s-1");
    CHECK(h.event_types(result.value().trace_id) == std::vector<std::string>{"FilterCompleted"});
  }

  SECTION("explicit subset") {
    req.seeker_ids = std::vector<core::SeekerId>{core::SeekerId{"s-2"}, core::SeekerId{"s-3"}};
    const auto result = app::run_threshold_filter(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    REQUIRE(result.value().candidates.size() == 1);
    CHECK(result.value().candidates[0].seeker.seeker_id.value == "s-2");

    const auto events = h.audit_log.query(result.value().trace_id);
    REQUIRE(events.size() == 1);
    CHECK(nlohmann::json::parse(events[0].payload)["candidates"] == 2);
  }

  SECTION("unknown id in the subset fails the request") {
    req.seeker_ids = std::vector<core::SeekerId>{core::SeekerId{"s-2"}, core::SeekerId{"s-404"}};
    req.trace_id = "trace-filter";
    const auto result = app::run_threshold_filter(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kNotFound);
    CHECK(result.error().message == "seeker not found: s-404");
    CHECK(h.audit_log.query("trace-filter").empty());
  }
}

TEST_CASE("connection lifecycle", "[app][connections]") {
  Harness h;
  const core::ProviderId provider{"p-1"};
  const core::SeekerId seeker{"s-1"};

  app::ConnectRequest req;
  req.provider_id = provider;
  req.seeker_id = seeker;

  core::FixedClock request_time("2026-02-01T09:00:00Z");
  const auto requested = app::request_connection(req, h.services, h.engine, h.id_gen, request_time);
  REQUIRE(requested.has_value());
  const auto& connection = requested.value().connection;
  CHECK(connection.status == domain::ConnectionStatus::kPending);
  // Scored the way the feed scores it, heuristic goal alignment included.
  CHECK_THAT(connection.provider_score, WithinAbs(76.7, 1e-9));
  CHECK_THAT(connection.seeker_score, WithinAbs(71.5, 1e-9));
  CHECK_THAT(connection.bilateral_score, WithinAbs(74.6, 1e-9));
  REQUIRE(connection.goal_alignment.has_value());
  CHECK_THAT(*connection.goal_alignment, WithinAbs(0.8, 1e-9));
  CHECK(connection.created_at == "2026-02-01T09:00:00Z");
  CHECK(connection.provider_decided_at == std::optional<std::string>{"2026-02-01T09:00:00Z"});
  CHECK(h.event_types(requested.value().trace_id) ==
        std::vector<std::string>{"GoalAlignmentFallback", "ConnectionRequested"});

  const auto requested_events = h.audit_log.query(requested.value().trace_id);
  const auto requested_payload = nlohmann::json::parse(requested_events.back().payload);
  CHECK(requested_payload["scores_source"] == "computed");
  CHECK(requested_payload["goal_alignment"] == 0.8);

  SECTION("stored connection keeps the goal alignment") {
    const auto stored = h.connections.get(provider, seeker);
    REQUIRE(stored.has_value());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->goal_alignment == std::optional<double>{0.8});
  }

  SECTION("duplicate request is a conflict") {
    const auto again = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == app::AppErrorCode::kConflict);
  }

  SECTION("seeker accepts") {
    core::FixedClock respond_time("2026-02-02T10:00:00Z");
    const auto responded = app::respond_to_connection(
        provider, seeker, domain::Party::kSeeker, domain::ConnectionResponse::kAccepted,
        h.services, h.id_gen, respond_time);
    REQUIRE(responded.has_value());
    CHECK(responded.value().connection.status == domain::ConnectionStatus::kAccepted);
    CHECK(responded.value().connection.seeker_decided_at ==
          std::optional<std::string>{"2026-02-02T10:00:00Z"});
    CHECK(responded.value().connection.provider_decided_at ==
          std::optional<std::string>{"2026-02-01T09:00:00Z"});

    const auto stored = h.connections.get(provider, seeker);
    REQUIRE(stored.has_value());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->status == domain::ConnectionStatus::kAccepted);

    const auto events = app::fetch_audit_trace(responded.value().trace_id, h.services);
    REQUIRE(events.size() == 1);
    CHECK(events[0].event_type == "ConnectionResponded");
    const auto payload = nlohmann::json::parse(events[0].payload);
    CHECK(payload["responder"] == "seeker");
    CHECK(payload["status"] == "accepted");
  }

  SECTION("responding to a missing connection") {
    const auto responded = app::respond_to_connection(
        provider, core::SeekerId{"s-2"}, domain::Party::kSeeker,
        domain::ConnectionResponse::kDeclined, h.services, h.id_gen, h.clock);
    REQUIRE_FALSE(responded.has_value());
    CHECK(responded.error().code == app::AppErrorCode::kNotFound);
  }

  SECTION("unknown profiles") {
    req.provider_id = core::ProviderId{"p-404"};
    const auto missing = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == app::AppErrorCode::kNotFound);
  }
}

TEST_CASE("request_connection records the scores the provider saw", "[app][connections]") {
  Harness h;

  app::ConnectRequest req;
  req.provider_id = core::ProviderId{"p-1"};
  req.seeker_id = core::SeekerId{"s-2"};
  req.shown = app::ShownScores{
      .provider_score = 81.0,
      .seeker_score = 64.5,
      .bilateral_score = 74.2,
      .goal_alignment = 0.6,
  };

  SECTION("stored verbatim without rescoring") {
    const auto result = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    CHECK(h.event_types(result.value().trace_id) ==
          std::vector<std::string>{"ConnectionRequested"});

    const auto stored = h.connections.get(req.provider_id, req.seeker_id);
    REQUIRE(stored.has_value());
    REQUIRE(stored.value().has_value());
    const auto& connection = *stored.value();
    CHECK(connection.provider_score == 81.0);
    CHECK(connection.seeker_score == 64.5);
    CHECK(connection.bilateral_score == 74.2);
    CHECK(connection.goal_alignment == std::optional<double>{0.6});
  }

  SECTION("score above 100 is rejected") {
    req.shown->bilateral_score = 100.5;
    const auto result = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kInvalidArgument);
    CHECK(h.connections.list_for_provider(req.provider_id).value().empty());
  }

  SECTION("goal alignment above 1 is rejected") {
    req.shown->goal_alignment = 1.5;
    const auto result = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == app::AppErrorCode::kInvalidArgument);
  }

  SECTION("rescoring honours the goal weight") {
    req.shown.reset();
    req.goal_weight = 10.0;
    const auto result = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    CHECK_THAT(result.value().connection.bilateral_score, WithinAbs(75.7, 1e-9));
  }

  SECTION("ineligible pair stores zero scores and no goal") {
    auto unrelated = testing::make_seeker("s-9");
    unrelated.help_needed = {"Networking"};
    REQUIRE(h.profiles.upsert_seeker(unrelated).has_value());

    req.shown.reset();
    req.seeker_id = core::SeekerId{"s-9"};
    const auto result = app::request_connection(req, h.services, h.engine, h.id_gen, h.clock);
    REQUIRE(result.has_value());
    CHECK(result.value().connection.bilateral_score == 0.0);
    CHECK_FALSE(result.value().connection.goal_alignment.has_value());
    CHECK(h.event_types(result.value().trace_id) ==
          std::vector<std::string>{"ConnectionRequested"});
  }
}

TEST_CASE("connection listings", "[app][connections]") {
  Harness h;
  auto second = testing::make_provider("p-2");
  second.name = "Lee Mentor";
  second.current_employer = "Stripe";
  REQUIRE(h.profiles.upsert_provider(second).has_value());

  REQUIRE(h.connections.insert(stored_connection("p-1", "s-1", "2026-02-01T09:00:00Z")).has_value());
  REQUIRE(h.connections.insert(stored_connection("p-1", "s-2", "2026-02-03T09:00:00Z")).has_value());
  REQUIRE(h.connections.insert(stored_connection("p-1", "s-3", "2026-02-01T09:00:00Z")).has_value());
  REQUIRE(h.connections.insert(stored_connection("p-2", "s-1", "2026-02-02T09:00:00Z")).has_value());

  SECTION("sent is newest first with ties by seeker id") {
    const auto sent = app::list_sent_connections(core::ProviderId{"p-1"}, h.services);
    REQUIRE(sent.has_value());
    std::vector<std::string> order;
    for (const auto& summary : sent.value()) {
      order.push_back(summary.counterpart_id);
    }
    CHECK(order == std::vector<std::string>{"s-2", "s-1", "s-3"});
    CHECK(sent.value()[0].counterpart_name == "Sam Seeker");
    CHECK(sent.value()[0].counterpart_employer == "Acme");
  }

  SECTION("received carries the provider card") {
    const auto received = app::list_received_connections(core::SeekerId{"s-1"}, h.services);
    REQUIRE(received.has_value());
    REQUIRE(received.value().size() == 2);
    CHECK(received.value()[0].counterpart_id == "p-2");
    CHECK(received.value()[0].counterpart_name == "Lee Mentor");
    CHECK(received.value()[0].counterpart_employer == "Stripe");
    CHECK(received.value()[1].counterpart_id == "p-1");
  }

  SECTION("received skips connections the provider never sent") {
    auto draft = stored_connection("p-2", "s-2", "2026-02-04T09:00:00Z");
    draft.provider_decided_at.reset();
    REQUIRE(h.connections.insert(draft).has_value());

    const auto received = app::list_received_connections(core::SeekerId{"s-2"}, h.services);
    REQUIRE(received.has_value());
    REQUIRE(received.value().size() == 1);
    CHECK(received.value()[0].counterpart_id == "p-1");
  }

  SECTION("missing counterpart reads Unknown") {
    REQUIRE(h.connections.insert(stored_connection("p-1", "s-gone", "2026-02-05T09:00:00Z"))
                .has_value());
    const auto sent = app::list_sent_connections(core::ProviderId{"p-1"}, h.services);
    REQUIRE(sent.has_value());
    REQUIRE(sent.value().size() == 4);
    CHECK(sent.value()[0].counterpart_id == "s-gone");
    CHECK(sent.value()[0].counterpart_name == "Unknown");
    CHECK(sent.value()[0].counterpart_role.empty());
  }

  SECTION("nothing sent") {
    const auto sent = app::list_sent_connections(core::ProviderId{"p-404"}, h.services);
    REQUIRE(sent.has_value());
    CHECK(sent.value().empty());
  }

  SECTION("unreadable store") {
    UnavailableConnectionRepository unavailable;
    core::Services services{h.profiles, unavailable, h.audit_log};
    const auto sent = app::list_sent_connections(core::ProviderId{"p-1"}, services);
    REQUIRE_FALSE(sent.has_value());
    CHECK(sent.error().code == app::AppErrorCode::kStorage);
  }
}

TEST_CASE("fetch_audit_trace for an unknown trace is empty", "[app][audit]") {
  Harness h;
  CHECK(app::fetch_audit_trace("trace-none", h.services).empty());
}
