#include "beacon/storage/sqlite/sqlite_audit_log.h"
#include "beacon/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace beacon;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_db(const std::string& path) {
  auto db_result = storage::sqlite::SqliteDb::open(path);
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v2().has_value());
  return db;
}

}  // namespace

TEST_CASE("SqliteAuditLog append and query", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_db(":memory:"));

  const std::string trace_id = "trace-001";
  audit_log.append(
      {"evt-001", trace_id, "FeedStarted", R"({"provider_id":"p-1"})", "2026-01-01T00:00:00Z",
       {"p-1"}});
  audit_log.append({"evt-002", trace_id, "GoalAlignmentFallback", R"({"cause":"timeout"})",
                    "2026-01-01T00:00:01Z", {"p-1", "s-1"}});
  audit_log.append({"evt-003", trace_id, "FeedCompleted", R"({"status":"completed"})",
                    "2026-01-01T00:00:02Z", {}});

  const auto events = audit_log.query(trace_id);
  REQUIRE(events.size() == 3);

  CHECK(events[0].event_id == "evt-001");
  CHECK(events[1].event_id == "evt-002");
  CHECK(events[2].event_id == "evt-003");

  CHECK(events[1].event_type == "GoalAlignmentFallback");
  CHECK(events[1].payload == R"({"cause":"timeout"})");
  CHECK(events[1].created_at == "2026-01-01T00:00:01Z");
  REQUIRE(events[1].refs.size() == 2);
  CHECK(events[1].refs[1] == "s-1");
  CHECK(events[2].refs.empty());
}

TEST_CASE("SqliteAuditLog multiple traces", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_db(":memory:"));

  audit_log.append({"evt-1a", "trace-A", "ScoreStarted", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-1b", "trace-B", "ScoreStarted", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-2a", "trace-A", "PairScored", "{}", "2026-01-01T00:00:01Z", {}});

  const auto events_a = audit_log.query("trace-A");
  REQUIRE(events_a.size() == 2);
  CHECK(events_a[0].event_id == "evt-1a");
  CHECK(events_a[1].event_id == "evt-2a");

  const auto events_b = audit_log.query("trace-B");
  REQUIRE(events_b.size() == 1);
  CHECK(events_b[0].event_id == "evt-1b");

  SECTION("empty trace id returns everything in append order") {
    const auto all = audit_log.query("");
    REQUIRE(all.size() == 3);
    CHECK(all[0].event_id == "evt-1a");
    CHECK(all[1].event_id == "evt-1b");
    CHECK(all[2].event_id == "evt-2a");
  }

  SECTION("unknown trace is empty") {
    CHECK(audit_log.query("trace-Z").empty());
  }
}

TEST_CASE("SqliteAuditLog continues a trace after reopening", "[sqlite][audit]") {
  const auto path = std::filesystem::temp_directory_path() / "beacon_test_audit.db";
  std::filesystem::remove(path);

  {
    storage::sqlite::SqliteAuditLog audit_log(open_db(path.string()));
    audit_log.append({"evt-1", "trace-R", "FeedStarted", "{}", "2026-01-01T00:00:00Z", {}});
    audit_log.append({"evt-2", "trace-R", "FeedCompleted", "{}", "2026-01-01T00:00:01Z", {}});
  }

  storage::sqlite::SqliteAuditLog reopened(open_db(path.string()));
  reopened.append({"evt-3", "trace-R", "ConnectionRequested", "{}", "2026-01-01T00:00:02Z", {}});

  const auto events = reopened.query("trace-R");
  REQUIRE(events.size() == 3);
  CHECK(events[0].event_id == "evt-1");
  CHECK(events[2].event_id == "evt-3");

  std::filesystem::remove(path);
}

TEST_CASE("InMemoryAuditLog", "[audit]") {
  storage::InMemoryAuditLog audit_log;
  audit_log.append({"evt-1", "trace-A", "ScoreStarted", "{}", "t0", {}});
  audit_log.append({"evt-2", "trace-B", "ScoreStarted", "{}", "t0", {}});
  audit_log.append({"evt-3", "trace-A", "PairScored", "{}", "t1", {"p-1", "s-1"}});

  const auto events = audit_log.query("trace-A");
  REQUIRE(events.size() == 2);
  CHECK(events[1].event_id == "evt-3");
  CHECK(events[1].refs.size() == 2);
  CHECK(audit_log.query("").size() == 3);
}
