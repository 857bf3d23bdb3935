#include "beacon/core/clock.h"
#include "beacon/core/id_generator.h"
#include "beacon/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <set>

TEST_CASE("ID generators produce prefixed values", "[ids]") {
  SECTION("SystemIdGenerator ids are unique") {
    beacon::core::SystemIdGenerator gen;
    const auto first = gen.next("trace");
    const auto second = gen.next("trace");

    REQUIRE(first.starts_with("trace-"));
    REQUIRE(first != second);
  }

  SECTION("DeterministicIdGenerator shares one counter across prefixes") {
    beacon::core::DeterministicIdGenerator gen;
    CHECK(gen.next("trace") == "trace-0");
    CHECK(gen.next("evt") == "evt-1");
    CHECK(gen.next("evt") == "evt-2");
  }

  SECTION("same call sequence yields the same ids") {
    beacon::core::DeterministicIdGenerator a;
    beacon::core::DeterministicIdGenerator b;
    CHECK(a.next("evt") == b.next("evt"));
    CHECK(a.next("trace") == b.next("trace"));
  }
}

TEST_CASE("strong ids order by value", "[ids]") {
  const std::set<beacon::core::SeekerId> ids{{"s-b"}, {"s-a"}, {"s-0"}};
  REQUIRE(ids.size() == 3);
  CHECK(ids.begin()->value == "s-0");
  CHECK(beacon::core::ProviderId{"p-1"} == beacon::core::ProviderId{"p-1"});
}

TEST_CASE("clocks", "[clock]") {
  beacon::core::FixedClock fixed("2026-01-01T00:00:00Z");
  CHECK(fixed.now_iso8601() == "2026-01-01T00:00:00Z");

  beacon::core::SystemClock system;
  const auto now = system.now_iso8601();
  REQUIRE(now.size() == 20);
  CHECK(now.back() == 'Z');
  CHECK(now[10] == 'T');
}
