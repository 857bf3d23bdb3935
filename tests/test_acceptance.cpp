#include "beacon/matching/acceptance.h"

#include <catch2/catch_test_macros.hpp>

using beacon::matching::estimate_acceptance;

TEST_CASE("estimate_acceptance buckets", "[acceptance]") {
  CHECK(estimate_acceptance(100.0) == 0.95);
  CHECK(estimate_acceptance(90.0) == 0.95);
  CHECK(estimate_acceptance(89.9) == 0.85);
  CHECK(estimate_acceptance(80.0) == 0.85);
  CHECK(estimate_acceptance(70.0) == 0.70);
  CHECK(estimate_acceptance(69.3) == 0.50);
  CHECK(estimate_acceptance(50.0) == 0.30);
  CHECK(estimate_acceptance(40.0) == 0.20);
  CHECK(estimate_acceptance(39.9) == 0.10);
  CHECK(estimate_acceptance(0.0) == 0.10);
}
