/**
 * @file test_autoscaler.cpp
 * @brief Catch2 tests for flux::Autoscaler.
 */

#include "flux/autoscaler.hpp"

#include <catch2/catch_test_macros.hpp>

namespace {

flux::Autoscaler Make(int64_t min, int64_t max, int64_t current) {
  flux::Autoscaler s;
  s.min_workers = min;
  s.max_workers = max;
  s.current_workers = current;
  return s;
}

}  // namespace

TEST_CASE("Autoscaler holds while a change is in flight", "[autoscaler]") {
  auto s = Make(4, 100, 10);
  s.change_pending = true;
  REQUIRE(s.Evaluate(10, 50) == 0);
  REQUIRE(s.Evaluate(0, 0) == 0);
}

TEST_CASE("Autoscaler shrinks an idle pool to min", "[autoscaler]") {
  REQUIRE(Make(4, 100, 30).Evaluate(0, 0) == -26);
  REQUIRE(Make(4, 100, 4).Evaluate(0, 0) == 0);
  // Waiting submitters are not idle.
  REQUIRE(Make(4, 100, 30).Evaluate(0, 1) == 0);
}

TEST_CASE("Autoscaler grows a saturated pool by 20 percent", "[autoscaler]") {
  REQUIRE(Make(4, 100, 50).Evaluate(50, 3) == 10);
  REQUIRE(Make(4, 100, 10).Evaluate(10, 0) == 2);
}

TEST_CASE("Autoscaler grows by at least one worker", "[autoscaler]") {
  REQUIRE(Make(1, 10, 1).Evaluate(1, 0) == 1);
  REQUIRE(Make(4, 100, 4).Evaluate(4, 1) == 1);
}

TEST_CASE("Autoscaler never exceeds max", "[autoscaler]") {
  REQUIRE(Make(4, 100, 95).Evaluate(95, 10) == 5);
  REQUIRE(Make(4, 100, 100).Evaluate(100, 10) == 0);
  REQUIRE(Make(1, 1, 1).Evaluate(1, 5) == 0);
}

TEST_CASE("Autoscaler leaves a partly busy pool alone", "[autoscaler]") {
  REQUIRE(Make(4, 100, 20).Evaluate(5, 0) == 0);
}
