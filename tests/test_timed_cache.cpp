/**
 * @file test_timed_cache.cpp
 * @brief Tests for timed_cache.hpp
 */

#include "vmesh/timed_cache.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("timed_cache - InsertIfAbsent rejects repeats", "[timed_cache]") {
  vmesh::TimedCache cache;
  REQUIRE(cache.InsertIfAbsent("m1", 0));
  REQUIRE_FALSE(cache.InsertIfAbsent("m1", 10));
  REQUIRE(cache.Contains("m1"));
  REQUIRE(cache.Size() == 1U);
}

TEST_CASE("timed_cache - TryAcquire enforces minimum interval", "[timed_cache]") {
  vmesh::TimedCache cache;
  REQUIRE(cache.TryAcquire("10.0.0.2", 1000, 5000));
  REQUIRE_FALSE(cache.TryAcquire("10.0.0.2", 5999, 5000));
  REQUIRE(cache.TryAcquire("10.0.0.2", 6000, 5000));
  // Restamped at 6000.
  REQUIRE_FALSE(cache.TryAcquire("10.0.0.2", 10000, 5000));
  REQUIRE(cache.TryAcquire("10.0.0.3", 10000, 5000));
}

TEST_CASE("timed_cache - sweep removes only entries past retention", "[timed_cache]") {
  vmesh::TimedCache cache;
  cache.InsertIfAbsent("old", 0);
  cache.InsertIfAbsent("edge", 40000);
  cache.InsertIfAbsent("new", 90000);

  REQUIRE(cache.Sweep(100000, 60000) == 1U);
  REQUIRE_FALSE(cache.Contains("old"));
  REQUIRE(cache.Contains("edge"));
  REQUIRE(cache.Contains("new"));

  // After sweeping, the id is accepted again.
  REQUIRE(cache.InsertIfAbsent("old", 100000));
}

TEST_CASE("timed_cache - clear empties the cache", "[timed_cache]") {
  vmesh::TimedCache cache;
  cache.InsertIfAbsent("a", 1);
  cache.InsertIfAbsent("b", 1);
  cache.Clear();
  REQUIRE(cache.Size() == 0U);
}
