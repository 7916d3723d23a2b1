/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "vmesh/timer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

// ============================================================================
// Basic API Tests
// ============================================================================

TEST_CASE("TimerScheduler Add and Remove", "[timer]") {
  vmesh::TimerScheduler sched(4);

  auto result = sched.Add(100, [](void*) {}, nullptr);
  REQUIRE(result.has_value());
  REQUIRE(result.value().value() > 0);
  REQUIRE(sched.TaskCount() == 1U);

  REQUIRE(sched.Remove(result.value()).has_value());
  REQUIRE(sched.TaskCount() == 0U);

  auto again = sched.Remove(result.value());
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == vmesh::TimerError::kNotFound);
}

TEST_CASE("TimerScheduler invalid period", "[timer]") {
  vmesh::TimerScheduler sched(4);
  auto result = sched.Add(0, [](void*) {}, nullptr);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == vmesh::TimerError::kInvalidPeriod);

  auto no_fn = sched.Add(10, nullptr, nullptr);
  REQUIRE(!no_fn.has_value());
}

TEST_CASE("TimerScheduler slots full", "[timer]") {
  vmesh::TimerScheduler sched(2);
  REQUIRE(sched.Add(100, [](void*) {}).has_value());
  REQUIRE(sched.Add(100, [](void*) {}).has_value());
  auto r3 = sched.Add(100, [](void*) {});
  REQUIRE(!r3.has_value());
  REQUIRE(r3.get_error() == vmesh::TimerError::kSlotsFull);
}

TEST_CASE("TimerScheduler Start/Stop", "[timer]") {
  vmesh::TimerScheduler sched(4);
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.IsRunning());

  auto start2 = sched.Start();
  REQUIRE(!start2.has_value());
  REQUIRE(start2.get_error() == vmesh::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE(!sched.IsRunning());
  sched.Stop();  // idempotent
}

// ============================================================================
// Firing
// ============================================================================

TEST_CASE("TimerScheduler periodic task fires repeatedly", "[timer]") {
  std::atomic<int> count{0};
  vmesh::TimerScheduler sched(4);
  REQUIRE(sched.Add(20, [](void* ctx) {
    static_cast<std::atomic<int>*>(ctx)->fetch_add(1);
  }, &count).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  sched.Stop();
  REQUIRE(count.load() >= 3);
}

TEST_CASE("TimerScheduler zero initial delay fires immediately", "[timer]") {
  std::atomic<int> count{0};
  vmesh::TimerScheduler sched(4);
  REQUIRE(sched.Add(10000, [](void* ctx) {
    static_cast<std::atomic<int>*>(ctx)->fetch_add(1);
  }, &count, 0).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  sched.Stop();
  REQUIRE(count.load() == 1);
}

TEST_CASE("TimerScheduler removed task stops firing", "[timer]") {
  std::atomic<int> count{0};
  vmesh::TimerScheduler sched(4);
  auto id = sched.Add(20, [](void* ctx) {
    static_cast<std::atomic<int>*>(ctx)->fetch_add(1);
  }, &count);
  REQUIRE(id.has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(sched.Remove(id.value()).has_value());
  int snapshot = count.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  sched.Stop();
  REQUIRE(count.load() <= snapshot + 1);
}

TEST_CASE("TimerScheduler callback may remove itself", "[timer]") {
  struct Ctx {
    vmesh::TimerScheduler* sched;
    vmesh::TimerTaskId id;
    std::atomic<int> fired{0};
  };
  vmesh::TimerScheduler sched(4);
  Ctx ctx;
  ctx.sched = &sched;
  auto id = sched.Add(10, [](void* p) {
    auto* c = static_cast<Ctx*>(p);
    c->fired.fetch_add(1);
    (void)c->sched->Remove(c->id);
  }, &ctx);
  REQUIRE(id.has_value());
  ctx.id = id.value();
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  sched.Stop();
  REQUIRE(ctx.fired.load() == 1);
  REQUIRE(sched.TaskCount() == 0U);
}

TEST_CASE("TimerScheduler restarts after a callback stopped it", "[timer]") {
  struct Ctx {
    vmesh::TimerScheduler* sched;
    std::atomic<bool> stop_once{true};
    std::atomic<int> fired{0};
  };
  vmesh::TimerScheduler sched(4);
  Ctx ctx;
  ctx.sched = &sched;
  auto id = sched.Add(10, [](void* p) {
    auto* c = static_cast<Ctx*>(p);
    c->fired.fetch_add(1);
    if (c->stop_once.exchange(false)) c->sched->Stop();
  }, &ctx, 0);
  REQUIRE(id.has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  REQUIRE(!sched.IsRunning());
  REQUIRE(ctx.fired.load() == 1);

  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  sched.Stop();
  REQUIRE(ctx.fired.load() > 1);
}
