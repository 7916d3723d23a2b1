/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file timer.hpp
 * @brief Periodic task scheduler driven by one background thread.
 *
 * Drives the discovery, heartbeat and maintenance cycles of a mesh session.
 * Callbacks run on the scheduler thread, outside the internal lock, so a
 * callback may Add() or Remove() tasks. Stop() wakes the thread at once.
 */

#ifndef VMESH_TIMER_HPP_
#define VMESH_TIMER_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace vmesh {

using TimerTaskFn = void (*)(void* ctx);

struct TimerTaskId {
  uint32_t id = 0;
  uint32_t value() const noexcept { return id; }
  bool operator==(const TimerTaskId& o) const noexcept { return id == o.id; }
};

class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 16) : slots_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  /**
   * @brief Register a periodic task.
   *
   * @param period_ms         Firing period, must be > 0.
   * @param fn                Callback run on the scheduler thread.
   * @param ctx               Forwarded to @p fn.
   * @param initial_delay_ms  Delay before the first firing; 0 fires on the
   *                          next scheduler round.
   * @return kInvalidPeriod or kSlotsFull on failure.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr,
                                        uint32_t initial_delay_ms = UINT32_MAX) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }
    uint32_t first = (initial_delay_ms == UINT32_MAX) ? period_ms
                                                       : initial_delay_ms;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& slot : slots_) {
        if (slot.active) continue;
        slot.fn = fn;
        slot.ctx = ctx;
        slot.period = std::chrono::milliseconds(period_ms);
        slot.next_fire = Clock::now() + std::chrono::milliseconds(first);
        slot.id = next_id_++;
        slot.active = true;
        TimerTaskId id;
        id.id = slot.id;
        cv_.notify_all();
        return expected<TimerTaskId, TimerError>::success(id);
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotFound);
  }

  expected<void, TimerError> Start() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    // A Stop() issued from a task leaves the finished thread unjoined.
    if (worker_.joinable()) {
      if (worker_.get_id() == std::this_thread::get_id()) {
        return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
      }
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /** @brief Wake and join the scheduler thread. Safe when not running. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    Clock::duration period{};
    Clock::time_point next_fire{};
    uint32_t id = 0;
    bool active = false;
  };

  struct Due {
    TimerTaskFn fn;
    void* ctx;
    uint32_t id;
  };

  void ScheduleLoop() {
    std::vector<Due> due;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      Clock::time_point now = Clock::now();
      Clock::time_point wake = now + std::chrono::milliseconds(100);
      due.clear();

      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire) {
          due.push_back(Due{slot.fn, slot.ctx, slot.id});
          // Skip missed periods rather than firing in a burst.
          while (slot.next_fire <= now) slot.next_fire += slot.period;
        }
        if (slot.next_fire < wake) wake = slot.next_fire;
      }

      if (!due.empty()) {
        lock.unlock();
        for (const Due& d : due) {
          if (!running_.load(std::memory_order_acquire)) break;
          if (IsActive(d.id)) d.fn(d.ctx);
        }
        lock.lock();
        continue;
      }

      cv_.wait_until(lock, wake, [this] {
        return !running_.load(std::memory_order_acquire);
      });
    }
  }

  bool IsActive(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& slot : slots_) {
      if (slot.active && slot.id == id) return true;
    }
    return false;
  }

  std::vector<TaskSlot> slots_;
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace vmesh

#endif  // VMESH_TIMER_HPP_
