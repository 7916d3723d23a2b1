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
 * @file worker_pool.hpp
 * @brief Fixed set of worker threads draining a bounded task queue.
 *
 *   Submit() -> bounded deque (mutex + cv) -> Worker[0..N-1] -> Handler
 *
 * - Function pointer handler with user context (no std::function)
 * - Submit never blocks: a full queue is reported as kQueueFull
 * - WaitIdle() blocks until every accepted task has run
 * - Shutdown() drains the queue, then joins
 *
 * @tparam Task Movable task type handed to the handler.
 */

#ifndef VMESH_WORKER_POOL_HPP_
#define VMESH_WORKER_POOL_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace vmesh {

struct WorkerPoolConfig {
  const char* name = "pool";
  uint32_t worker_num = 2;
  uint32_t queue_depth = 256;
};

struct WorkerPoolStats {
  uint64_t submitted{0U};
  uint64_t processed{0U};
  uint64_t rejected{0U};
};

template <typename Task>
class WorkerPool {
 public:
  using Handler = void (*)(Task& task, void* ctx);

  explicit WorkerPool(const WorkerPoolConfig& cfg) noexcept
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : 1U),
        queue_depth_(cfg.queue_depth > 0U ? cfg.queue_depth : 1U) {}

  ~WorkerPool() { Shutdown(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  /** @brief Must be called before Start(). Handler runs on worker threads. */
  void SetHandler(Handler handler, void* ctx) noexcept {
    handler_ = handler;
    handler_ctx_ = ctx;
  }

  expected<void, PoolError> Start() {
    if (handler_ == nullptr) {
      return expected<void, PoolError>::error(PoolError::kNoHandler);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return expected<void, PoolError>::error(PoolError::kAlreadyRunning);
    }
    running_ = true;
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
    return expected<void, PoolError>::success();
  }

  /** @brief Stop accepting tasks, run what is queued, join all workers. */
  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_) return;
      running_ = false;
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
    threads_.clear();
  }

  expected<void, PoolError> Submit(Task task) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_) {
        rejected_.fetch_add(1U, std::memory_order_relaxed);
        return expected<void, PoolError>::error(PoolError::kNotRunning);
      }
      if (queue_.size() >= queue_depth_) {
        rejected_.fetch_add(1U, std::memory_order_relaxed);
        return expected<void, PoolError>::error(PoolError::kQueueFull);
      }
      queue_.push_back(std::move(task));
      ++pending_;
    }
    submitted_.fetch_add(1U, std::memory_order_relaxed);
    work_cv_.notify_one();
    return expected<void, PoolError>::success();
  }

  /** @brief Block until the queue is empty and no task is running. */
  void WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0U; });
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  uint32_t Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
  }

  WorkerPoolStats GetStats() const noexcept {
    WorkerPoolStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    return s;
  }

  const char* Name() const noexcept { return name_; }

 private:
  void WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
      work_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (queue_.empty()) break;  // stopped and drained

      Task task = std::move(queue_.front());
      queue_.pop_front();
      lock.unlock();
      handler_(task, handler_ctx_);
      processed_.fetch_add(1U, std::memory_order_relaxed);
      lock.lock();

      if (--pending_ == 0U) idle_cv_.notify_all();
    }
  }

  const char* name_;
  const uint32_t worker_num_;
  const uint32_t queue_depth_;
  Handler handler_ = nullptr;
  void* handler_ctx_ = nullptr;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  uint32_t pending_ = 0U;
  bool running_ = false;
  std::vector<std::thread> threads_;

  std::atomic<uint64_t> submitted_{0U};
  std::atomic<uint64_t> processed_{0U};
  std::atomic<uint64_t> rejected_{0U};
};

}  // namespace vmesh

#endif  // VMESH_WORKER_POOL_HPP_
