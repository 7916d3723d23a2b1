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
 * @file timed_cache.hpp
 * @brief Time-stamped key set swept on the maintenance cycle.
 *
 * Backs the duplicate-message filter (message id -> first seen) and the
 * discovery-response limiter (sender address -> last response).
 */

#ifndef VMESH_TIMED_CACHE_HPP_
#define VMESH_TIMED_CACHE_HPP_

#include "vmesh/platform.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vmesh {

class TimedCache {
 public:
  /**
   * @brief Record @p key at @p now_ms unless already present.
   * @return true when the key was newly inserted.
   */
  bool InsertIfAbsent(const std::string& key, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.emplace(key, now_ms).second;
  }

  bool Contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) != 0;
  }

  /**
   * @brief Rate gate: succeeds when @p key is absent or its stamp is at
   *        least @p min_interval_ms old, and then restamps it.
   */
  bool TryAcquire(const std::string& key, int64_t now_ms,
                  uint32_t min_interval_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() &&
        now_ms - it->second < static_cast<int64_t>(min_interval_ms)) {
      return false;
    }
    entries_[key] = now_ms;
    return true;
  }

  /** @return Number of entries older than @p retention_ms removed. */
  uint32_t Sweep(int64_t now_ms, uint32_t retention_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now_ms - it->second > static_cast<int64_t>(retention_ms)) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, int64_t> entries_;
};

}  // namespace vmesh

#endif  // VMESH_TIMED_CACHE_HPP_
