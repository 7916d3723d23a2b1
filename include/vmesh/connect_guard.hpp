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
 * @file connect_guard.hpp
 * @brief Gate for direct-connect attempts.
 *
 * At most one attempt is in flight. Each address has a cool-down between
 * attempts. An attempt ends either by Confirm() (a DISCOVERY arrived from
 * the pending address) or by ExpireIfOverdue() once the timeout elapses.
 */

#ifndef VMESH_CONNECT_GUARD_HPP_
#define VMESH_CONNECT_GUARD_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vmesh {

enum class ConnectError : uint8_t {
  kInProgress = 0,   ///< Another attempt is still pending.
  kCoolingDown,      ///< Same address attempted too recently.
  kSelfAddress,      ///< Address belongs to this host.
  kRecentlySeen,     ///< Peer already heard from within the debounce window.
  kNotRunning,
};

inline const char* ConnectErrorName(ConnectError e) noexcept {
  switch (e) {
    case ConnectError::kInProgress:   return "connection already in progress";
    case ConnectError::kCoolingDown:  return "cooling down";
    case ConnectError::kSelfAddress:  return "own address";
    case ConnectError::kRecentlySeen: return "recently seen";
    case ConnectError::kNotRunning:   return "mesh not running";
  }
  return "unknown";
}

class ConnectGuard {
 public:
  ConnectGuard(uint32_t cooldown_ms, uint32_t timeout_ms) noexcept
      : cooldown_ms_(cooldown_ms), timeout_ms_(timeout_ms) {}

  expected<void, ConnectError> TryBegin(const std::string& address,
                                        int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_progress_) {
      return expected<void, ConnectError>::error(ConnectError::kInProgress);
    }
    auto it = last_attempt_.find(address);
    if (it != last_attempt_.end() &&
        now_ms - it->second < static_cast<int64_t>(cooldown_ms_)) {
      return expected<void, ConnectError>::error(ConnectError::kCoolingDown);
    }
    last_attempt_[address] = now_ms;
    in_progress_ = true;
    pending_ = address;
    started_ms_ = now_ms;
    return expected<void, ConnectError>::success();
  }

  /** @return true when @p address was the pending attempt. */
  bool Confirm(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_progress_ || pending_ != address) return false;
    in_progress_ = false;
    pending_.clear();
    return true;
  }

  /**
   * @brief Clear an attempt older than the timeout and forget addresses
   *        whose cooldown has passed.
   * @param expired  Receives the abandoned address (may be nullptr).
   */
  bool ExpireIfOverdue(int64_t now_ms, std::string* expired) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = last_attempt_.begin(); it != last_attempt_.end();) {
      if (now_ms - it->second >= static_cast<int64_t>(cooldown_ms_)) {
        it = last_attempt_.erase(it);
      } else {
        ++it;
      }
    }
    if (!in_progress_ ||
        now_ms - started_ms_ < static_cast<int64_t>(timeout_ms_)) {
      return false;
    }
    if (expired != nullptr) *expired = pending_;
    in_progress_ = false;
    pending_.clear();
    return true;
  }

  bool InProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_progress_;
  }

  /** @brief Addresses still inside their cooldown window. */
  uint32_t TrackedAddresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(last_attempt_.size());
  }

  std::string PendingAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_progress_ = false;
    pending_.clear();
    last_attempt_.clear();
  }

 private:
  const uint32_t cooldown_ms_;
  const uint32_t timeout_ms_;
  mutable std::mutex mutex_;
  bool in_progress_ = false;
  std::string pending_;
  int64_t started_ms_ = 0;
  std::unordered_map<std::string, int64_t> last_attempt_;
};

}  // namespace vmesh

#endif  // VMESH_CONNECT_GUARD_HPP_
