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
 * @file node_table.hpp
 * @brief Concurrent tables of known peers and next-hop routes.
 *
 * Both tables lock internally; callers never hold a lock across calls.
 * Ages are compared against caller-supplied monotonic timestamps so the
 * tables stay deterministic under test.
 */

#ifndef VMESH_NODE_TABLE_HPP_
#define VMESH_NODE_TABLE_HPP_

#include "vmesh/platform.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vmesh {

// ============================================================================
// Node / Route
// ============================================================================

struct Node {
  std::string node_id;
  std::string display_name;
  std::string address;
  uint16_t port = 0;        ///< Control port; audio is port + 1.
  bool is_direct = true;
  int64_t last_seen_ms = 0;
  uint32_t hop_count = 1;
};

struct Route {
  std::string destination_id;
  std::string next_hop_id;  ///< Equals destination_id for one-hop routes.
  uint32_t hop_count = 1;
  int64_t last_updated_ms = 0;
};

// ============================================================================
// NodeTable
// ============================================================================

class NodeTable {
 public:
  /**
   * @brief Insert or overwrite a node (last write wins).
   * @return true when the node id was not known before.
   */
  bool Upsert(const Node& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(node.node_id);
    if (it == nodes_.end()) {
      nodes_.emplace(node.node_id, node);
      return true;
    }
    it->second = node;
    return false;
  }

  /** @brief Refresh last_seen only. @return false for an unknown id. */
  bool Touch(const std::string& node_id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return false;
    it->second.last_seen_ms = now_ms;
    return true;
  }

  bool Find(const std::string& node_id, Node* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return false;
    if (out != nullptr) *out = it->second;
    return true;
  }

  /// Most recently seen node at @p address, if any.
  bool FindByAddress(const std::string& address, Node* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Node* best = nullptr;
    for (const auto& kv : nodes_) {
      if (kv.second.address == address &&
          (best == nullptr || kv.second.last_seen_ms > best->last_seen_ms)) {
        best = &kv.second;
      }
    }
    if (best == nullptr) return false;
    if (out != nullptr) *out = *best;
    return true;
  }

  bool Remove(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.erase(node_id) > 0;
  }

  std::vector<Node> Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Node> out;
    out.reserve(nodes_.size());
    for (const auto& kv : nodes_) out.push_back(kv.second);
    return out;
  }

  std::vector<std::string> Addresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(nodes_.size());
    for (const auto& kv : nodes_) out.push_back(kv.second.address);
    return out;
  }

  /**
   * @brief Drop nodes with now - last_seen > timeout.
   * @return Ids of the removed nodes.
   */
  std::vector<std::string> EvictExpired(int64_t now_ms, uint32_t timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> removed;
    for (auto it = nodes_.begin(); it != nodes_.end();) {
      if (now_ms - it->second.last_seen_ms > static_cast<int64_t>(timeout_ms)) {
        removed.push_back(it->first);
        it = nodes_.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(nodes_.size());
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Node> nodes_;
};

// ============================================================================
// RouteTable
// ============================================================================

class RouteTable {
 public:
  void Upsert(const Route& route) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[route.destination_id] = route;
  }

  bool Find(const std::string& destination_id, Route* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(destination_id);
    if (it == routes_.end()) return false;
    if (out != nullptr) *out = it->second;
    return true;
  }

  bool Remove(const std::string& destination_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.erase(destination_id) > 0;
  }

  /** @brief Remove every route whose destination or next hop is @p node_id. */
  uint32_t RemoveVia(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0;
    for (auto it = routes_.begin(); it != routes_.end();) {
      if (it->first == node_id || it->second.next_hop_id == node_id) {
        it = routes_.erase(it);
        ++count;
      } else {
        ++it;
      }
    }
    return count;
  }

  std::vector<Route> Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Route> out;
    out.reserve(routes_.size());
    for (const auto& kv : routes_) out.push_back(kv.second);
    return out;
  }

  /** @return Destinations of routes with now - last_updated > max_age. */
  std::vector<std::string> EvictExpired(int64_t now_ms, uint32_t max_age_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> removed;
    for (auto it = routes_.begin(); it != routes_.end();) {
      if (now_ms - it->second.last_updated_ms > static_cast<int64_t>(max_age_ms)) {
        removed.push_back(it->first);
        it = routes_.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(routes_.size());
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Route> routes_;
};

}  // namespace vmesh

#endif  // VMESH_NODE_TABLE_HPP_
