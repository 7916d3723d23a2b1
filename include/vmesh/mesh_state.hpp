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
 * @file mesh_state.hpp
 * @brief Shared state of one mesh session.
 *
 * Owned through std::shared_ptr by the engine and every service loop of a
 * session; there is no process-wide instance.
 */

#ifndef VMESH_MESH_STATE_HPP_
#define VMESH_MESH_STATE_HPP_

#include "vmesh/mesh_config.hpp"
#include "vmesh/node_table.hpp"
#include "vmesh/timed_cache.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vmesh {

struct SweepResult {
  std::vector<std::string> removed_nodes;
  std::vector<std::string> removed_routes;
  uint32_t dedup_swept = 0;
  uint32_t responses_swept = 0;

  bool TopologyChanged() const noexcept {
    return !removed_nodes.empty() || !removed_routes.empty();
  }
};

struct MeshState {
  NodeTable nodes;
  RouteTable routes;
  TimedCache seen_messages;   ///< message id -> first seen
  TimedCache response_times;  ///< sender address -> last discovery reply

  /**
   * @brief Store a directly heard peer together with its one-hop route.
   * @return true when the node was not known before.
   */
  bool UpsertDirectNode(const Node& node) {
    bool is_new = nodes.Upsert(node);
    Route route;
    route.destination_id = node.node_id;
    route.next_hop_id = node.node_id;
    route.hop_count = node.hop_count;
    route.last_updated_ms = node.last_seen_ms;
    routes.Upsert(route);
    return is_new;
  }

  /**
   * @brief Expire nodes, routes and both caches against @p now_ms.
   *
   * Routes through an evicted node are dropped with it.
   */
  SweepResult Sweep(int64_t now_ms, const MeshConfig& cfg) {
    SweepResult r;
    r.removed_nodes = nodes.EvictExpired(now_ms, cfg.node_timeout_ms);
    for (const auto& id : r.removed_nodes) {
      if (routes.RemoveVia(id) > 0) r.removed_routes.push_back(id);
    }
    std::vector<std::string> aged = routes.EvictExpired(now_ms, cfg.max_route_age_ms);
    r.removed_routes.insert(r.removed_routes.end(), aged.begin(), aged.end());
    r.dedup_swept = seen_messages.Sweep(now_ms, cfg.dedup_retention_ms);
    r.responses_swept = response_times.Sweep(now_ms, cfg.response_retention_ms);
    return r;
  }

  void Clear() {
    nodes.Clear();
    routes.Clear();
    seen_messages.Clear();
    response_times.Clear();
  }
};

}  // namespace vmesh

#endif  // VMESH_MESH_STATE_HPP_
