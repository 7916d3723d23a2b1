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
 * @file mesh_engine.hpp
 * @brief Protocol core of a mesh session: inbound dispatch, forwarding,
 *        discovery, heartbeat and maintenance.
 *
 * MeshEngine owns no thread and no socket. The session feeds it received
 * datagrams and timer ticks; it answers through an Outbox and reports to a
 * ListenerRegistry. Every entry point takes the current monotonic time, so
 * the protocol can be driven step by step in tests.
 *
 * Inbound control plane:
 *   decode -> drop self -> drop duplicate -> dispatch by type
 *     DISCOVERY    : upsert node + route, rate-limited unicast reply
 *     HEARTBEAT    : refresh last_seen of a known node
 *     CONTROL      : deliver if addressed here, else forward
 *     ROUTE_UPDATE : RecomputeRoutes extension point
 *     AUDIO_DATA   : ignored (belongs to the data plane)
 *
 * Forwarding: ttl > 0 is decremented and routed via the route table's next
 * hop; ttl <= 0 or a missing route drops silently.
 */

#ifndef VMESH_MESH_ENGINE_HPP_
#define VMESH_MESH_ENGINE_HPP_

#include "vmesh/listener.hpp"
#include "vmesh/log.hpp"
#include "vmesh/mesh_config.hpp"
#include "vmesh/mesh_state.hpp"
#include "vmesh/message.hpp"
#include "vmesh/outbox.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vmesh {

constexpr const char* kHeartbeatPayload = "heartbeat";

struct EngineStats {
  uint64_t received = 0;
  uint64_t decode_failures = 0;
  uint64_t self_dropped = 0;
  uint64_t duplicates = 0;
  uint64_t forwarded = 0;
  uint64_t ttl_expired = 0;
  uint64_t unroutable = 0;
  uint64_t discovery_replies = 0;
  uint64_t replies_rate_limited = 0;
};

class MeshEngine {
 public:
  /// Invoked with the sender address of every accepted DISCOVERY.
  using DiscoveryHook = void (*)(const std::string& address,
                                 const std::string& node_id, void* ctx);

  MeshEngine(std::string local_id, const MeshConfig& cfg,
             std::shared_ptr<MeshState> state, Outbox* outbox,
             ListenerRegistry* listeners)
      : local_id_(std::move(local_id)),
        cfg_(cfg),
        state_(std::move(state)),
        outbox_(outbox),
        listeners_(listeners) {}

  MeshEngine(const MeshEngine&) = delete;
  MeshEngine& operator=(const MeshEngine&) = delete;

  const std::string& LocalNodeId() const noexcept { return local_id_; }
  const MeshConfig& Config() const noexcept { return cfg_; }
  MeshState& State() noexcept { return *state_; }

  void SetDiscoveryHook(DiscoveryHook fn, void* ctx) noexcept {
    discovery_hook_ = fn;
    discovery_hook_ctx_ = ctx;
  }

  // ==========================================================================
  // Inbound
  // ==========================================================================

  void HandleControlDatagram(const uint8_t* data, uint32_t len,
                             const std::string& sender, int64_t now_ms) {
    Message msg;
    if (!Accept(data, len, sender, now_ms, "control", &msg)) return;

    switch (msg.type) {
      case MessageType::kDiscovery:
        HandleDiscovery(msg, sender, now_ms);
        break;
      case MessageType::kHeartbeat:
        HandleHeartbeat(msg, now_ms);
        break;
      case MessageType::kControl:
        if (msg.destination_id == local_id_) {
          listeners_->NotifyControl(msg.PayloadText(), msg.source_id);
        } else {
          Forward(std::move(msg));
        }
        break;
      case MessageType::kRouteUpdate:
        HandleRouteUpdate(msg);
        break;
      case MessageType::kAudioData:
        VMESH_LOG_DEBUG("Engine", "audio on control plane from %s ignored",
                        sender.c_str());
        break;
    }
  }

  void HandleAudioDatagram(const uint8_t* data, uint32_t len,
                           const std::string& sender, int64_t now_ms) {
    Message msg;
    if (!Accept(data, len, sender, now_ms, "audio", &msg)) return;
    if (msg.type != MessageType::kAudioData) {
      VMESH_LOG_DEBUG("Engine", "%s on audio plane from %s ignored",
                      MessageTypeName(msg.type), sender.c_str());
      return;
    }
    if (msg.destination_id == local_id_ || msg.destination_id == kBroadcastId) {
      listeners_->NotifyAudio(msg.payload, msg.source_id);
    } else {
      Forward(std::move(msg));
    }
  }

  // ==========================================================================
  // Outbound
  // ==========================================================================

  /**
   * @brief Send audio to one node, or fan out one unicast per known node
   *        when @p destination_id is empty.
   * @return Number of datagrams handed to the outbox.
   */
  uint32_t SendAudioData(const std::vector<uint8_t>& payload,
                         const std::string& destination_id = std::string()) {
    if (!destination_id.empty()) {
      return RouteMessage(NewMessage(destination_id, MessageType::kAudioData,
                                     payload)) ? 1U : 0U;
    }
    uint32_t sent = 0;
    for (const Node& node : state_->nodes.Snapshot()) {
      if (RouteMessage(NewMessage(node.node_id, MessageType::kAudioData, payload))) {
        ++sent;
      }
    }
    return sent;
  }

  /** @return true when a route existed and the datagram was posted. */
  bool SendControlMessage(const std::string& text,
                          const std::string& destination_id) {
    return RouteMessage(
        NewMessage(destination_id, MessageType::kControl, TextPayload(text)));
  }

  /**
   * @brief Unicast DISCOVERY to @p address.
   * @param port  Control port of the peer; 0 uses the local control port.
   */
  bool SendDiscoveryTo(const std::string& address, uint16_t port = 0) {
    Message msg = NewMessage(kDiscoveryId, MessageType::kDiscovery,
                             DiscoveryPayload());
    return outbox_->Post(Channel::kControl, Serialize(msg), address,
                         port != 0 ? port : cfg_.control_port).has_value();
  }

  /**
   * @brief One DISCOVERY message posted to every broadcast @p targets entry.
   * @return Number of targets the datagram was posted to.
   */
  uint32_t BroadcastDiscovery(const std::vector<std::string>& targets) {
    Message msg = NewMessage(kBroadcastId, MessageType::kDiscovery,
                             DiscoveryPayload());
    std::vector<uint8_t> bytes = Serialize(msg);
    uint32_t sent = 0;
    for (const auto& target : targets) {
      if (outbox_->Post(Channel::kControl, bytes, target, cfg_.control_port)
              .has_value()) {
        ++sent;
      } else {
        VMESH_LOG_WARN("Engine", "discovery broadcast to %s failed",
                       target.c_str());
      }
    }
    VMESH_LOG_DEBUG("Engine", "discovery broadcast to %u/%u targets", sent,
                    static_cast<unsigned>(targets.size()));
    return sent;
  }

  /** @brief One HEARTBEAT straight to every known node. */
  uint32_t SendHeartbeats() {
    uint32_t sent = 0;
    for (const Node& node : state_->nodes.Snapshot()) {
      Message msg = NewMessage(node.node_id, MessageType::kHeartbeat,
                               TextPayload(kHeartbeatPayload));
      if (SendToNode(msg, node)) ++sent;
    }
    return sent;
  }

  // ==========================================================================
  // Maintenance
  // ==========================================================================

  /**
   * @brief Expire stale entries; publish the node projection when the
   *        topology changed.
   */
  SweepResult RunMaintenance(int64_t now_ms) {
    SweepResult r = state_->Sweep(now_ms, cfg_);
    for (const auto& id : r.removed_nodes) {
      VMESH_LOG_INFO("Engine", "node %s timed out", id.c_str());
    }
    RecomputeRoutes();
    if (r.TopologyChanged()) PublishNodes();
    return r;
  }

  /**
   * @brief Multi-hop route computation hook.
   *
   * Only one-hop routes exist: each is created with its node in
   * MeshState::UpsertDirectNode. Nothing is derived from them yet.
   */
  void RecomputeRoutes() {}

  /** @brief ROUTE_UPDATE payloads carry no defined format; accepted and dropped. */
  void HandleRouteUpdate(const Message& msg) {
    VMESH_LOG_DEBUG("Engine", "route update from %s (%u bytes) not applied",
                    msg.source_id.c_str(),
                    static_cast<unsigned>(msg.payload.size()));
  }

  void PublishNodes() { listeners_->NotifyNodes(state_->nodes.Snapshot()); }

  EngineStats Stats() const noexcept {
    EngineStats s;
    s.received = received_.load(std::memory_order_relaxed);
    s.decode_failures = decode_failures_.load(std::memory_order_relaxed);
    s.self_dropped = self_dropped_.load(std::memory_order_relaxed);
    s.duplicates = duplicates_.load(std::memory_order_relaxed);
    s.forwarded = forwarded_.load(std::memory_order_relaxed);
    s.ttl_expired = ttl_expired_.load(std::memory_order_relaxed);
    s.unroutable = unroutable_.load(std::memory_order_relaxed);
    s.discovery_replies = discovery_replies_.load(std::memory_order_relaxed);
    s.replies_rate_limited = rate_limited_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  /// Common front half of both planes: decode, self filter, dedup.
  bool Accept(const uint8_t* data, uint32_t len, const std::string& sender,
              int64_t now_ms, const char* plane, Message* out) {
    received_.fetch_add(1, std::memory_order_relaxed);
    auto decoded = Deserialize(data, len);
    if (!decoded.has_value()) {
      decode_failures_.fetch_add(1, std::memory_order_relaxed);
      VMESH_LOG_WARN("Engine", "dropping %u-byte %s datagram from %s: %s",
                     len, plane, sender.c_str(),
                     DecodeErrorName(decoded.get_error()));
      return false;
    }
    Message& msg = decoded.value();
    if (msg.source_id == local_id_) {
      self_dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    if (!state_->seen_messages.InsertIfAbsent(msg.message_id, now_ms)) {
      duplicates_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    *out = std::move(msg);
    return true;
  }

  void HandleDiscovery(const Message& msg, const std::string& sender,
                       int64_t now_ms) {
    std::string remote_id;
    std::string display_name;
    if (!ParseDiscoveryPayload(msg.payload, &remote_id, &display_name)) {
      VMESH_LOG_WARN("Engine", "malformed discovery payload from %s",
                     sender.c_str());
      return;
    }
    if (remote_id == local_id_) return;

    if (state_->response_times.TryAcquire(sender, now_ms,
                                          cfg_.response_min_interval_ms)) {
      if (SendDiscoveryTo(sender)) {
        discovery_replies_.fetch_add(1, std::memory_order_relaxed);
      }
    } else {
      rate_limited_.fetch_add(1, std::memory_order_relaxed);
    }

    Node node;
    node.node_id = remote_id;
    node.display_name = display_name;
    node.address = sender;
    node.port = cfg_.control_port;
    node.is_direct = true;
    node.last_seen_ms = now_ms;
    node.hop_count = 1;
    if (state_->UpsertDirectNode(node)) {
      VMESH_LOG_INFO("Engine", "discovered %s (%s) at %s", display_name.c_str(),
                     remote_id.c_str(), sender.c_str());
    }
    PublishNodes();

    if (discovery_hook_ != nullptr) {
      discovery_hook_(sender, remote_id, discovery_hook_ctx_);
    }
  }

  void HandleHeartbeat(const Message& msg, int64_t now_ms) {
    if (!state_->nodes.Touch(msg.source_id, now_ms)) {
      VMESH_LOG_DEBUG("Engine", "heartbeat from unknown node %s dropped",
                      msg.source_id.c_str());
    }
  }

  bool Forward(Message msg) {
    if (msg.ttl <= 0) {
      ttl_expired_.fetch_add(1, std::memory_order_relaxed);
      VMESH_LOG_DEBUG("Engine", "ttl expired for %s", msg.message_id.c_str());
      return false;
    }
    --msg.ttl;
    if (!RouteMessage(msg)) return false;
    forwarded_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  /// Route lookup, next-hop resolution, post. Silent drop when unroutable.
  bool RouteMessage(const Message& msg) {
    Route route;
    Node next_hop;
    if (!state_->routes.Find(msg.destination_id, &route) ||
        !state_->nodes.Find(route.next_hop_id, &next_hop)) {
      unroutable_.fetch_add(1, std::memory_order_relaxed);
      VMESH_LOG_DEBUG("Engine", "no route to %s", msg.destination_id.c_str());
      return false;
    }
    return SendToNode(msg, next_hop);
  }

  bool SendToNode(const Message& msg, const Node& node) {
    const bool audio = (msg.type == MessageType::kAudioData);
    const uint16_t port =
        audio ? static_cast<uint16_t>(node.port + 1U) : node.port;
    return outbox_->Post(audio ? Channel::kAudio : Channel::kControl,
                         Serialize(msg), node.address, port).has_value();
  }

  Message NewMessage(const std::string& destination, MessageType type,
                     std::vector<uint8_t> payload) const {
    return MakeMessage(local_id_, destination, type, std::move(payload),
                       cfg_.default_ttl);
  }

  std::vector<uint8_t> DiscoveryPayload() const {
    return TextPayload(local_id_ + "|" + cfg_.display_name);
  }

  /// "<id>|<name>[|ignored...]"; both fields required, id non-empty.
  static bool ParseDiscoveryPayload(const std::vector<uint8_t>& payload,
                                    std::string* id, std::string* name) {
    std::string text(payload.begin(), payload.end());
    size_t first = text.find('|');
    if (first == std::string::npos || first == 0) return false;
    size_t second = text.find('|', first + 1);
    *id = text.substr(0, first);
    *name = text.substr(first + 1, second == std::string::npos
                                       ? std::string::npos
                                       : second - first - 1);
    return true;
  }

  const std::string local_id_;
  const MeshConfig cfg_;
  std::shared_ptr<MeshState> state_;
  Outbox* outbox_;
  ListenerRegistry* listeners_;

  DiscoveryHook discovery_hook_ = nullptr;
  void* discovery_hook_ctx_ = nullptr;

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> decode_failures_{0};
  std::atomic<uint64_t> self_dropped_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> ttl_expired_{0};
  std::atomic<uint64_t> unroutable_{0};
  std::atomic<uint64_t> discovery_replies_{0};
  std::atomic<uint64_t> rate_limited_{0};
};

}  // namespace vmesh

#endif  // VMESH_MESH_ENGINE_HPP_
