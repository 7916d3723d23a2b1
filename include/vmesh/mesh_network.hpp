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
 * @file mesh_network.hpp
 * @brief One mesh session: sockets, service loops and the public API.
 *
 * Threads of a running session:
 *   - control listener : control socket -> MeshEngine::HandleControlDatagram
 *   - audio listener   : audio socket   -> MeshEngine::HandleAudioDatagram
 *   - timer            : discovery broadcast, heartbeat, maintenance
 *   - outbox workers   : fire-and-forget sends
 *   - scan / connect   : short-lived, one of each at most
 *
 * Stop() closes both sockets, which wakes the listeners; every thread is
 * joined before Stop() returns and the tables are cleared. Called from a
 * listener callback (any session thread), Stop() hands the teardown to a
 * reaper thread and returns at once; IsRunning() turns false when it is done.
 *
 * @code
 *   vmesh::UdpSocketFactory sockets;
 *   vmesh::PosixNetworkInspector inspector;
 *   vmesh::MeshNetwork mesh(cfg, &sockets, &inspector);
 *   mesh.AddListener(&my_listener);
 *   if (!mesh.Start().has_value()) { ... }
 *   mesh.SendAudioData(frame);
 *   mesh.Stop();
 * @endcode
 */

#ifndef VMESH_MESH_NETWORK_HPP_
#define VMESH_MESH_NETWORK_HPP_

#include "vmesh/connect_guard.hpp"
#include "vmesh/listener.hpp"
#include "vmesh/log.hpp"
#include "vmesh/mesh_config.hpp"
#include "vmesh/mesh_engine.hpp"
#include "vmesh/mesh_state.hpp"
#include "vmesh/net_if.hpp"
#include "vmesh/outbox.hpp"
#include "vmesh/timer.hpp"
#include "vmesh/transport.hpp"
#include "vmesh/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vmesh {

enum class MeshError : uint8_t {
  kAlreadyRunning = 0,
  kControlSocketFailed,
  kAudioSocketFailed,
  kSchedulerFailed,
  kSenderFailed,
  kNotRunning,
  kScanInProgress,
};

inline const char* MeshErrorName(MeshError e) noexcept {
  switch (e) {
    case MeshError::kAlreadyRunning:      return "already running";
    case MeshError::kControlSocketFailed: return "control socket failed";
    case MeshError::kAudioSocketFailed:   return "audio socket failed";
    case MeshError::kSchedulerFailed:     return "scheduler failed";
    case MeshError::kSenderFailed:        return "sender failed";
    case MeshError::kNotRunning:          return "not running";
    case MeshError::kScanInProgress:      return "scan in progress";
  }
  return "unknown";
}

class MeshNetwork {
 public:
  /**
   * @param cfg        Session tunables; an empty node_id is generated.
   * @param sockets    Opens the control and audio sockets (borrowed).
   * @param inspector  Local interfaces and reachability probes (borrowed).
   */
  MeshNetwork(const MeshConfig& cfg, SocketFactory* sockets,
              NetworkInspector* inspector)
      : cfg_(WithNodeId(cfg)),
        sockets_(sockets),
        inspector_(inspector),
        state_(std::make_shared<MeshState>()),
        outbox_(cfg_.send_workers, cfg_.send_queue_depth),
        engine_(cfg_.node_id, cfg_, state_, &outbox_, &listeners_),
        guard_(cfg_.connect_cooldown_ms, cfg_.connect_timeout_ms),
        timer_(4) {
    engine_.SetDiscoveryHook(&MeshNetwork::OnDiscovery, this);
  }

  ~MeshNetwork() {
    Stop();
    JoinReaper();  // a callback may have requested a stop during teardown
  }

  MeshNetwork(const MeshNetwork&) = delete;
  MeshNetwork& operator=(const MeshNetwork&) = delete;

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /**
   * @brief Bind both planes and launch the service loops.
   *
   * On any failure everything opened so far is closed before returning and
   * a kStartFailed event is published.
   */
  expected<void, MeshError> Start() {
    JoinReaper();
    expected<void, MeshError> r = expected<void, MeshError>::success();
    {
      std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
      r = StartLocked();
    }
    if (r.has_value()) {
      Emit(MeshEventType::kStarted, cfg_.node_id);
    } else if (r.get_error() != MeshError::kAlreadyRunning) {
      Emit(MeshEventType::kStartFailed, MeshErrorName(r.get_error()));
    }
    return r;
  }

  /** @brief Stop every loop and clear all tables. Idempotent. */
  void Stop() {
    if (OnSessionThread()) {
      RequestDeferredStop();
      return;
    }
    JoinReaper();
    StopAndNotify();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  // ==========================================================================
  // Seeding the mesh
  // ==========================================================================

  /**
   * @brief Announce this node to @p address with a few unicast DISCOVERYs.
   *
   * No node entry is created here; the peer appears once its reply arrives.
   * Rejections other than kNotRunning are also published as
   * kConnectionBusy when another attempt blocks this one.
   *
   * @param port  Peer control port; 0 means the local control port.
   */
  expected<void, ConnectError> AddDirectConnection(const std::string& address,
                                                   uint16_t port = 0) {
    using Result = expected<void, ConnectError>;
    if (!IsRunning()) return Result::error(ConnectError::kNotRunning);

    auto interfaces = inspector_->ListActiveInterfaces();
    if (interfaces.has_value()) {
      for (const auto& local : LocalAddresses(interfaces.value())) {
        if (local == address) {
          VMESH_LOG_DEBUG("Mesh", "skipping own address %s", address.c_str());
          return Result::error(ConnectError::kSelfAddress);
        }
      }
    }

    const int64_t now = SteadyNowMs();
    Node known;
    if (engine_.State().nodes.Find(NodeIdFromAddress(address), &known) ||
        engine_.State().nodes.FindByAddress(address, &known)) {
      if (now - known.last_seen_ms <
          static_cast<int64_t>(cfg_.direct_connect_debounce_ms)) {
        VMESH_LOG_DEBUG("Mesh", "%s seen recently, not reconnecting",
                        address.c_str());
        return Result::error(ConnectError::kRecentlySeen);
      }
    }

    auto gate = guard_.TryBegin(address, now);
    if (!gate.has_value()) {
      VMESH_LOG_INFO("Mesh", "connect to %s rejected: %s", address.c_str(),
                     ConnectErrorName(gate.get_error()));
      Emit(MeshEventType::kConnectionBusy, address);
      return gate;
    }

    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (connect_thread_.joinable()) connect_thread_.join();
    connect_thread_ = std::thread(&MeshNetwork::ConnectAttempts, this, address,
                                  port);
    return Result::success();
  }

  /**
   * @brief Probe the local /24 and send DISCOVERY to every host that answers.
   *
   * Runs on its own thread; kScanStarted / kScanFinished bracket it.
   */
  expected<void, MeshError> ScanAndConnectToAvailableDevices() {
    if (!IsRunning()) {
      return expected<void, MeshError>::error(MeshError::kNotRunning);
    }
    if (scanning_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, MeshError>::error(MeshError::kScanInProgress);
    }
    last_scan_ms_.store(SteadyNowMs(), std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (scan_thread_.joinable()) scan_thread_.join();
    scan_thread_ = std::thread(&MeshNetwork::ScanLoop, this);
    return expected<void, MeshError>::success();
  }

  bool ScanInProgress() const noexcept {
    return scanning_.load(std::memory_order_acquire);
  }

  // ==========================================================================
  // Traffic
  // ==========================================================================

  /**
   * @brief Send audio to @p destination_id, or to every known node when
   *        it is empty.
   * @return Datagrams queued.
   */
  uint32_t SendAudioData(const std::vector<uint8_t>& payload,
                         const std::string& destination_id = std::string()) {
    if (!IsRunning()) return 0;
    return engine_.SendAudioData(payload, destination_id);
  }

  bool SendControlMessage(const std::string& text,
                          const std::string& destination_id) {
    if (!IsRunning()) return false;
    return engine_.SendControlMessage(text, destination_id);
  }

  // ==========================================================================
  // Observation
  // ==========================================================================

  void AddListener(MeshListener* listener) { listeners_.Add(listener); }
  void RemoveListener(MeshListener* listener) { listeners_.Remove(listener); }

  std::vector<Node> ConnectedNodes() const { return state_->nodes.Snapshot(); }

  const std::string& LocalNodeId() const noexcept { return cfg_.node_id; }
  const MeshConfig& Config() const noexcept { return cfg_; }
  EngineStats Stats() const noexcept { return engine_.Stats(); }

  /** @brief Block until every queued outbound datagram has been sent. */
  void FlushOutbox() { outbox_.Flush(); }

 private:
  struct ProbeTask {
    MeshNetwork* self = nullptr;
    std::string address;
  };

  static MeshConfig WithNodeId(MeshConfig cfg) {
    if (cfg.node_id.empty()) cfg.node_id = GenerateLocalNodeId();
    return cfg;
  }

  /// Caller holds lifecycle_mutex_. Events are published by the caller.
  expected<void, MeshError> StartLocked() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, MeshError>::error(MeshError::kAlreadyRunning);
    }

    auto control = sockets_->Open(cfg_.control_port);
    if (!control.has_value()) {
      return StartFailed(MeshError::kControlSocketFailed,
                         SocketErrorName(control.get_error()));
    }
    control_sock_ = std::move(control.value());

    auto audio = sockets_->Open(cfg_.AudioPort());
    if (!audio.has_value()) {
      CloseSockets();
      return StartFailed(MeshError::kAudioSocketFailed,
                         SocketErrorName(audio.get_error()));
    }
    audio_sock_ = std::move(audio.value());

    if (!outbox_.Start(control_sock_.get(), audio_sock_.get()).has_value()) {
      outbox_.Stop();
      CloseSockets();
      return StartFailed(MeshError::kSenderFailed, "outbox workers");
    }

    running_.store(true, std::memory_order_release);
    const int64_t now = SteadyNowMs();
    empty_since_ms_.store(now, std::memory_order_relaxed);
    last_scan_ms_.store(now, std::memory_order_relaxed);

    control_thread_ = std::thread(&MeshNetwork::ReceiveLoop, this,
                                  control_sock_.get(), Channel::kControl);
    audio_thread_ = std::thread(&MeshNetwork::ReceiveLoop, this,
                                audio_sock_.get(), Channel::kAudio);

    if (!AddTimerTasks() || !timer_.Start().has_value()) {
      TearDown();
      return StartFailed(MeshError::kSchedulerFailed, "timer");
    }

    VMESH_LOG_INFO("Mesh", "started %s (%s) on ports %u/%u",
                   cfg_.node_id.c_str(), cfg_.display_name.c_str(),
                   static_cast<unsigned>(cfg_.control_port),
                   static_cast<unsigned>(cfg_.AudioPort()));
    return expected<void, MeshError>::success();
  }

  expected<void, MeshError> StartFailed(MeshError err, const char* reason) {
    VMESH_LOG_ERROR("Mesh", "start failed: %s (%s)", MeshErrorName(err), reason);
    return expected<void, MeshError>::error(err);
  }

  void StopAndNotify() {
    {
      std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
      if (!running_.load(std::memory_order_acquire)) return;
      TearDown();
      VMESH_LOG_INFO("Mesh", "stopped %s", cfg_.node_id.c_str());
    }
    Emit(MeshEventType::kStopped, cfg_.node_id);
  }

  // ==========================================================================
  // Stop requested from a session thread
  // ==========================================================================

  /// Marks the calling thread as belonging to @p session for its lifetime.
  class SessionThreadScope {
   public:
    explicit SessionThreadScope(const MeshNetwork* session) noexcept
        : previous_(CurrentSession()) {
      CurrentSession() = session;
    }
    ~SessionThreadScope() { CurrentSession() = previous_; }

    SessionThreadScope(const SessionThreadScope&) = delete;
    SessionThreadScope& operator=(const SessionThreadScope&) = delete;

   private:
    const MeshNetwork* previous_;
  };

  static const MeshNetwork*& CurrentSession() noexcept {
    static thread_local const MeshNetwork* session = nullptr;
    return session;
  }

  bool OnSessionThread() const noexcept { return CurrentSession() == this; }

  /// A session thread cannot join itself; the reaper tears down instead.
  void RequestDeferredStop() {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    if (stop_requested_ || !running_.load(std::memory_order_acquire)) return;
    stop_requested_ = true;
    if (reaper_.joinable()) reaper_.join();
    VMESH_LOG_DEBUG("Mesh", "stop requested from a session thread");
    reaper_ = std::thread(&MeshNetwork::ReapSession, this);
  }

  void ReapSession() {
    SessionThreadScope scope(this);
    StopAndNotify();
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    stop_requested_ = false;
  }

  void JoinReaper() {
    std::thread reaper;
    {
      std::lock_guard<std::mutex> lock(reaper_mutex_);
      if (!reaper_.joinable() ||
          reaper_.get_id() == std::this_thread::get_id()) {
        return;
      }
      reaper = std::move(reaper_);
    }
    reaper.join();
  }

  bool AddTimerTasks() {
    auto discovery = timer_.Add(cfg_.discovery_interval_ms,
                                &MeshNetwork::DiscoveryTick, this, 0);
    auto heartbeat = timer_.Add(cfg_.heartbeat_interval_ms,
                                &MeshNetwork::HeartbeatTick, this);
    auto maintenance = timer_.Add(cfg_.maintenance_interval_ms,
                                  &MeshNetwork::MaintenanceTick, this);
    if (discovery.has_value()) timer_ids_.push_back(discovery.value());
    if (heartbeat.has_value()) timer_ids_.push_back(heartbeat.value());
    if (maintenance.has_value()) timer_ids_.push_back(maintenance.value());
    return timer_ids_.size() == 3U;
  }

  /// Caller holds lifecycle_mutex_.
  void TearDown() {
    running_.store(false, std::memory_order_release);
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
    }
    stop_cv_.notify_all();

    timer_.Stop();
    for (const auto& id : timer_ids_) (void)timer_.Remove(id);
    timer_ids_.clear();

    if (control_sock_) control_sock_->Close();
    if (audio_sock_) audio_sock_->Close();
    if (control_thread_.joinable()) control_thread_.join();
    if (audio_thread_.joinable()) audio_thread_.join();
    {
      std::lock_guard<std::mutex> lock(worker_mutex_);
      if (scan_thread_.joinable()) scan_thread_.join();
      if (connect_thread_.joinable()) connect_thread_.join();
    }

    outbox_.Stop();
    CloseSockets();

    state_->Clear();
    guard_.Reset();
    engine_.PublishNodes();
  }

  void CloseSockets() {
    if (control_sock_) control_sock_->Close();
    if (audio_sock_) audio_sock_->Close();
    control_sock_.reset();
    audio_sock_.reset();
  }

  /// @return false when the session stopped during the wait.
  bool SleepUnlessStopping(uint32_t ms) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] {
      return !running_.load(std::memory_order_acquire);
    });
  }

  void Emit(MeshEventType type, const std::string& detail) {
    MeshEvent ev;
    ev.type = type;
    ev.detail = detail;
    listeners_.NotifyEvent(ev);
  }

  // ==========================================================================
  // Listener loops
  // ==========================================================================

  void ReceiveLoop(DatagramSocket* sock, Channel channel) {
    SessionThreadScope scope(this);
    const bool audio = (channel == Channel::kAudio);
    const char* name = audio ? "audio" : "control";
    std::vector<uint8_t> buf(audio ? cfg_.audio_buffer_size
                                   : cfg_.control_buffer_size);
    std::string sender;

    VMESH_LOG_DEBUG("Mesh", "%s listener on port %u", name,
                    static_cast<unsigned>(sock->LocalPort()));
    while (running_.load(std::memory_order_acquire)) {
      auto r = sock->ReceiveFrom(buf.data(), static_cast<uint32_t>(buf.size()),
                                 sender);
      if (!r.has_value()) {
        if (!running_.load(std::memory_order_acquire) ||
            r.get_error() == SocketError::kClosed) {
          break;
        }
        VMESH_LOG_ERROR("Mesh", "%s receive failed: %s", name,
                        SocketErrorName(r.get_error()));
        (void)SleepUnlessStopping(cfg_.receive_error_backoff_ms);
        continue;
      }
      if (audio) {
        engine_.HandleAudioDatagram(buf.data(), r.value(), sender, SteadyNowMs());
      } else {
        engine_.HandleControlDatagram(buf.data(), r.value(), sender,
                                      SteadyNowMs());
      }
    }
    VMESH_LOG_DEBUG("Mesh", "%s listener exited", name);
  }

  // ==========================================================================
  // Timer callbacks
  // ==========================================================================

  static void DiscoveryTick(void* ctx) {
    auto* self = static_cast<MeshNetwork*>(ctx);
    SessionThreadScope scope(self);
    self->engine_.BroadcastDiscovery(
        BroadcastTargets(self->inspector_->ListActiveInterfaces()));
  }

  static void HeartbeatTick(void* ctx) {
    auto* self = static_cast<MeshNetwork*>(ctx);
    SessionThreadScope scope(self);
    (void)self->engine_.SendHeartbeats();
  }

  static void MaintenanceTick(void* ctx) {
    auto* self = static_cast<MeshNetwork*>(ctx);
    SessionThreadScope scope(self);
    const int64_t now = SteadyNowMs();
    (void)self->engine_.RunMaintenance(now);

    std::string expired;
    if (self->guard_.ExpireIfOverdue(now, &expired)) {
      VMESH_LOG_WARN("Mesh", "connection to %s timed out", expired.c_str());
      self->Emit(MeshEventType::kConnectionTimeout, expired);
    }
    self->MaybeAutoScan(now);
  }

  void MaybeAutoScan(int64_t now) {
    if (cfg_.auto_scan_grace_ms == 0) return;
    if (state_->nodes.Size() != 0) {
      empty_since_ms_.store(now, std::memory_order_relaxed);
      return;
    }
    const int64_t grace = static_cast<int64_t>(cfg_.auto_scan_grace_ms);
    if (now - empty_since_ms_.load(std::memory_order_relaxed) < grace ||
        now - last_scan_ms_.load(std::memory_order_relaxed) < grace) {
      return;
    }
    VMESH_LOG_INFO("Mesh", "no peers for %u ms, scanning",
                   cfg_.auto_scan_grace_ms);
    (void)ScanAndConnectToAvailableDevices();
  }

  static void OnDiscovery(const std::string& address,
                          const std::string& node_id, void* ctx) {
    auto* self = static_cast<MeshNetwork*>(ctx);
    if (self->guard_.Confirm(address)) {
      VMESH_LOG_INFO("Mesh", "connected to %s at %s", node_id.c_str(),
                     address.c_str());
      self->Emit(MeshEventType::kConnectionEstablished, address);
    }
  }

  // ==========================================================================
  // Short-lived workers
  // ==========================================================================

  void ConnectAttempts(std::string address, uint16_t port) {
    SessionThreadScope scope(this);
    VMESH_LOG_INFO("Mesh", "connecting to %s", address.c_str());
    for (uint32_t i = 0; i < cfg_.direct_connect_attempts; ++i) {
      if (i > 0 && !SleepUnlessStopping(cfg_.direct_connect_spacing_ms)) return;
      if (!engine_.SendDiscoveryTo(address, port)) {
        VMESH_LOG_WARN("Mesh", "discovery to %s not sent (attempt %u)",
                       address.c_str(), i + 1U);
      }
    }
  }

  void ScanLoop() {
    SessionThreadScope scope(this);
    Emit(MeshEventType::kScanStarted, std::string());
    uint32_t probed = 0;

    auto interfaces = inspector_->ListActiveInterfaces();
    if (!interfaces.has_value() || interfaces.value().empty()) {
      VMESH_LOG_WARN("Mesh", "scan skipped: no usable interface");
    } else {
      std::vector<std::string> locals = LocalAddresses(interfaces.value());
      std::vector<std::string> exclude = locals;
      std::vector<std::string> known = state_->nodes.Addresses();
      exclude.insert(exclude.end(), known.begin(), known.end());
      std::vector<std::string> targets = ScanTargets(locals.front(), exclude);
      VMESH_LOG_INFO("Mesh", "scanning %u hosts around %s",
                     static_cast<unsigned>(targets.size()),
                     locals.front().c_str());
      probed = ProbeInBatches(targets);
    }

    VMESH_LOG_INFO("Mesh", "scan finished, %u hosts answered",
                   reachable_.load(std::memory_order_relaxed));
    last_scan_ms_.store(SteadyNowMs(), std::memory_order_relaxed);
    scanning_.store(false, std::memory_order_release);
    Emit(MeshEventType::kScanFinished, std::to_string(probed));
  }

  /// @return Number of hosts probed before completion or stop.
  uint32_t ProbeInBatches(const std::vector<std::string>& targets) {
    WorkerPoolConfig pc;
    pc.name = "scan";
    pc.worker_num = cfg_.scan_batch_size;
    pc.queue_depth = cfg_.scan_batch_size;
    WorkerPool<ProbeTask> probes(pc);
    probes.SetHandler(&MeshNetwork::Probe, nullptr);
    if (!probes.Start().has_value()) return 0;

    reachable_.store(0, std::memory_order_relaxed);
    uint32_t probed = 0;
    for (size_t i = 0; i < targets.size(); i += cfg_.scan_batch_size) {
      if (!IsRunning()) break;
      size_t end = std::min(targets.size(), i + cfg_.scan_batch_size);
      for (size_t j = i; j < end; ++j) {
        ProbeTask task;
        task.self = this;
        task.address = targets[j];
        if (probes.Submit(std::move(task)).has_value()) ++probed;
      }
      probes.WaitIdle();
      if (end < targets.size() &&
          !SleepUnlessStopping(cfg_.scan_batch_pause_ms)) {
        break;
      }
    }
    probes.Shutdown();
    return probed;
  }

  static void Probe(ProbeTask& task, void* /*ctx*/) {
    MeshNetwork* self = task.self;
    if (!self->IsRunning()) return;
    if (!self->inspector_->IsReachable(task.address,
                                       self->cfg_.scan_probe_timeout_ms)) {
      return;
    }
    self->reachable_.fetch_add(1, std::memory_order_relaxed);
    VMESH_LOG_DEBUG("Mesh", "probe: %s reachable", task.address.c_str());
    (void)self->engine_.SendDiscoveryTo(task.address);
  }

  // ==========================================================================
  // Data
  // ==========================================================================

  const MeshConfig cfg_;
  SocketFactory* sockets_;
  NetworkInspector* inspector_;

  std::shared_ptr<MeshState> state_;
  ListenerRegistry listeners_;
  PooledOutbox outbox_;
  MeshEngine engine_;
  ConnectGuard guard_;
  TimerScheduler timer_;
  std::vector<TimerTaskId> timer_ids_;

  std::unique_ptr<DatagramSocket> control_sock_;
  std::unique_ptr<DatagramSocket> audio_sock_;
  std::thread control_thread_;
  std::thread audio_thread_;

  std::mutex worker_mutex_;  // guards scan_thread_ / connect_thread_
  std::thread scan_thread_;
  std::thread connect_thread_;

  std::mutex lifecycle_mutex_;
  std::mutex reaper_mutex_;  // guards reaper_ / stop_requested_
  std::thread reaper_;
  bool stop_requested_ = false;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::atomic<bool> running_{false};
  std::atomic<bool> scanning_{false};
  std::atomic<int64_t> empty_since_ms_{0};
  std::atomic<int64_t> last_scan_ms_{0};
  std::atomic<uint32_t> reachable_{0};
};

}  // namespace vmesh

#endif  // VMESH_MESH_NETWORK_HPP_
