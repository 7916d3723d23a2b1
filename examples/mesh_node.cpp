// Copyright (c) 2024 liudegui. MIT License.
//
// mesh_node.cpp -- one voice mesh node on real UDP sockets.
//
// Usage:
//   mesh_node [-c node.ini] [-t] [peer_address ...]
//
//   -c   Load [mesh] / [timing] / [scan] / [audio] keys from an INI file.
//   -t   Send a 440 Hz test tone to every known node twice a second.
//
// Each peer address on the command line is direct-connected once the mesh
// is up. Received audio is decoded and metered; "mute_request" mutes the
// local tone and "status_request" is answered with the node count.
// SIGINT / SIGTERM stop the node.

#include "vmesh/audio.hpp"
#include "vmesh/config.hpp"
#include "vmesh/log.hpp"
#include "vmesh/mesh_config.hpp"
#include "vmesh/mesh_network.hpp"
#include "vmesh/net_if.hpp"
#include "vmesh/timer.hpp"
#include "vmesh/transport.hpp"

#include <pthread.h>
#include <csignal>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// ============================================================================
// Playback: level meter instead of a sound card
// ============================================================================

class MeterPlayback final : public vmesh::PlaybackDevice {
 public:
  vmesh::expected<void, vmesh::AudioError> Play(
      const std::string& source_id,
      const std::vector<int16_t>& samples) override {
    float level = vmesh::AudioLevel(samples);
    uint32_t frames = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      frames = ++frames_[source_id];
    }
    // One line per 25 frames keeps the console readable.
    if (frames % 25U == 1U) {
      VMESH_LOG_INFO("Play", "%s: %u samples, level %.2f (frame %u)",
                     source_id.c_str(), static_cast<unsigned>(samples.size()),
                     static_cast<double>(level), frames);
    }
    return vmesh::expected<void, vmesh::AudioError>::success();
  }

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, uint32_t> frames_;
};

// ============================================================================
// Control handling and node log
// ============================================================================

class NodeConsole final : public vmesh::MeshListener {
 public:
  NodeConsole(vmesh::MeshNetwork* mesh, vmesh::AudioUplink* uplink)
      : mesh_(mesh), uplink_(uplink) {}

  void OnControlMessage(const std::string& text,
                        const std::string& source_id) override {
    VMESH_LOG_INFO("Node", "control from %s: %s", source_id.c_str(),
                   text.c_str());
    if (text == "mute_request") {
      uplink_->SetMuted(true);
    } else if (text == "unmute_request") {
      uplink_->SetMuted(false);
    } else if (text == "status_request") {
      std::string reply = "status: " +
                          std::to_string(mesh_->ConnectedNodes().size()) +
                          " nodes" + (uplink_->IsMuted() ? ", muted" : "");
      if (!mesh_->SendControlMessage(reply, source_id)) {
        VMESH_LOG_WARN("Node", "no route back to %s", source_id.c_str());
      }
    }
  }

  void OnNodesChanged(const std::vector<vmesh::Node>& nodes) override {
    VMESH_LOG_INFO("Node", "%u node(s) in mesh",
                   static_cast<unsigned>(nodes.size()));
    for (const auto& n : nodes) {
      VMESH_LOG_INFO("Node", "  %-16s %-16s %s", n.node_id.c_str(),
                     n.address.c_str(), n.display_name.c_str());
    }
  }

  void OnMeshEvent(const vmesh::MeshEvent& event) override {
    VMESH_LOG_INFO("Node", "event: %s %s", vmesh::MeshEventName(event.type),
                   event.detail.c_str());
  }

 private:
  vmesh::MeshNetwork* mesh_;
  vmesh::AudioUplink* uplink_;
};

// ============================================================================
// Test tone
// ============================================================================

struct ToneSource {
  vmesh::AudioUplink* uplink = nullptr;
  uint32_t phase = 0;
};

static constexpr uint32_t kSampleRate = 16000;
static constexpr uint32_t kToneFrame = 320;  // 20 ms

static void ToneTick(void* ctx) {
  auto* tone = static_cast<ToneSource*>(ctx);
  std::vector<int16_t> frame(kToneFrame);
  const double kTwoPi = 6.283185307179586;
  for (uint32_t i = 0; i < kToneFrame; ++i, ++tone->phase) {
    double t = static_cast<double>(tone->phase) / kSampleRate;
    frame[i] = static_cast<int16_t>(8000.0 * std::sin(kTwoPi * 440.0 * t));
  }
  (void)tone->uplink->OnCapturedFrame(frame);
}

static uint32_t SendThroughMesh(const std::vector<uint8_t>& payload,
                                const std::string& destination_id, void* ctx) {
  return static_cast<vmesh::MeshNetwork*>(ctx)->SendAudioData(payload,
                                                              destination_id);
}

// ============================================================================
// main
// ============================================================================

static void PrintUsage(const char* prog) {
  std::printf("Usage: %s [-c node.ini] [-t] [peer_address ...]\n", prog);
}

int main(int argc, char* argv[]) {
  const char* config_path = nullptr;
  bool tone = false;
  std::vector<std::string> peers;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "-t") == 0) {
      tone = true;
    } else if (std::strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return 0;
    } else if (argv[i][0] == '-') {
      PrintUsage(argv[0]);
      return 1;
    } else {
      peers.emplace_back(argv[i]);
    }
  }

  vmesh::MeshConfig cfg;
  if (config_path != nullptr) {
#if defined(VMESH_CONFIG_INI_ENABLED) || defined(VMESH_CONFIG_JSON_ENABLED)
    vmesh::FileConfig file;
    auto loaded = file.LoadFile(config_path);
    if (!loaded.has_value()) {
      VMESH_LOG_ERROR("Node", "cannot load %s: %s", config_path,
                      vmesh::ConfigErrorName(loaded.get_error()));
      return 1;
    }
    auto parsed = vmesh::LoadMeshConfig(file);
    if (!parsed.has_value()) {
      VMESH_LOG_ERROR("Node", "invalid configuration in %s", config_path);
      return 1;
    }
    cfg = parsed.value();
#else
    VMESH_LOG_ERROR("Node", "built without a config backend, ignoring %s",
                    config_path);
#endif
  }

  // Block before any mesh thread exists so every thread inherits the mask.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    VMESH_LOG_ERROR("Node", "pthread_sigmask failed");
    return 1;
  }

  vmesh::log::Init();

  vmesh::UdpSocketFactory sockets;
  vmesh::PosixNetworkInspector inspector;
  vmesh::MeshNetwork mesh(cfg, &sockets, &inspector);

  vmesh::Pcm16Codec codec;
  MeterPlayback playback;
  vmesh::AudioDownlink downlink(&codec, &playback, mesh.Config().max_audio_payload,
                                mesh.Config().max_decoded_samples);
  vmesh::AudioUplink uplink(&codec, &SendThroughMesh, &mesh);
  NodeConsole console(&mesh, &uplink);
  mesh.AddListener(&downlink);
  mesh.AddListener(&console);

  auto started = mesh.Start();
  if (!started.has_value()) {
    VMESH_LOG_ERROR("Node", "mesh failed to start: %s",
                    vmesh::MeshErrorName(started.get_error()));
    return 1;
  }

  for (const auto& peer : peers) {
    auto r = mesh.AddDirectConnection(peer);
    if (!r.has_value()) {
      VMESH_LOG_WARN("Node", "direct connect to %s: %s", peer.c_str(),
                     vmesh::ConnectErrorName(r.get_error()));
    }
  }

  ToneSource tone_source;
  tone_source.uplink = &uplink;
  vmesh::TimerScheduler tone_timer(1);
  if (tone) {
    if (!tone_timer.Add(500, &ToneTick, &tone_source).has_value() ||
        !tone_timer.Start().has_value()) {
      VMESH_LOG_WARN("Node", "test tone unavailable");
    }
  }

  VMESH_LOG_INFO("Node", "%s running, Ctrl-C to stop",
                 mesh.LocalNodeId().c_str());
  int sig = 0;
  (void)sigwait(&signals, &sig);
  VMESH_LOG_INFO("Node", "signal %d, shutting down", sig);

  tone_timer.Stop();
  mesh.Stop();

  vmesh::DownlinkStats stats = downlink.Stats();
  VMESH_LOG_INFO("Node", "played %llu frames, dropped %llu",
                 static_cast<unsigned long long>(stats.played),
                 static_cast<unsigned long long>(
                     stats.dropped_empty + stats.dropped_oversize +
                     stats.dropped_decode + stats.dropped_samples));
  vmesh::log::Shutdown();
  return 0;
}
