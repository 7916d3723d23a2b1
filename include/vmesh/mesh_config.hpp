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
 * @file mesh_config.hpp
 * @brief Tunables of a mesh session and their loading from a ConfigStore.
 *
 * Recognised keys (all optional):
 *
 *   [mesh]    node_id, display_name, control_port, default_ttl,
 *             send_workers, send_queue_depth
 *   [timing]  discovery_interval_ms, heartbeat_interval_ms,
 *             maintenance_interval_ms, node_timeout_ms, max_route_age_ms,
 *             dedup_retention_ms, response_retention_ms,
 *             response_min_interval_ms, receive_error_backoff_ms,
 *             direct_connect_debounce_ms, direct_connect_attempts,
 *             direct_connect_spacing_ms, connect_cooldown_ms,
 *             connect_timeout_ms
 *   [scan]    probe_timeout_ms, batch_size, batch_pause_ms,
 *             auto_scan_grace_ms
 *   [audio]   control_buffer_size, audio_buffer_size, max_payload,
 *             max_decoded_samples
 */

#ifndef VMESH_MESH_CONFIG_HPP_
#define VMESH_MESH_CONFIG_HPP_

#include "vmesh/config.hpp"
#include "vmesh/message.hpp"

#include <cstdint>
#include <string>

namespace vmesh {

struct MeshConfig {
  std::string node_id;  ///< Empty: generated at construction of the mesh.
  std::string display_name = "vmesh";
  uint16_t control_port = 8888;
  int32_t default_ttl = kDefaultTtl;

  uint32_t discovery_interval_ms = 10000;
  uint32_t heartbeat_interval_ms = 5000;
  uint32_t maintenance_interval_ms = 5000;
  uint32_t node_timeout_ms = 15000;
  uint32_t max_route_age_ms = 30000;
  uint32_t dedup_retention_ms = 60000;
  uint32_t response_retention_ms = 300000;
  uint32_t response_min_interval_ms = 5000;
  uint32_t receive_error_backoff_ms = 1000;

  uint32_t direct_connect_debounce_ms = 30000;
  uint32_t direct_connect_attempts = 3;
  uint32_t direct_connect_spacing_ms = 200;
  uint32_t connect_cooldown_ms = 3000;
  uint32_t connect_timeout_ms = 10000;

  uint32_t scan_probe_timeout_ms = 500;
  uint32_t scan_batch_size = 20;
  uint32_t scan_batch_pause_ms = 100;
  uint32_t auto_scan_grace_ms = 20000;  ///< 0 disables the automatic scan.

  uint32_t control_buffer_size = 1024;
  uint32_t audio_buffer_size = 4096;
  uint32_t max_audio_payload = 16384;
  uint32_t max_decoded_samples = 8192;

  uint32_t send_workers = 2;
  uint32_t send_queue_depth = 256;

  /// Data plane runs one port above the control plane.
  uint16_t AudioPort() const noexcept {
    return static_cast<uint16_t>(control_port + 1U);
  }
};

/** @brief "node-" followed by 8 random hex characters. */
inline std::string GenerateLocalNodeId() {
  return "node-" + GenerateMessageId().substr(0, 8);
}

/**
 * @brief Overlay the keys present in @p store on top of @p base.
 *
 * Missing or malformed keys keep the base value.
 * @return kInvalidValue when the result cannot run (zero intervals, a zero
 *         or 65535 control port, empty buffers, zero workers).
 */
inline expected<MeshConfig, ConfigError> LoadMeshConfig(
    const ConfigStore& store, const MeshConfig& base = MeshConfig{}) {
  MeshConfig c = base;

  if (store.HasKey("mesh", "node_id")) c.node_id = store.GetString("mesh", "node_id");
  if (store.HasKey("mesh", "display_name"))
    c.display_name = store.GetString("mesh", "display_name");
  c.control_port = store.GetPort("mesh", "control_port", c.control_port);
  c.default_ttl = store.GetInt("mesh", "default_ttl", c.default_ttl);
  c.send_workers = store.GetUint32("mesh", "send_workers", c.send_workers);
  c.send_queue_depth =
      store.GetUint32("mesh", "send_queue_depth", c.send_queue_depth);

  struct Field {
    const char* section;
    const char* key;
    uint32_t* target;
  };
  const Field fields[] = {
      {"timing", "discovery_interval_ms", &c.discovery_interval_ms},
      {"timing", "heartbeat_interval_ms", &c.heartbeat_interval_ms},
      {"timing", "maintenance_interval_ms", &c.maintenance_interval_ms},
      {"timing", "node_timeout_ms", &c.node_timeout_ms},
      {"timing", "max_route_age_ms", &c.max_route_age_ms},
      {"timing", "dedup_retention_ms", &c.dedup_retention_ms},
      {"timing", "response_retention_ms", &c.response_retention_ms},
      {"timing", "response_min_interval_ms", &c.response_min_interval_ms},
      {"timing", "receive_error_backoff_ms", &c.receive_error_backoff_ms},
      {"timing", "direct_connect_debounce_ms", &c.direct_connect_debounce_ms},
      {"timing", "direct_connect_attempts", &c.direct_connect_attempts},
      {"timing", "direct_connect_spacing_ms", &c.direct_connect_spacing_ms},
      {"timing", "connect_cooldown_ms", &c.connect_cooldown_ms},
      {"timing", "connect_timeout_ms", &c.connect_timeout_ms},
      {"scan", "probe_timeout_ms", &c.scan_probe_timeout_ms},
      {"scan", "batch_size", &c.scan_batch_size},
      {"scan", "batch_pause_ms", &c.scan_batch_pause_ms},
      {"scan", "auto_scan_grace_ms", &c.auto_scan_grace_ms},
      {"audio", "control_buffer_size", &c.control_buffer_size},
      {"audio", "audio_buffer_size", &c.audio_buffer_size},
      {"audio", "max_payload", &c.max_audio_payload},
      {"audio", "max_decoded_samples", &c.max_decoded_samples},
  };
  for (const Field& f : fields) {
    *f.target = store.GetUint32(f.section, f.key, *f.target);
  }

  if (c.control_port == 0 || c.control_port == 65535 ||
      c.discovery_interval_ms == 0 || c.heartbeat_interval_ms == 0 ||
      c.maintenance_interval_ms == 0 || c.control_buffer_size == 0 ||
      c.audio_buffer_size == 0 || c.send_workers == 0 ||
      c.send_queue_depth == 0 || c.scan_batch_size == 0 ||
      c.default_ttl < 0) {
    return expected<MeshConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<MeshConfig, ConfigError>::success(c);
}

}  // namespace vmesh

#endif  // VMESH_MESH_CONFIG_HPP_
