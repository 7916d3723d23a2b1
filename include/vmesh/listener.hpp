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
 * @file listener.hpp
 * @brief Observer surface of a mesh session.
 *
 * Applications derive from MeshListener and override what they need.
 * Notifications run on the mesh threads (listener loops, timer, connect
 * worker); a listener that throws anything is logged and skipped, the loop
 * carries on.
 */

#ifndef VMESH_LISTENER_HPP_
#define VMESH_LISTENER_HPP_

#include "vmesh/log.hpp"
#include "vmesh/node_table.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace vmesh {

enum class MeshEventType : uint8_t {
  kStarted = 0,
  kStartFailed,
  kStopped,
  kConnectionEstablished,
  kConnectionTimeout,
  kConnectionBusy,  ///< Attempt rejected; try again later.
  kScanStarted,
  kScanFinished,
};

inline const char* MeshEventName(MeshEventType t) noexcept {
  switch (t) {
    case MeshEventType::kStarted:               return "started";
    case MeshEventType::kStartFailed:           return "failed to start";
    case MeshEventType::kStopped:               return "stopped";
    case MeshEventType::kConnectionEstablished: return "connection established";
    case MeshEventType::kConnectionTimeout:     return "connection timeout";
    case MeshEventType::kConnectionBusy:        return "connection busy, try again";
    case MeshEventType::kScanStarted:           return "scan started";
    case MeshEventType::kScanFinished:          return "scan finished";
  }
  return "unknown";
}

struct MeshEvent {
  MeshEventType type = MeshEventType::kStarted;
  std::string detail;  ///< Address, node id or reason; may be empty.
};

class MeshListener {
 public:
  virtual ~MeshListener() = default;

  /// AUDIO_DATA addressed to this node or to everyone.
  virtual void OnAudioData(const std::vector<uint8_t>& /*payload*/,
                           const std::string& /*source_id*/) {}

  /// CONTROL addressed to this node.
  virtual void OnControlMessage(const std::string& /*text*/,
                                const std::string& /*source_id*/) {}

  /// Full node projection after any membership change.
  virtual void OnNodesChanged(const std::vector<Node>& /*nodes*/) {}

  virtual void OnMeshEvent(const MeshEvent& /*event*/) {}
};

// ============================================================================
// ListenerRegistry
// ============================================================================

class ListenerRegistry {
 public:
  /** @brief Listener is borrowed and must outlive its registration. */
  void Add(MeshListener* listener) {
    if (listener == nullptr) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) ==
        listeners_.end()) {
      listeners_.push_back(listener);
    }
  }

  void Remove(MeshListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove(listeners_.begin(), listeners_.end(), listener),
        listeners_.end());
  }

  uint32_t Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(listeners_.size());
  }

  void NotifyAudio(const std::vector<uint8_t>& payload,
                   const std::string& source_id) {
    for (MeshListener* l : Copy()) {
      try {
        l->OnAudioData(payload, source_id);
      } catch (const std::exception& e) {
        VMESH_LOG_ERROR("Listener", "audio sink threw: %s", e.what());
      } catch (...) {
        VMESH_LOG_ERROR("Listener", "audio sink threw a non-standard exception");
      }
    }
  }

  void NotifyControl(const std::string& text, const std::string& source_id) {
    for (MeshListener* l : Copy()) {
      try {
        l->OnControlMessage(text, source_id);
      } catch (const std::exception& e) {
        VMESH_LOG_ERROR("Listener", "control handler threw: %s", e.what());
      } catch (...) {
        VMESH_LOG_ERROR("Listener", "control handler threw a non-standard exception");
      }
    }
  }

  void NotifyNodes(const std::vector<Node>& nodes) {
    for (MeshListener* l : Copy()) {
      try {
        l->OnNodesChanged(nodes);
      } catch (const std::exception& e) {
        VMESH_LOG_ERROR("Listener", "node observer threw: %s", e.what());
      } catch (...) {
        VMESH_LOG_ERROR("Listener", "node observer threw a non-standard exception");
      }
    }
  }

  void NotifyEvent(const MeshEvent& event) {
    for (MeshListener* l : Copy()) {
      try {
        l->OnMeshEvent(event);
      } catch (const std::exception& e) {
        VMESH_LOG_ERROR("Listener", "event observer threw: %s", e.what());
      } catch (...) {
        VMESH_LOG_ERROR("Listener", "event observer threw a non-standard exception");
      }
    }
  }

 private:
  std::vector<MeshListener*> Copy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_;
  }

  mutable std::mutex mutex_;
  std::vector<MeshListener*> listeners_;
};

}  // namespace vmesh

#endif  // VMESH_LISTENER_HPP_
