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
 * @file outbox.hpp
 * @brief Outbound datagram path of a mesh session.
 *
 * The engine never touches sockets directly: it posts serialized messages
 * to an Outbox together with the plane they travel on. DirectOutbox sends
 * inline on the caller's thread; PooledOutbox hands each datagram to a
 * WorkerPool so senders never block on the socket.
 */

#ifndef VMESH_OUTBOX_HPP_
#define VMESH_OUTBOX_HPP_

#include "vmesh/log.hpp"
#include "vmesh/transport.hpp"
#include "vmesh/worker_pool.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vmesh {

enum class SendError : uint8_t {
  kNoSocket = 0,
  kTransport,
  kQueueFull,
  kNotRunning,
};

class Outbox {
 public:
  virtual ~Outbox() = default;

  virtual expected<void, SendError> Post(Channel channel,
                                         std::vector<uint8_t> bytes,
                                         const std::string& address,
                                         uint16_t port) = 0;
};

// ============================================================================
// DirectOutbox
// ============================================================================

/**
 * @brief Sends on the caller's thread through the attached sockets.
 *
 * Sockets are borrowed; Attach() before the first Post() and Detach()
 * only after every poster has stopped.
 */
class DirectOutbox final : public Outbox {
 public:
  void Attach(DatagramSocket* control, DatagramSocket* audio) noexcept {
    control_ = control;
    audio_ = audio;
  }

  void Detach() noexcept {
    control_ = nullptr;
    audio_ = nullptr;
  }

  expected<void, SendError> Post(Channel channel, std::vector<uint8_t> bytes,
                                 const std::string& address,
                                 uint16_t port) override {
    DatagramSocket* sock = (channel == Channel::kAudio) ? audio_ : control_;
    if (sock == nullptr) {
      return expected<void, SendError>::error(SendError::kNoSocket);
    }
    auto r = sock->SendTo(bytes.data(), static_cast<uint32_t>(bytes.size()),
                          address, port);
    if (!r.has_value()) {
      VMESH_LOG_DEBUG("Outbox", "send to %s:%u failed: %s", address.c_str(),
                      static_cast<unsigned>(port),
                      SocketErrorName(r.get_error()));
      return expected<void, SendError>::error(SendError::kTransport);
    }
    return expected<void, SendError>::success();
  }

 private:
  DatagramSocket* control_ = nullptr;
  DatagramSocket* audio_ = nullptr;
};

// ============================================================================
// PooledOutbox
// ============================================================================

class PooledOutbox final : public Outbox {
 public:
  struct Datagram {
    Channel channel = Channel::kControl;
    std::vector<uint8_t> bytes;
    std::string address;
    uint16_t port = 0;
  };

  explicit PooledOutbox(uint32_t workers, uint32_t queue_depth = 256)
      : pool_(MakeConfig(workers, queue_depth)) {
    pool_.SetHandler(&PooledOutbox::SendTask, this);
  }

  ~PooledOutbox() override { Stop(); }

  /** @brief Attach sockets and start the workers. */
  expected<void, PoolError> Start(DatagramSocket* control,
                                  DatagramSocket* audio) {
    direct_.Attach(control, audio);
    return pool_.Start();
  }

  /** @brief Flush queued datagrams, join workers, release the sockets. */
  void Stop() {
    pool_.Shutdown();
    direct_.Detach();
  }

  expected<void, SendError> Post(Channel channel, std::vector<uint8_t> bytes,
                                 const std::string& address,
                                 uint16_t port) override {
    Datagram d;
    d.channel = channel;
    d.bytes = std::move(bytes);
    d.address = address;
    d.port = port;
    auto r = pool_.Submit(std::move(d));
    if (!r.has_value()) {
      if (r.get_error() == PoolError::kQueueFull) {
        VMESH_LOG_WARN("Outbox", "send queue full, dropping datagram to %s",
                       address.c_str());
        return expected<void, SendError>::error(SendError::kQueueFull);
      }
      return expected<void, SendError>::error(SendError::kNotRunning);
    }
    return expected<void, SendError>::success();
  }

  /** @brief Block until every queued datagram has been handed to a socket. */
  void Flush() { pool_.WaitIdle(); }

  WorkerPoolStats GetStats() const noexcept { return pool_.GetStats(); }

 private:
  static WorkerPoolConfig MakeConfig(uint32_t workers, uint32_t depth) {
    WorkerPoolConfig cfg;
    cfg.name = "outbox";
    cfg.worker_num = workers;
    cfg.queue_depth = depth;
    return cfg;
  }

  static void SendTask(Datagram& d, void* ctx) {
    auto* self = static_cast<PooledOutbox*>(ctx);
    // Transport failures are logged by DirectOutbox; nothing to retry.
    (void)self->direct_.Post(d.channel, std::move(d.bytes), d.address, d.port);
  }

  DirectOutbox direct_;
  WorkerPool<Datagram> pool_;
};

}  // namespace vmesh

#endif  // VMESH_OUTBOX_HPP_
