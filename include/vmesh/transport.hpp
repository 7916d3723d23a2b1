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
 * @file transport.hpp
 * @brief Datagram transport seam used by the mesh.
 *
 * The mesh owns two DatagramSockets (control and audio plane) obtained from
 * a SocketFactory. Production code uses UdpSocketFactory; tests substitute
 * an in-memory switch.
 */

#ifndef VMESH_TRANSPORT_HPP_
#define VMESH_TRANSPORT_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/socket.hpp"
#include "vmesh/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace vmesh {

/// Logical plane a datagram travels on.
enum class Channel : uint8_t {
  kControl = 0,
  kAudio,
};

// ============================================================================
// DatagramSocket
// ============================================================================

class DatagramSocket {
 public:
  virtual ~DatagramSocket() = default;

  /** @brief Send one datagram to @p address:@p port. */
  virtual expected<void, SocketError> SendTo(const uint8_t* data, uint32_t len,
                                             const std::string& address,
                                             uint16_t port) = 0;

  /**
   * @brief Block until one datagram arrives or the socket is closed.
   * @param sender  Receives the dotted-decimal source address.
   * @return Received length; kClosed once Close() was called.
   */
  virtual expected<uint32_t, SocketError> ReceiveFrom(uint8_t* buf,
                                                      uint32_t cap,
                                                      std::string& sender) = 0;

  /** @brief Wake pending receivers and refuse further traffic. Idempotent. */
  virtual void Close() = 0;

  virtual uint16_t LocalPort() const = 0;
};

class SocketFactory {
 public:
  virtual ~SocketFactory() = default;

  /** @brief Open a broadcast-capable datagram socket bound to @p port. */
  virtual expected<std::unique_ptr<DatagramSocket>, SocketError> Open(
      uint16_t port) = 0;
};

#if VMESH_HAS_NETWORK

// ============================================================================
// UDP implementation
// ============================================================================

class UdpDatagramSocket final : public DatagramSocket {
 public:
  /// Receive timeout used so a missed wake-up never blocks stop forever.
  static constexpr uint32_t kRecvPollMs = 1000;

  explicit UdpDatagramSocket(UdpSocket sock) noexcept
      : sock_(std::move(sock)) {}

  expected<void, SocketError> SendTo(const uint8_t* data, uint32_t len,
                                     const std::string& address,
                                     uint16_t port) override {
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, SocketError>::error(SocketError::kClosed);
    }
    auto dest = SocketAddress::FromIpv4(address.c_str(), port);
    if (!dest.has_value()) {
      return expected<void, SocketError>::error(dest.get_error());
    }
    auto r = sock_.SendTo(data, len, dest.value());
    if (!r.has_value()) {
      return expected<void, SocketError>::error(r.get_error());
    }
    return expected<void, SocketError>::success();
  }

  expected<uint32_t, SocketError> ReceiveFrom(uint8_t* buf, uint32_t cap,
                                              std::string& sender) override {
    while (!closed_.load(std::memory_order_acquire)) {
      SocketAddress src;
      auto r = sock_.RecvFrom(buf, cap, src);
      if (closed_.load(std::memory_order_acquire)) break;
      if (r.has_value()) {
        sender = src.Ip();
        return r;
      }
      if (r.get_error() != SocketError::kWouldBlock) return r;
    }
    return expected<uint32_t, SocketError>::error(SocketError::kClosed);
  }

  void Close() override {
    if (!closed_.exchange(true, std::memory_order_acq_rel)) {
      sock_.Shutdown();
    }
  }

  uint16_t LocalPort() const override { return sock_.LocalPort(); }

 private:
  UdpSocket sock_;  // descriptor released in the destructor, after readers join
  std::atomic<bool> closed_{false};
};

/**
 * @brief Opens UDP sockets bound to INADDR_ANY with SO_REUSEADDR and
 *        SO_BROADCAST set.
 */
class UdpSocketFactory final : public SocketFactory {
 public:
  expected<std::unique_ptr<DatagramSocket>, SocketError> Open(
      uint16_t port) override {
    using Result = expected<std::unique_ptr<DatagramSocket>, SocketError>;

    auto created = UdpSocket::Create();
    if (!created.has_value()) return Result::error(created.get_error());
    UdpSocket sock = std::move(created.value());

    auto r = sock.SetReuseAddr(true);
    if (r.has_value()) r = sock.SetBroadcast(true);
    if (r.has_value()) r = sock.SetRecvTimeout(UdpDatagramSocket::kRecvPollMs);
    if (!r.has_value()) return Result::error(r.get_error());

    r = sock.Bind(SocketAddress::Any(port));
    if (!r.has_value()) return Result::error(r.get_error());

    return Result::success(std::unique_ptr<DatagramSocket>(
        std::make_unique<UdpDatagramSocket>(std::move(sock))));
  }
};

#endif  // VMESH_HAS_NETWORK

}  // namespace vmesh

#endif  // VMESH_TRANSPORT_HPP_
