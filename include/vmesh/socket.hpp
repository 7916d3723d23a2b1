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
 * @file socket.hpp
 * @brief RAII IPv4 UDP socket over POSIX.
 *
 * Move-only fd ownership, errors returned through expected<V, SocketError>.
 * Shutdown() wakes a thread blocked in RecvFrom() without releasing the
 * descriptor, so the owner can join its reader before Close().
 */

#ifndef VMESH_SOCKET_HPP_
#define VMESH_SOCKET_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <cstdint>

namespace vmesh {

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kSendFailed,
  kRecvFailed,
  kSetOptFailed,
  kClosed,
  kWouldBlock  ///< Receive timeout elapsed; caller may retry.
};

inline const char* SocketErrorName(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:      return "invalid fd";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "recv failed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kClosed:         return "closed";
    case SocketError::kWouldBlock:     return "would block";
  }
  return "unknown";
}

}  // namespace vmesh

#if VMESH_HAS_NETWORK

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

namespace vmesh {

// ============================================================================
// SocketAddress
// ============================================================================

class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @brief Dotted-decimal IPv4 address and host-order port.
   * @return kInvalidAddress when @p ip does not parse.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief INADDR_ANY on @p port. */
  static SocketAddress Any(uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    sa.addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    return sa;
  }

  std::string Ip() const {
    char buf[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof(buf)) == nullptr) {
      return std::string();
    }
    return std::string(buf);
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// UdpSocket
// ============================================================================

class UdpSocket {
 public:
  UdpSocket() noexcept : fd_(-1) {}
  ~UdpSocket() { Close(); }

  UdpSocket(UdpSocket&& other) noexcept
      : fd_(other.fd_), shut_down_(other.shut_down_.load()) {
    other.fd_ = -1;
  }

  UdpSocket& operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      shut_down_.store(other.shut_down_.load());
      other.fd_ = -1;
    }
    return *this;
  }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  static expected<UdpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
      return expected<UdpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<UdpSocket, SocketError>::success(UdpSocket(fd));
  }

  // Options -----------------------------------------------------------------

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    return SetIntOption(SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  expected<void, SocketError> SetBroadcast(bool enable) noexcept {
    return SetIntOption(SOL_SOCKET, SO_BROADCAST, enable ? 1 : 0);
  }

  /** @brief Bound a blocking RecvFrom(); 0 blocks forever. */
  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  // Operations --------------------------------------------------------------

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<uint32_t, SocketError> SendTo(const void* data, size_t len,
                                         const SocketAddress& dest) noexcept {
    if (fd_ < 0) {
      return expected<uint32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::sendto(fd_, data, len, MSG_NOSIGNAL, dest.Raw(), dest.Size());
    if (n < 0) {
      return expected<uint32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<uint32_t, SocketError>::success(static_cast<uint32_t>(n));
  }

  /**
   * @brief Blocking receive of one datagram.
   *
   * Datagrams larger than @p len are truncated by the kernel.
   * @return kWouldBlock on receive timeout or EINTR, kClosed after
   *         Shutdown(), kRecvFailed otherwise.
   */
  expected<uint32_t, SocketError> RecvFrom(void* buf, size_t len,
                                           SocketAddress& src) noexcept {
    if (fd_ < 0) {
      return expected<uint32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = src.Size();
    auto n = ::recvfrom(fd_, buf, len, 0, src.RawMut(), &addr_len);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return expected<uint32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<uint32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    if (n == 0 && shut_down_.load(std::memory_order_acquire)) {
      return expected<uint32_t, SocketError>::error(SocketError::kClosed);
    }
    return expected<uint32_t, SocketError>::success(static_cast<uint32_t>(n));
  }

  /** @brief Wake any blocked RecvFrom(); the descriptor stays open. */
  void Shutdown() noexcept {
    if (fd_ >= 0) {
      shut_down_.store(true, std::memory_order_release);
      // ENOTCONN is expected on an unconnected datagram socket; the
      // pending receive is still woken.
      (void)::shutdown(fd_, SHUT_RDWR);
    }
  }

  /** @brief Close the socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  /** @brief Bound port in host byte order, 0 if unbound or invalid. */
  uint16_t LocalPort() const noexcept {
    if (fd_ < 0) return 0;
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&local), &len) < 0) {
      return 0;
    }
    return ntohs(local.sin_port);
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit UdpSocket(int32_t fd) noexcept : fd_(fd) {}

  expected<void, SocketError> SetIntOption(int level, int name,
                                           int value) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::setsockopt(fd_, level, name, &value, sizeof(value)) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  int32_t fd_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace vmesh

#endif  // VMESH_HAS_NETWORK

#endif  // VMESH_SOCKET_HPP_
