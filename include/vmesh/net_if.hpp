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
 * @file net_if.hpp
 * @brief Local network introspection and address helpers.
 *
 * NetworkInspector is the seam through which the mesh learns its own
 * addresses and probes hosts. PosixNetworkInspector implements it with
 * getifaddrs() and a non-blocking TCP connect.
 */

#ifndef VMESH_NET_IF_HPP_
#define VMESH_NET_IF_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#if VMESH_HAS_NETWORK
#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#endif

namespace vmesh {

enum class NetIfError : uint8_t {
  kEnumerationFailed = 0,
  kNoInterfaces,
};

struct InterfaceAddress {
  std::string name;
  std::string address;    ///< Dotted-decimal IPv4.
  std::string broadcast;  ///< Empty when the interface has none.
};

// ============================================================================
// NetworkInspector
// ============================================================================

class NetworkInspector {
 public:
  virtual ~NetworkInspector() = default;

  /** @brief Up, non-loopback IPv4 interfaces. */
  virtual expected<std::vector<InterfaceAddress>, NetIfError>
  ListActiveInterfaces() = 0;

  /** @brief True when @p address answers within @p timeout_ms. */
  virtual bool IsReachable(const std::string& address, uint32_t timeout_ms) = 0;
};

#if VMESH_HAS_NETWORK

class PosixNetworkInspector final : public NetworkInspector {
 public:
  /// TCP echo port; a refusal still proves the host is up.
  static constexpr uint16_t kProbePort = 7;

  expected<std::vector<InterfaceAddress>, NetIfError> ListActiveInterfaces()
      override {
    using Result = expected<std::vector<InterfaceAddress>, NetIfError>;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) == -1) {
      return Result::error(NetIfError::kEnumerationFailed);
    }

    std::vector<InterfaceAddress> out;
    for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
      if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
        continue;
      }
      if ((ifa->ifa_flags & IFF_UP) == 0 ||
          (ifa->ifa_flags & IFF_LOOPBACK) != 0) {
        continue;
      }
      InterfaceAddress entry;
      entry.name = ifa->ifa_name;
      entry.address = ToText(ifa->ifa_addr);
      if ((ifa->ifa_flags & IFF_BROADCAST) != 0 &&
          ifa->ifa_broadaddr != nullptr) {
        entry.broadcast = ToText(ifa->ifa_broadaddr);
      }
      if (!entry.address.empty()) out.push_back(entry);
    }
    ::freeifaddrs(list);

    if (out.empty()) return Result::error(NetIfError::kNoInterfaces);
    return Result::success(std::move(out));
  }

  bool IsReachable(const std::string& address, uint32_t timeout_ms) override {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(kProbePort);
    if (::inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
      return false;
    }

    int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return false;
    int32_t flags = ::fcntl(fd, F_GETFL, 0);
    (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool reachable = false;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    int32_t rc = ::connect(fd, reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (rc == 0) {
      reachable = true;
    } else if (errno == ECONNREFUSED) {
      reachable = true;
    } else if (errno == EINPROGRESS) {
      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      if (::poll(&pfd, 1, static_cast<int>(timeout_ms)) > 0) {
        int32_t err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0) {
          reachable = (err == 0 || err == ECONNREFUSED);
        }
      }
    }
    ::close(fd);
    return reachable;
  }

 private:
  static std::string ToText(const sockaddr* sa) {
    char buf[INET_ADDRSTRLEN] = {};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
    if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf)) == nullptr) {
      return std::string();
    }
    return std::string(buf);
  }
};

#endif  // VMESH_HAS_NETWORK

// ============================================================================
// Address helpers
// ============================================================================

constexpr const char* kLimitedBroadcast = "255.255.255.255";

/// Well-known group / home / private subnets tried when enumeration fails.
inline const std::vector<std::string>& FallbackBroadcasts() {
  static const std::vector<std::string> kList = {
      "192.168.49.255", "192.168.1.255", "10.0.0.255"};
  return kList;
}

inline std::vector<std::string> LocalAddresses(
    const std::vector<InterfaceAddress>& interfaces) {
  std::vector<std::string> out;
  for (const auto& itf : interfaces) out.push_back(itf.address);
  return out;
}

/**
 * @brief Destinations of a discovery broadcast.
 *
 * Always the limited broadcast first, then each distinct interface
 * broadcast. When @p interfaces is an error the fallback list is appended.
 */
inline std::vector<std::string> BroadcastTargets(
    const expected<std::vector<InterfaceAddress>, NetIfError>& interfaces) {
  std::vector<std::string> out{kLimitedBroadcast};
  auto add = [&out](const std::string& a) {
    if (a.empty()) return;
    for (const auto& existing : out) {
      if (existing == a) return;
    }
    out.push_back(a);
  };
  if (interfaces.has_value()) {
    for (const auto& itf : interfaces.value()) add(itf.broadcast);
  } else {
    for (const auto& a : FallbackBroadcasts()) add(a);
  }
  return out;
}

/** @brief "a.b.c" of a dotted-decimal "a.b.c.d"; empty if malformed. */
inline std::string SubnetPrefix24(const std::string& address) {
  uint32_t dots = 0;
  size_t last = std::string::npos;
  for (size_t i = 0; i < address.size(); ++i) {
    char c = address[i];
    if (c == '.') {
      ++dots;
      last = i;
    } else if (c < '0' || c > '9') {
      return std::string();
    }
  }
  if (dots != 3 || last == 0 || last + 1 >= address.size()) return std::string();
  return address.substr(0, last);
}

/**
 * @brief Hosts .1 to .254 of the /24 around @p local_address, minus local
 *        and already known addresses.
 */
inline std::vector<std::string> ScanTargets(
    const std::string& local_address,
    const std::vector<std::string>& exclude) {
  std::vector<std::string> out;
  std::string prefix = SubnetPrefix24(local_address);
  if (prefix.empty()) return out;

  std::unordered_set<std::string> skip(exclude.begin(), exclude.end());
  skip.insert(local_address);
  out.reserve(254);
  for (uint32_t host = 1; host <= 254; ++host) {
    std::string candidate = prefix + "." + std::to_string(host);
    if (skip.count(candidate) == 0) out.push_back(candidate);
  }
  return out;
}

/** @brief Node id a peer is known by when discovered from its address. */
inline std::string NodeIdFromAddress(const std::string& address) {
  std::string id = "node-" + address;
  for (size_t i = 5; i < id.size(); ++i) {
    if (id[i] == '.') id[i] = '-';
  }
  return id;
}

}  // namespace vmesh

#endif  // VMESH_NET_IF_HPP_
