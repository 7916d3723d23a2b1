/**
 * @file fake_network.hpp
 * @brief In-memory datagram switch for driving mesh sessions in tests.
 *
 * A FakeSwitch connects any number of FakeHosts. Each host plays both
 * SocketFactory and NetworkInspector for one MeshNetwork. Datagrams to a
 * x.y.z.255 or 255.255.255.255 address reach every socket bound to the
 * port, the sender's own included, as a real broadcast does.
 */

#ifndef VMESH_TESTS_FAKE_NETWORK_HPP_
#define VMESH_TESTS_FAKE_NETWORK_HPP_

#include "vmesh/net_if.hpp"
#include "vmesh/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vmesh_test {

struct SentDatagram {
  std::string from;
  std::string to;
  uint16_t port;
  std::vector<uint8_t> bytes;
};

class FakeSocket;

class FakeSwitch {
 public:
  void Register(FakeSocket* sock) {
    std::lock_guard<std::mutex> lock(mutex_);
    sockets_.push_back(sock);
  }

  void Unregister(FakeSocket* sock) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sockets_.begin(); it != sockets_.end(); ++it) {
      if (*it == sock) {
        sockets_.erase(it);
        return;
      }
    }
  }

  bool IsBound(const std::string& address, uint16_t port);

  void Deliver(const std::string& from, const std::string& to, uint16_t port,
               const uint8_t* data, uint32_t len);

  std::vector<SentDatagram> Sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  void ClearSent() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
  }

  /// Disabled broadcasts are recorded as sent but reach nobody.
  void SetBroadcastEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcast_enabled_ = enabled;
  }

  static bool IsBroadcast(const std::string& address) {
    return address.size() > 4 &&
           address.compare(address.size() - 4, 4, ".255") == 0;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<FakeSocket*> sockets_;
  std::vector<SentDatagram> sent_;
  bool broadcast_enabled_ = true;
};

class FakeSocket final : public vmesh::DatagramSocket {
 public:
  FakeSocket(FakeSwitch* sw, std::string address, uint16_t port)
      : switch_(sw), address_(std::move(address)), port_(port) {
    switch_->Register(this);
  }

  ~FakeSocket() override { switch_->Unregister(this); }

  vmesh::expected<void, vmesh::SocketError> SendTo(
      const uint8_t* data, uint32_t len, const std::string& address,
      uint16_t port) override {
    using Result = vmesh::expected<void, vmesh::SocketError>;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return Result::error(vmesh::SocketError::kClosed);
    }
    switch_->Deliver(address_, address, port, data, len);
    return Result::success();
  }

  vmesh::expected<uint32_t, vmesh::SocketError> ReceiveFrom(
      uint8_t* buf, uint32_t cap, std::string& sender) override {
    using Result = vmesh::expected<uint32_t, vmesh::SocketError>;
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !inbox_.empty(); });
    if (closed_) return Result::error(vmesh::SocketError::kClosed);
    Packet p = std::move(inbox_.front());
    inbox_.pop_front();
    uint32_t n = static_cast<uint32_t>(p.bytes.size());
    if (n > cap) n = cap;  // truncates like a short UDP buffer
    if (n > 0) std::memcpy(buf, p.bytes.data(), n);
    sender = p.from;
    return Result::success(n);
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  uint16_t LocalPort() const override { return port_; }

  void Push(const std::string& from, const uint8_t* data, uint32_t len) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return;
      inbox_.push_back(Packet{from, std::vector<uint8_t>(data, data + len)});
    }
    cv_.notify_one();
  }

  const std::string& Address() const { return address_; }

 private:
  struct Packet {
    std::string from;
    std::vector<uint8_t> bytes;
  };

  FakeSwitch* switch_;
  const std::string address_;
  const uint16_t port_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Packet> inbox_;
  bool closed_ = false;
};

inline bool FakeSwitch::IsBound(const std::string& address, uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (FakeSocket* s : sockets_) {
    if (s->Address() == address && s->LocalPort() == port) return true;
  }
  return false;
}

inline void FakeSwitch::Deliver(const std::string& from, const std::string& to,
                                uint16_t port, const uint8_t* data,
                                uint32_t len) {
  std::lock_guard<std::mutex> lock(mutex_);
  sent_.push_back(SentDatagram{from, to, port,
                               std::vector<uint8_t>(data, data + len)});
  const bool broadcast = IsBroadcast(to);
  if (broadcast && !broadcast_enabled_) return;
  for (FakeSocket* s : sockets_) {
    if (s->LocalPort() != port) continue;
    if (broadcast || s->Address() == to) s->Push(from, data, len);
  }
}

/**
 * @brief One machine on the fake network: opens sockets at its address and
 *        answers interface and reachability queries.
 */
class FakeHost final : public vmesh::SocketFactory,
                       public vmesh::NetworkInspector {
 public:
  FakeHost(FakeSwitch* sw, std::string address)
      : switch_(sw), address_(std::move(address)) {}

  vmesh::expected<std::unique_ptr<vmesh::DatagramSocket>, vmesh::SocketError>
  Open(uint16_t port) override {
    using Result = vmesh::expected<std::unique_ptr<vmesh::DatagramSocket>,
                                   vmesh::SocketError>;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (failing_ports_.count(port) != 0) {
        return Result::error(vmesh::SocketError::kBindFailed);
      }
    }
    if (switch_->IsBound(address_, port)) {
      return Result::error(vmesh::SocketError::kBindFailed);
    }
    return Result::success(std::unique_ptr<vmesh::DatagramSocket>(
        new FakeSocket(switch_, address_, port)));
  }

  vmesh::expected<std::vector<vmesh::InterfaceAddress>, vmesh::NetIfError>
  ListActiveInterfaces() override {
    using Result = vmesh::expected<std::vector<vmesh::InterfaceAddress>,
                                   vmesh::NetIfError>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!interfaces_up_) {
      return Result::error(vmesh::NetIfError::kEnumerationFailed);
    }
    vmesh::InterfaceAddress itf;
    itf.name = "fake0";
    itf.address = address_;
    itf.broadcast = vmesh::SubnetPrefix24(address_) + ".255";
    return Result::success(std::vector<vmesh::InterfaceAddress>{itf});
  }

  bool IsReachable(const std::string& address, uint32_t /*timeout_ms*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    probed_.push_back(address);
    return reachable_.count(address) != 0;
  }

  void FailPort(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ports_.insert(port);
  }

  void SetReachable(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_.insert(address);
  }

  void SetInterfacesUp(bool up) {
    std::lock_guard<std::mutex> lock(mutex_);
    interfaces_up_ = up;
  }

  std::vector<std::string> Probed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }

  const std::string& Address() const { return address_; }

 private:
  FakeSwitch* switch_;
  const std::string address_;
  mutable std::mutex mutex_;
  std::set<uint16_t> failing_ports_;
  std::set<std::string> reachable_;
  std::vector<std::string> probed_;
  bool interfaces_up_ = true;
};

/// Poll @p pred every 10 ms for up to @p timeout_ms.
template <typename Pred>
bool WaitFor(Pred pred, uint32_t timeout_ms = 3000) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

}  // namespace vmesh_test

#endif  // VMESH_TESTS_FAKE_NETWORK_HPP_
