/**
 * @file test_mesh_engine.cpp
 * @brief Tests for mesh_engine.hpp, driven step by step without threads.
 */

#include "vmesh/mesh_engine.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using vmesh::Channel;
using vmesh::Message;
using vmesh::MessageType;

namespace {

struct Posted {
  Channel channel;
  std::vector<uint8_t> bytes;
  std::string address;
  uint16_t port;

  Message Decoded() const { return vmesh::Deserialize(bytes).value(); }
};

class RecordingOutbox : public vmesh::Outbox {
 public:
  vmesh::expected<void, vmesh::SendError> Post(Channel channel,
                                               std::vector<uint8_t> bytes,
                                               const std::string& address,
                                               uint16_t port) override {
    posted.push_back(Posted{channel, std::move(bytes), address, port});
    return vmesh::expected<void, vmesh::SendError>::success();
  }

  std::vector<Posted> posted;
};

class Recorder : public vmesh::MeshListener {
 public:
  void OnAudioData(const std::vector<uint8_t>& payload,
                   const std::string& source_id) override {
    audio.push_back(std::string(payload.begin(), payload.end()));
    audio_sources.push_back(source_id);
  }
  void OnControlMessage(const std::string& text,
                        const std::string& source_id) override {
    control.push_back(text);
    control_sources.push_back(source_id);
  }
  void OnNodesChanged(const std::vector<vmesh::Node>& nodes) override {
    node_counts.push_back(static_cast<uint32_t>(nodes.size()));
  }

  std::vector<std::string> audio;
  std::vector<std::string> audio_sources;
  std::vector<std::string> control;
  std::vector<std::string> control_sources;
  std::vector<uint32_t> node_counts;
};

class ThrowingListener : public vmesh::MeshListener {
 public:
  void OnNodesChanged(const std::vector<vmesh::Node>&) override {
    throw std::runtime_error("observer broke");
  }
};

struct HookCalls {
  std::vector<std::string> addresses;
  std::vector<std::string> ids;
};

void RecordHook(const std::string& address, const std::string& node_id,
                void* ctx) {
  auto* calls = static_cast<HookCalls*>(ctx);
  calls->addresses.push_back(address);
  calls->ids.push_back(node_id);
}

/// One engine with its collaborators.
struct Fixture {
  Fixture() : Fixture("node-a") {}
  explicit Fixture(const std::string& id)
      : state(std::make_shared<vmesh::MeshState>()),
        engine(id, cfg, state, &outbox, &listeners) {
    listeners.Add(&recorder);
    engine.SetDiscoveryHook(&RecordHook, &hooks);
  }

  void Control(const Message& msg, const std::string& sender, int64_t now) {
    auto bytes = vmesh::Serialize(msg);
    engine.HandleControlDatagram(bytes.data(),
                                 static_cast<uint32_t>(bytes.size()), sender,
                                 now);
  }

  void Audio(const Message& msg, const std::string& sender, int64_t now) {
    auto bytes = vmesh::Serialize(msg);
    engine.HandleAudioDatagram(bytes.data(), static_cast<uint32_t>(bytes.size()),
                               sender, now);
  }

  vmesh::MeshConfig cfg;
  std::shared_ptr<vmesh::MeshState> state;
  RecordingOutbox outbox;
  vmesh::ListenerRegistry listeners;
  Recorder recorder;
  HookCalls hooks;
  vmesh::MeshEngine engine;
};

Message Discovery(const std::string& from, const std::string& name) {
  return vmesh::MakeMessage(from, vmesh::kBroadcastId, MessageType::kDiscovery,
                            vmesh::TextPayload(from + "|" + name));
}

Message Text(const std::string& from, const std::string& to,
             const std::string& text, int32_t ttl = vmesh::kDefaultTtl) {
  return vmesh::MakeMessage(from, to, MessageType::kControl,
                            vmesh::TextPayload(text), ttl);
}

}  // namespace

// ============================================================================
// Discovery
// ============================================================================

TEST_CASE("engine - discovery creates node, route and reply", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);

  vmesh::Node node;
  REQUIRE(f.state->nodes.Find("node-b", &node));
  REQUIRE(node.display_name == "bravo");
  REQUIRE(node.address == "192.168.49.2");
  REQUIRE(node.port == 8888);
  REQUIRE(node.is_direct);
  REQUIRE(node.hop_count == 1U);
  REQUIRE(node.last_seen_ms == 1000);

  vmesh::Route route;
  REQUIRE(f.state->routes.Find("node-b", &route));
  REQUIRE(route.next_hop_id == "node-b");

  REQUIRE(f.outbox.posted.size() == 1U);
  const Posted& reply = f.outbox.posted[0];
  REQUIRE(reply.channel == Channel::kControl);
  REQUIRE(reply.address == "192.168.49.2");
  REQUIRE(reply.port == 8888);
  Message m = reply.Decoded();
  REQUIRE(m.type == MessageType::kDiscovery);
  REQUIRE(m.destination_id == "discovery");
  REQUIRE(m.source_id == "node-a");
  REQUIRE(m.PayloadText() == "node-a|vmesh");

  REQUIRE(f.recorder.node_counts == std::vector<uint32_t>{1});
  REQUIRE(f.hooks.addresses == std::vector<std::string>{"192.168.49.2"});
  REQUIRE(f.hooks.ids == std::vector<std::string>{"node-b"});
}

TEST_CASE("engine - discovery replies are rate limited per sender", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 3000);
  REQUIRE(f.outbox.posted.size() == 1U);
  REQUIRE(f.engine.Stats().replies_rate_limited == 1U);

  // The node entry is still refreshed.
  vmesh::Node node;
  REQUIRE(f.state->nodes.Find("node-b", &node));
  REQUIRE(node.last_seen_ms == 3000);

  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 6000);
  REQUIRE(f.outbox.posted.size() == 2U);

  // Another sender is not limited.
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 6001);
  REQUIRE(f.outbox.posted.size() == 3U);
  REQUIRE(f.engine.Stats().discovery_replies == 3U);
}

TEST_CASE("engine - every discovery publishes the node list", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1500);
  REQUIRE(f.recorder.node_counts.size() == 2U);
}

TEST_CASE("engine - discovery naming our own id is ignored", "[engine]") {
  Fixture f;
  Message msg = vmesh::MakeMessage("node-z", vmesh::kBroadcastId,
                                   MessageType::kDiscovery,
                                   vmesh::TextPayload("node-a|impostor"));
  f.Control(msg, "192.168.49.9", 1000);
  REQUIRE(f.state->nodes.Size() == 0U);
  REQUIRE(f.outbox.posted.empty());
}

TEST_CASE("engine - malformed discovery payload is dropped", "[engine]") {
  Fixture f;
  Message no_pipe = vmesh::MakeMessage("node-b", vmesh::kBroadcastId,
                                       MessageType::kDiscovery,
                                       vmesh::TextPayload("node-b"));
  Message empty_id = vmesh::MakeMessage("node-b", vmesh::kBroadcastId,
                                        MessageType::kDiscovery,
                                        vmesh::TextPayload("|bravo"));
  f.Control(no_pipe, "192.168.49.2", 1000);
  f.Control(empty_id, "192.168.49.2", 1000);
  REQUIRE(f.state->nodes.Size() == 0U);
  REQUIRE(f.outbox.posted.empty());
}

// ============================================================================
// Filtering
// ============================================================================

TEST_CASE("engine - duplicate message ids are processed once", "[engine]") {
  Fixture f;
  Message msg = Discovery("node-b", "bravo");
  f.Control(msg, "192.168.49.2", 1000);
  f.Control(msg, "192.168.49.2", 9000);
  REQUIRE(f.engine.Stats().duplicates == 1U);
  REQUIRE(f.recorder.node_counts.size() == 1U);
}

TEST_CASE("engine - own messages are dropped on both planes", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-a", "alpha"), "192.168.49.1", 1000);
  f.Audio(vmesh::MakeMessage("node-a", vmesh::kBroadcastId,
                             MessageType::kAudioData, vmesh::TextPayload("pcm")),
          "192.168.49.1", 1000);
  REQUIRE(f.engine.Stats().self_dropped == 2U);
  REQUIRE(f.state->nodes.Size() == 0U);
  REQUIRE(f.recorder.audio.empty());
  REQUIRE(f.outbox.posted.empty());
}

TEST_CASE("engine - undecodable datagrams are counted and dropped", "[engine]") {
  Fixture f;
  const std::string junk = "not|a|mesh|message";
  f.engine.HandleControlDatagram(reinterpret_cast<const uint8_t*>(junk.data()),
                                 static_cast<uint32_t>(junk.size()),
                                 "192.168.49.2", 1000);
  REQUIRE(f.engine.Stats().decode_failures == 1U);
  REQUIRE(f.engine.Stats().received == 1U);
}

// ============================================================================
// Control and forwarding
// ============================================================================

TEST_CASE("engine - control for us reaches listeners", "[engine]") {
  Fixture f;
  f.Control(Text("node-b", "node-a", "mute_request"), "192.168.49.2", 1000);
  REQUIRE(f.recorder.control == std::vector<std::string>{"mute_request"});
  REQUIRE(f.recorder.control_sources == std::vector<std::string>{"node-b"});
  REQUIRE(f.outbox.posted.empty());
}

TEST_CASE("engine - control for another node is forwarded", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 1000);
  f.outbox.posted.clear();

  const Message original = Text("node-b", "node-c", "hello", 3);
  f.Control(original, "192.168.49.2", 1100);
  REQUIRE(f.outbox.posted.size() == 1U);
  const Posted& p = f.outbox.posted[0];
  REQUIRE(p.channel == Channel::kControl);
  REQUIRE(p.address == "192.168.49.3");
  REQUIRE(p.port == 8888);
  Message fwd = p.Decoded();
  REQUIRE(fwd.ttl == 2);
  REQUIRE(fwd.message_id == original.message_id);
  REQUIRE(fwd.source_id == "node-b");
  REQUIRE(fwd.destination_id == "node-c");
  REQUIRE(fwd.payload == original.payload);
  REQUIRE(f.engine.Stats().forwarded == 1U);
  REQUIRE(f.recorder.control.empty());
}

TEST_CASE("engine - ttl zero is not forwarded", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 1000);
  f.outbox.posted.clear();

  f.Control(Text("node-b", "node-c", "late", 0), "192.168.49.2", 1100);
  f.Control(Text("node-b", "node-c", "later", -1), "192.168.49.2", 1100);
  REQUIRE(f.outbox.posted.empty());
  REQUIRE(f.engine.Stats().ttl_expired == 2U);
}

TEST_CASE("engine - unroutable traffic is dropped silently", "[engine]") {
  Fixture f;
  f.Control(Text("node-b", "node-unknown", "x"), "192.168.49.2", 1000);
  REQUIRE(f.outbox.posted.empty());
  REQUIRE(f.engine.Stats().unroutable == 1U);
  REQUIRE_FALSE(f.engine.SendControlMessage("x", "node-unknown"));
}

TEST_CASE("engine - route update is accepted without effect", "[engine]") {
  Fixture f;
  f.Control(vmesh::MakeMessage("node-b", "node-a", MessageType::kRouteUpdate,
                               vmesh::TextPayload("anything")),
            "192.168.49.2", 1000);
  REQUIRE(f.state->routes.Size() == 0U);
  REQUIRE(f.outbox.posted.empty());
}

// ============================================================================
// Heartbeat
// ============================================================================

TEST_CASE("engine - heartbeat refreshes known nodes only", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  f.Control(vmesh::MakeMessage("node-b", "node-a", MessageType::kHeartbeat,
                               vmesh::TextPayload("heartbeat")),
            "192.168.49.2", 4000);
  vmesh::Node node;
  REQUIRE(f.state->nodes.Find("node-b", &node));
  REQUIRE(node.last_seen_ms == 4000);

  f.Control(vmesh::MakeMessage("node-q", "node-a", MessageType::kHeartbeat,
                               vmesh::TextPayload("heartbeat")),
            "192.168.49.8", 4000);
  REQUIRE_FALSE(f.state->nodes.Find("node-q", nullptr));
  REQUIRE(f.state->nodes.Size() == 1U);
}

TEST_CASE("engine - heartbeats go straight to each node", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 1000);
  f.outbox.posted.clear();

  REQUIRE(f.engine.SendHeartbeats() == 2U);
  REQUIRE(f.outbox.posted.size() == 2U);
  for (const Posted& p : f.outbox.posted) {
    Message m = p.Decoded();
    REQUIRE(m.type == MessageType::kHeartbeat);
    REQUIRE(m.PayloadText() == "heartbeat");
    REQUIRE(p.port == 8888);
    REQUIRE(p.channel == Channel::kControl);
  }
}

// ============================================================================
// Audio plane
// ============================================================================

TEST_CASE("engine - audio for us or broadcast is delivered", "[engine]") {
  Fixture f;
  f.Audio(vmesh::MakeMessage("node-b", "node-a", MessageType::kAudioData,
                             vmesh::TextPayload("one")),
          "192.168.49.2", 1000);
  f.Audio(vmesh::MakeMessage("node-b", "broadcast", MessageType::kAudioData,
                             vmesh::TextPayload("two")),
          "192.168.49.2", 1000);
  REQUIRE(f.recorder.audio == std::vector<std::string>{"one", "two"});
  REQUIRE(f.recorder.audio_sources[0] == "node-b");
}

TEST_CASE("engine - non-audio on the audio plane is ignored", "[engine]") {
  Fixture f;
  f.Audio(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  f.Control(vmesh::MakeMessage("node-b", "node-a", MessageType::kAudioData,
                               vmesh::TextPayload("pcm")),
            "192.168.49.2", 1000);
  REQUIRE(f.state->nodes.Size() == 0U);
  REQUIRE(f.recorder.audio.empty());
}

TEST_CASE("engine - audio relayed on the audio port", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 1000);
  f.outbox.posted.clear();

  f.Audio(vmesh::MakeMessage("node-b", "node-c", MessageType::kAudioData,
                             vmesh::TextPayload("pcm"), 2),
          "192.168.49.2", 1100);
  REQUIRE(f.outbox.posted.size() == 1U);
  REQUIRE(f.outbox.posted[0].channel == Channel::kAudio);
  REQUIRE(f.outbox.posted[0].port == 8889);
  REQUIRE(f.outbox.posted[0].Decoded().ttl == 1);
}

TEST_CASE("engine - directed audio is one datagram with full ttl", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-y", "yankee"), "192.168.49.25", 1000);
  f.outbox.posted.clear();

  REQUIRE(f.engine.SendAudioData(vmesh::TextPayload("hello"), "node-y") == 1U);
  REQUIRE(f.outbox.posted.size() == 1U);
  const Posted& p = f.outbox.posted[0];
  REQUIRE(p.channel == Channel::kAudio);
  REQUIRE(p.address == "192.168.49.25");
  REQUIRE(p.port == 8889);
  Message m = p.Decoded();
  REQUIRE(m.type == MessageType::kAudioData);
  REQUIRE(m.source_id == "node-a");
  REQUIRE(m.destination_id == "node-y");
  REQUIRE(m.PayloadText() == "hello");
  REQUIRE(m.ttl == 10);
}

TEST_CASE("engine - audio fan-out sends one unicast per node", "[engine]") {
  Fixture f;
  REQUIRE(f.engine.SendAudioData(vmesh::TextPayload("pcm")) == 0U);

  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 1000);
  f.outbox.posted.clear();

  REQUIRE(f.engine.SendAudioData(vmesh::TextPayload("pcm")) == 2U);
  REQUIRE(f.outbox.posted.size() == 2U);
  for (const Posted& p : f.outbox.posted) {
    REQUIRE(p.channel == Channel::kAudio);
    REQUIRE(p.port == 8889);
    Message m = p.Decoded();
    REQUIRE(m.type == MessageType::kAudioData);
    REQUIRE(m.destination_id != "broadcast");
  }

  REQUIRE(f.engine.SendAudioData(vmesh::TextPayload("pcm"), "node-b") == 1U);
  REQUIRE(f.engine.SendAudioData(vmesh::TextPayload("pcm"), "node-x") == 0U);
}

// ============================================================================
// Broadcast discovery and maintenance
// ============================================================================

TEST_CASE("engine - one discovery message per broadcast round", "[engine]") {
  Fixture f;
  std::vector<std::string> targets = {"255.255.255.255", "192.168.49.255"};
  REQUIRE(f.engine.BroadcastDiscovery(targets) == 2U);
  REQUIRE(f.outbox.posted.size() == 2U);
  REQUIRE(f.outbox.posted[0].bytes == f.outbox.posted[1].bytes);
  Message m = f.outbox.posted[0].Decoded();
  REQUIRE(m.destination_id == "broadcast");
  REQUIRE(m.ttl == 10);
  REQUIRE(f.outbox.posted[1].address == "192.168.49.255");
}

TEST_CASE("engine - maintenance evicts silent nodes", "[engine]") {
  Fixture f;
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 0);
  f.Control(Discovery("node-c", "charlie"), "192.168.49.3", 10000);
  f.recorder.node_counts.clear();

  auto quiet = f.engine.RunMaintenance(15000);
  REQUIRE_FALSE(quiet.TopologyChanged());
  REQUIRE(f.recorder.node_counts.empty());

  auto r = f.engine.RunMaintenance(15001);
  REQUIRE(r.removed_nodes == std::vector<std::string>{"node-b"});
  REQUIRE_FALSE(f.state->routes.Find("node-b", nullptr));
  REQUIRE(f.state->routes.Find("node-c", nullptr));
  REQUIRE(f.recorder.node_counts == std::vector<uint32_t>{1});
}

TEST_CASE("engine - throwing observer does not stop dispatch", "[engine]") {
  Fixture f;
  ThrowingListener bad;
  f.listeners.Add(&bad);
  f.Control(Discovery("node-b", "bravo"), "192.168.49.2", 1000);
  REQUIRE(f.state->nodes.Size() == 1U);
  REQUIRE(f.recorder.node_counts.size() == 1U);
  REQUIRE(f.hooks.ids.size() == 1U);
}

// ============================================================================
// Two engines wired back to back
// ============================================================================

TEST_CASE("engine - two nodes learn each other and exchange audio", "[engine]") {
  Fixture a("node-a");
  Fixture b("node-b");

  // A's broadcast reaches B.
  a.engine.BroadcastDiscovery({"255.255.255.255"});
  b.Control(a.outbox.posted.back().Decoded(), "192.168.49.1", 1000);
  REQUIRE(b.state->nodes.Find("node-a", nullptr));

  // B's unicast reply reaches A.
  REQUIRE(b.outbox.posted.size() == 1U);
  REQUIRE(b.outbox.posted[0].address == "192.168.49.1");
  a.Control(b.outbox.posted[0].Decoded(), "192.168.49.2", 1010);
  REQUIRE(a.state->nodes.Find("node-b", nullptr));

  // A's reply back to B is a fresh message and refreshes B's entry.
  REQUIRE(a.outbox.posted.size() == 2U);
  b.Control(a.outbox.posted[1].Decoded(), "192.168.49.1", 1020);
  vmesh::Node seen;
  REQUIRE(b.state->nodes.Find("node-a", &seen));
  REQUIRE(seen.last_seen_ms == 1020);
  // Rate limited: B answered 192.168.49.1 10 ms ago.
  REQUIRE(b.outbox.posted.size() == 1U);

  a.outbox.posted.clear();
  REQUIRE(a.engine.SendAudioData(vmesh::TextPayload("pcm-frame")) == 1U);
  b.Audio(a.outbox.posted[0].Decoded(), "192.168.49.1", 1100);
  REQUIRE(b.recorder.audio == std::vector<std::string>{"pcm-frame"});
  REQUIRE(b.recorder.audio_sources == std::vector<std::string>{"node-a"});
}
