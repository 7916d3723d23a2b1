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
 * @file message.hpp
 * @brief Mesh protocol message and its pipe-delimited wire codec.
 *
 * Wire format (text header, raw payload):
 *
 *   <id>|<source>|<destination>|<TYPE>|<ttl>|<timestamp>|<payload bytes...>
 *
 * The decoder stops at the sixth '|' so payloads may contain any byte,
 * including '|'. Header fields themselves must not contain '|'.
 */

#ifndef VMESH_MESSAGE_HPP_
#define VMESH_MESSAGE_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <string>
#include <vector>

namespace vmesh {

// ============================================================================
// Constants
// ============================================================================

/// Destination sentinel for periodic discovery broadcasts.
constexpr const char* kBroadcastId = "broadcast";
/// Destination sentinel for unicast discovery (replies, probes, direct connect).
constexpr const char* kDiscoveryId = "discovery";

constexpr int32_t kDefaultTtl = 10;
constexpr uint32_t kHeaderFieldCount = 6;

// ============================================================================
// MessageType
// ============================================================================

enum class MessageType : uint8_t {
  kDiscovery = 0,
  kRouteUpdate,
  kAudioData,
  kControl,
  kHeartbeat,
};

inline const char* MessageTypeName(MessageType type) noexcept {
  switch (type) {
    case MessageType::kDiscovery:   return "DISCOVERY";
    case MessageType::kRouteUpdate: return "ROUTE_UPDATE";
    case MessageType::kAudioData:   return "AUDIO_DATA";
    case MessageType::kControl:     return "CONTROL";
    case MessageType::kHeartbeat:   return "HEARTBEAT";
  }
  return "UNKNOWN";
}

/** @brief Map an uppercase wire token back to its type (exact match). */
inline optional<MessageType> ParseMessageType(const char* token,
                                              uint32_t len) noexcept {
  static constexpr MessageType kAll[] = {
      MessageType::kDiscovery, MessageType::kRouteUpdate,
      MessageType::kAudioData, MessageType::kControl,
      MessageType::kHeartbeat};
  for (MessageType t : kAll) {
    const char* name = MessageTypeName(t);
    if (std::strlen(name) == len && std::memcmp(name, token, len) == 0) {
      return optional<MessageType>{t};
    }
  }
  return {};
}

// ============================================================================
// Message
// ============================================================================

struct Message {
  std::string message_id;
  std::string source_id;
  std::string destination_id;
  MessageType type = MessageType::kDiscovery;
  std::vector<uint8_t> payload;
  int32_t ttl = kDefaultTtl;
  int64_t timestamp_ms = 0;

  std::string PayloadText() const {
    return std::string(payload.begin(), payload.end());
  }

  bool operator==(const Message& o) const {
    return message_id == o.message_id && source_id == o.source_id &&
           destination_id == o.destination_id && type == o.type &&
           payload == o.payload && ttl == o.ttl &&
           timestamp_ms == o.timestamp_ms;
  }
  bool operator!=(const Message& o) const { return !(*this == o); }
};

enum class DecodeError : uint8_t {
  kMissingHeaderFields = 0,
  kUnknownMessageType,
  kInvalidTtl,
  kInvalidTimestamp,
};

inline const char* DecodeErrorName(DecodeError e) noexcept {
  switch (e) {
    case DecodeError::kMissingHeaderFields: return "missing header fields";
    case DecodeError::kUnknownMessageType:  return "unknown message type";
    case DecodeError::kInvalidTtl:          return "invalid ttl";
    case DecodeError::kInvalidTimestamp:    return "invalid timestamp";
  }
  return "unknown";
}

// ============================================================================
// Clocks and identifiers
// ============================================================================

/// Wall-clock milliseconds; carried in the message header.
inline int64_t WallNowMs() noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/// Monotonic milliseconds; used for every table age comparison.
inline int64_t SteadyNowMs() noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

/**
 * @brief Random RFC 4122 version-4 UUID in canonical 8-4-4-4-12 form.
 */
inline std::string GenerateMessageId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  (void)std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                      static_cast<uint32_t>(hi >> 32),
                      static_cast<uint32_t>((hi >> 16) & 0xFFFFU),
                      static_cast<uint32_t>(hi & 0xFFFFU),
                      static_cast<uint32_t>(lo >> 48),
                      static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf);
}

/** @brief Build a fresh message stamped with a new id and the wall clock. */
inline Message MakeMessage(const std::string& source_id,
                           const std::string& destination_id,
                           MessageType type, std::vector<uint8_t> payload,
                           int32_t ttl = kDefaultTtl) {
  Message msg;
  msg.message_id = GenerateMessageId();
  msg.source_id = source_id;
  msg.destination_id = destination_id;
  msg.type = type;
  msg.payload = std::move(payload);
  msg.ttl = ttl;
  msg.timestamp_ms = WallNowMs();
  return msg;
}

inline std::vector<uint8_t> TextPayload(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

// ============================================================================
// Codec
// ============================================================================

inline std::vector<uint8_t> Serialize(const Message& msg) {
  std::string header;
  header.reserve(96);
  header += msg.message_id;
  header += '|';
  header += msg.source_id;
  header += '|';
  header += msg.destination_id;
  header += '|';
  header += MessageTypeName(msg.type);
  header += '|';
  header += std::to_string(msg.ttl);
  header += '|';
  header += std::to_string(msg.timestamp_ms);
  header += '|';

  std::vector<uint8_t> out;
  out.reserve(header.size() + msg.payload.size());
  out.insert(out.end(), header.begin(), header.end());
  out.insert(out.end(), msg.payload.begin(), msg.payload.end());
  return out;
}

namespace detail {

/// Whole-field signed decimal parse. Empty or partially numeric fails.
inline bool ParseDecimal(const uint8_t* p, uint32_t len, int64_t* out) noexcept {
  if (len == 0 || len > 20) return false;
  // strtoll skips leading whitespace of any kind; the wire format does not.
  const uint8_t first = p[0];
  if (first != '-' && first != '+' && (first < '0' || first > '9')) return false;
  char buf[24];
  std::memcpy(buf, p, len);
  buf[len] = '\0';
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(buf, &end, 10);
  if (end != buf + len || errno == ERANGE) return false;
  *out = static_cast<int64_t>(v);
  return true;
}

}  // namespace detail

inline expected<Message, DecodeError> Deserialize(const uint8_t* data,
                                                  uint32_t len) {
  using Result = expected<Message, DecodeError>;

  uint32_t starts[kHeaderFieldCount];
  uint32_t ends[kHeaderFieldCount];
  uint32_t field = 0;
  uint32_t start = 0;
  for (uint32_t i = 0; i < len && field < kHeaderFieldCount; ++i) {
    if (data[i] == '|') {
      starts[field] = start;
      ends[field] = i;
      ++field;
      start = i + 1;
    }
  }
  if (field < kHeaderFieldCount) {
    return Result::error(DecodeError::kMissingHeaderFields);
  }

  auto text = [&](uint32_t f) {
    return std::string(reinterpret_cast<const char*>(data + starts[f]),
                       ends[f] - starts[f]);
  };

  optional<MessageType> type = ParseMessageType(
      reinterpret_cast<const char*>(data + starts[3]), ends[3] - starts[3]);
  if (!type.has_value()) {
    return Result::error(DecodeError::kUnknownMessageType);
  }

  int64_t ttl = 0;
  if (!detail::ParseDecimal(data + starts[4], ends[4] - starts[4], &ttl) ||
      ttl < INT32_MIN || ttl > INT32_MAX) {
    return Result::error(DecodeError::kInvalidTtl);
  }
  int64_t timestamp = 0;
  if (!detail::ParseDecimal(data + starts[5], ends[5] - starts[5],
                            &timestamp)) {
    return Result::error(DecodeError::kInvalidTimestamp);
  }

  Message msg;
  msg.message_id = text(0);
  msg.source_id = text(1);
  msg.destination_id = text(2);
  msg.type = type.value();
  msg.ttl = static_cast<int32_t>(ttl);
  msg.timestamp_ms = timestamp;
  msg.payload.assign(data + start, data + len);
  return Result::success(std::move(msg));
}

inline expected<Message, DecodeError> Deserialize(
    const std::vector<uint8_t>& bytes) {
  return Deserialize(bytes.data(), static_cast<uint32_t>(bytes.size()));
}

}  // namespace vmesh

#endif  // VMESH_MESSAGE_HPP_
