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
 * @file audio.hpp
 * @brief Audio side of the mesh: codec, playback seam, downlink and uplink.
 *
 * AudioDownlink is a MeshListener that validates received payloads before
 * they reach a PlaybackDevice. AudioUplink turns captured frames into
 * payloads for MeshNetwork::SendAudioData().
 */

#ifndef VMESH_AUDIO_HPP_
#define VMESH_AUDIO_HPP_

#include "vmesh/listener.hpp"
#include "vmesh/log.hpp"
#include "vmesh/vocabulary.hpp"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace vmesh {

enum class AudioError : uint8_t {
  kEmptyPayload = 0,
  kPayloadTooLarge,
  kDecodeFailed,
  kNoSamples,
  kTooManySamples,
  kDeviceFailed,
};

inline const char* AudioErrorName(AudioError e) noexcept {
  switch (e) {
    case AudioError::kEmptyPayload:    return "empty payload";
    case AudioError::kPayloadTooLarge: return "payload too large";
    case AudioError::kDecodeFailed:    return "decode failed";
    case AudioError::kNoSamples:       return "no samples";
    case AudioError::kTooManySamples:  return "too many samples";
    case AudioError::kDeviceFailed:    return "playback device failed";
  }
  return "unknown";
}

// ============================================================================
// Codec
// ============================================================================

class AudioCodec {
 public:
  virtual ~AudioCodec() = default;
  virtual std::vector<uint8_t> Encode(const std::vector<int16_t>& samples) = 0;
  virtual expected<std::vector<int16_t>, AudioError> Decode(
      const uint8_t* data, uint32_t len) = 0;
};

/** @brief Raw little-endian 16-bit PCM. An odd trailing byte is dropped. */
class Pcm16Codec final : public AudioCodec {
 public:
  std::vector<uint8_t> Encode(const std::vector<int16_t>& samples) override {
    std::vector<uint8_t> out;
    out.reserve(samples.size() * 2U);
    for (int16_t s : samples) {
      uint16_t u = static_cast<uint16_t>(s);
      out.push_back(static_cast<uint8_t>(u & 0xFFU));
      out.push_back(static_cast<uint8_t>(u >> 8U));
    }
    return out;
  }

  expected<std::vector<int16_t>, AudioError> Decode(const uint8_t* data,
                                                    uint32_t len) override {
    std::vector<int16_t> out(len / 2U);
    for (uint32_t i = 0; i < out.size(); ++i) {
      uint16_t u = static_cast<uint16_t>(data[2U * i]) |
                   static_cast<uint16_t>(static_cast<uint16_t>(data[2U * i + 1U]) << 8U);
      out[i] = static_cast<int16_t>(u);
    }
    return expected<std::vector<int16_t>, AudioError>::success(std::move(out));
  }
};

/** @brief RMS level of @p samples normalised to [0, 1]. */
inline float AudioLevel(const std::vector<int16_t>& samples) noexcept {
  if (samples.empty()) return 0.0F;
  double sum = 0.0;
  for (int16_t s : samples) sum += static_cast<double>(s) * s;
  double rms = std::sqrt(sum / static_cast<double>(samples.size()));
  return static_cast<float>(rms / std::numeric_limits<int16_t>::max());
}

// ============================================================================
// Playback
// ============================================================================

/// One logical stream per source node.
class PlaybackDevice {
 public:
  virtual ~PlaybackDevice() = default;
  virtual expected<void, AudioError> Play(const std::string& source_id,
                                          const std::vector<int16_t>& samples) = 0;
};

struct DownlinkStats {
  uint64_t played = 0;
  uint64_t dropped_empty = 0;
  uint64_t dropped_oversize = 0;
  uint64_t dropped_decode = 0;
  uint64_t dropped_samples = 0;
  uint64_t device_failures = 0;
};

class AudioDownlink final : public MeshListener {
 public:
  AudioDownlink(AudioCodec* codec, PlaybackDevice* device,
                uint32_t max_payload = 16384, uint32_t max_samples = 8192)
      : codec_(codec),
        device_(device),
        max_payload_(max_payload),
        max_samples_(max_samples) {}

  void OnAudioData(const std::vector<uint8_t>& payload,
                   const std::string& source_id) override {
    auto r = Deliver(payload, source_id);
    if (!r.has_value()) {
      VMESH_LOG_WARN("Audio", "dropped %u-byte payload from %s: %s",
                     static_cast<unsigned>(payload.size()), source_id.c_str(),
                     AudioErrorName(r.get_error()));
    }
  }

  /**
   * @brief Validate, decode and play one payload.
   * @return Number of samples played.
   */
  expected<uint32_t, AudioError> Deliver(const std::vector<uint8_t>& payload,
                                         const std::string& source_id) {
    using Result = expected<uint32_t, AudioError>;
    if (payload.empty()) {
      dropped_empty_.fetch_add(1, std::memory_order_relaxed);
      return Result::error(AudioError::kEmptyPayload);
    }
    if (payload.size() > max_payload_) {
      dropped_oversize_.fetch_add(1, std::memory_order_relaxed);
      return Result::error(AudioError::kPayloadTooLarge);
    }
    auto samples = codec_->Decode(payload.data(),
                                  static_cast<uint32_t>(payload.size()));
    if (!samples.has_value()) {
      dropped_decode_.fetch_add(1, std::memory_order_relaxed);
      return Result::error(AudioError::kDecodeFailed);
    }
    const size_t count = samples.value().size();
    if (count == 0U || count > max_samples_) {
      dropped_samples_.fetch_add(1, std::memory_order_relaxed);
      return Result::error(count == 0U ? AudioError::kNoSamples
                                       : AudioError::kTooManySamples);
    }
    auto played = device_->Play(source_id, samples.value());
    if (!played.has_value()) {
      device_failures_.fetch_add(1, std::memory_order_relaxed);
      return Result::error(played.get_error());
    }
    played_.fetch_add(1, std::memory_order_relaxed);
    return Result::success(static_cast<uint32_t>(count));
  }

  DownlinkStats Stats() const noexcept {
    DownlinkStats s;
    s.played = played_.load(std::memory_order_relaxed);
    s.dropped_empty = dropped_empty_.load(std::memory_order_relaxed);
    s.dropped_oversize = dropped_oversize_.load(std::memory_order_relaxed);
    s.dropped_decode = dropped_decode_.load(std::memory_order_relaxed);
    s.dropped_samples = dropped_samples_.load(std::memory_order_relaxed);
    s.device_failures = device_failures_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  AudioCodec* codec_;
  PlaybackDevice* device_;
  const uint32_t max_payload_;
  const uint32_t max_samples_;

  std::atomic<uint64_t> played_{0};
  std::atomic<uint64_t> dropped_empty_{0};
  std::atomic<uint64_t> dropped_oversize_{0};
  std::atomic<uint64_t> dropped_decode_{0};
  std::atomic<uint64_t> dropped_samples_{0};
  std::atomic<uint64_t> device_failures_{0};
};

// ============================================================================
// Uplink
// ============================================================================

class AudioUplink {
 public:
  /// Receives each encoded frame; returns the number of datagrams sent.
  using SendFn = uint32_t (*)(const std::vector<uint8_t>& payload,
                              const std::string& destination_id, void* ctx);

  /// Frames quieter than this are amplified twice before encoding.
  static constexpr float kLowLevelThreshold = 0.1F;

  AudioUplink(AudioCodec* codec, SendFn send, void* ctx) noexcept
      : codec_(codec), send_(send), send_ctx_(ctx) {}

  /**
   * @brief Encode and send one captured frame.
   * @param destination_id  Empty sends to every known node.
   * @return Datagrams sent; 0 when muted or the frame is empty.
   */
  uint32_t OnCapturedFrame(const std::vector<int16_t>& samples,
                           const std::string& destination_id = std::string()) {
    if (samples.empty() || muted_.load(std::memory_order_acquire)) return 0;

    float level = AudioLevel(samples);
    level_.store(level, std::memory_order_relaxed);

    std::vector<int16_t> processed(samples);
    if (level < kLowLevelThreshold) {
      for (int16_t& s : processed) {
        int32_t amplified = static_cast<int32_t>(s) * 2;
        if (amplified > INT16_MAX) amplified = INT16_MAX;
        if (amplified < INT16_MIN) amplified = INT16_MIN;
        s = static_cast<int16_t>(amplified);
      }
    }
    return send_(codec_->Encode(processed), destination_id, send_ctx_);
  }

  void SetMuted(bool muted) noexcept {
    muted_.store(muted, std::memory_order_release);
    VMESH_LOG_INFO("Audio", "capture %s", muted ? "muted" : "unmuted");
  }

  bool IsMuted() const noexcept { return muted_.load(std::memory_order_acquire); }

  float LastLevel() const noexcept { return level_.load(std::memory_order_relaxed); }

 private:
  AudioCodec* codec_;
  SendFn send_;
  void* send_ctx_;
  std::atomic<bool> muted_{false};
  std::atomic<float> level_{0.0F};
};

}  // namespace vmesh

#endif  // VMESH_AUDIO_HPP_
