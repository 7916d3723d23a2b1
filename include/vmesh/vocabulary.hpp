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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every vmesh module.
 *
 * - expected<V, E>: value-or-error return type (with a void specialisation)
 * - optional<T>:    nullable value without heap allocation
 * - Common error enums for the infrastructure modules
 *
 * All errors in vmesh are reported through these types. Exceptions are never
 * used to signal expected runtime failures.
 */

#ifndef VMESH_VOCABULARY_HPP_
#define VMESH_VOCABULARY_HPP_

#include "vmesh/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace vmesh {

// ============================================================================
// Common Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull:         return "buffer full";
    case ConfigError::kInvalidValue:       return "invalid value";
  }
  return "unknown";
}

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kAlreadyRunning,
  kNotRunning,
  kNotFound,
};

enum class PoolError : uint8_t {
  kQueueFull = 0,
  kNotRunning,
  kAlreadyRunning,
  kNoHandler,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the static factories success() and error(). Supports
 * move-only value types (e.g. std::unique_ptr), in which case the copy
 * operations are simply never instantiated.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) {
    return expected(SuccessTag{}, value);
  }
  static expected success(V&& value) {
    return expected(SuccessTag{}, std::move(value));
  }
  static expected error(E err) noexcept { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() noexcept {
    VMESH_ASSERT(has_value_);
    return value_;
  }
  const V& value() const noexcept {
    VMESH_ASSERT(has_value_);
    return value_;
  }

  E get_error() const noexcept {
    VMESH_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& default_value) const {
    return has_value_ ? value_ : default_value;
  }

 private:
  struct SuccessTag {};
  struct ErrorTag {};

  template <typename U>
  expected(SuccessTag, U&& value) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(std::forward<U>(value));
  }
  expected(ErrorTag, E err) noexcept : error_(err), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
      has_value_ = false;
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/** @brief Specialisation for operations that only succeed or fail. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    VMESH_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E err) noexcept : error_(err), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& value) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(value);
  }
  optional(T&& value) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(std::move(value));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(other.value_);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    VMESH_ASSERT(has_value_);
    return value_;
  }
  const T& value() const noexcept {
    VMESH_ASSERT(has_value_);
    return value_;
  }

  T value_or(const T& default_value) const {
    return has_value_ ? value_ : default_value;
  }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

 private:
  union {
    T value_;
  };
  bool has_value_;
};

}  // namespace vmesh

#endif  // VMESH_VOCABULARY_HPP_
