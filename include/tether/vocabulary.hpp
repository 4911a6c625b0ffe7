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
 * @brief Error enums, expected<V,E>, optional<T> and scope guard.
 *
 * Errors in tether are values: every fallible operation returns an
 * expected<V, E> whose E is one of the component enums below. No type here
 * throws, so the library stays usable with -fno-exceptions.
 */

#ifndef TETHER_VOCABULARY_HPP_
#define TETHER_VOCABULARY_HPP_

#include "tether/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace tether {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

enum class CodecError : uint8_t {
  kInvalidInput = 0,
};

enum class AcceptorError : uint8_t {
  kAddressInvalid = 0,
  kSocketFailed,
  kBindFailed,
  kListenFailed,
  kAlreadyRunning,
};

enum class ChannelError : uint8_t {
  kSessionClosed = 0,
  kSendFailed,
  kRecvFailed,  ///< Peer hung up or the read failed mid-reply.
};

enum class TransferError : uint8_t {
  kNotFound = 0,
  kEmptyPayload,
  kDecodeFailed,
  kWriteFailed,
};

enum class DispatchError : uint8_t {
  kUnknownModule = 0,
  kSessionNotFound,
};

inline const char* ToString(ChannelError e) noexcept {
  switch (e) {
    case ChannelError::kSessionClosed: return "session closed";
    case ChannelError::kSendFailed: return "send failed";
    case ChannelError::kRecvFailed: return "connection lost";
  }
  return "unknown";
}

inline const char* ToString(TransferError e) noexcept {
  switch (e) {
    case TransferError::kNotFound: return "file not found";
    case TransferError::kEmptyPayload: return "failed to read file";
    case TransferError::kDecodeFailed: return "payload decode failed";
    case TransferError::kWriteFailed: return "cannot write local artifact";
  }
  return "unknown";
}

inline const char* ToString(AcceptorError e) noexcept {
  switch (e) {
    case AcceptorError::kAddressInvalid: return "invalid listen address";
    case AcceptorError::kSocketFailed: return "socket creation failed";
    case AcceptorError::kBindFailed: return "bind failed";
    case AcceptorError::kListenFailed: return "listen failed";
    case AcceptorError::kAlreadyRunning: return "already running";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * Constructed only through the success()/error() factories. Accessing
 * value() on an error (or get_error() on a value) is a programming error and
 * trips TETHER_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (&r.storage_.value) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (&r.storage_.value) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.storage_.err = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
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
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    TETHER_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    TETHER_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    TETHER_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    TETHER_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : has_value_(false) { storage_.err = E{}; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
      has_value_ = false;
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/** @brief void specialization: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  E get_error() const noexcept {
    TETHER_ASSERT(!ok_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : ok_(ok), err_(e) {}

  bool ok_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

/** @brief Minimal optional; T must be copyable. */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_.value) T(v);
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(other.storage_.value);
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) ::new (&storage_.value) T(other.storage_.value);
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const T& value() const {
    TETHER_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept : dummy(0) {}
    ~Storage() {}
    char dummy;
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/** @brief Runs a callable when the enclosing scope exits. */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F&& fn) noexcept : fn_(std::move(fn)), active_(true) {}
  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  ~ScopeGuard() {
    if (active_) fn_();
  }

  void Dismiss() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

namespace detail {
struct ScopeGuardTag {};
template <typename F>
ScopeGuard<F> operator+(ScopeGuardTag, F&& fn) {
  return ScopeGuard<F>(std::forward<F>(fn));
}
}  // namespace detail

#define TETHER_SCOPE_EXIT(expr)                                     \
  auto TETHER_CONCAT(_tether_scope_exit_, __LINE__) TETHER_UNUSED = \
      ::tether::detail::ScopeGuardTag{} + [&]() { expr; }

}  // namespace tether

#endif  // TETHER_VOCABULARY_HPP_
