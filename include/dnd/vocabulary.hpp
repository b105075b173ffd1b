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
 * @brief Lightweight vocabulary types: expected<V, E> and optional<T>.
 *
 * Error-returning APIs in this library never throw; they return
 * expected<V, E> where E is a module-local uint8_t error enum.
 * Both types support non-trivial payloads (std::string, std::vector).
 *
 * Usage:
 * @code
 *   dnd::expected<std::string, dnd::SpoolError> r = store.MoveTo(p, s);
 *   if (!r) { DND_LOG_ERROR("Spool", "%s", dnd::ToString(r.get_error())); }
 * @endcode
 */

#ifndef DND_VOCABULARY_HPP_
#define DND_VOCABULARY_HPP_

#include "dnd/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace dnd {

// ============================================================================
// ConfigError
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError: return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull: return "too many entries";
    case ConfigError::kInvalidValue: return "invalid value";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * E is expected to be a trivially copyable enum. Construct through the
 * success() / error() factories.
 */
template <typename V, typename E>
class expected final {
  static_assert(std::is_trivially_copyable<E>::value,
                "expected<V, E>: E must be trivially copyable");

 public:
  static expected success(const V& v) {
    expected r;
    r.Emplace(v);
    return r;
  }

  static expected success(V&& v) {
    expected r;
    r.Emplace(std::move(v));
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    return r;
  }

  expected(const expected& other) : has_value_(false), err_(other.err_) {
    if (other.has_value_) Emplace(other.Ref());
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(false), err_(other.err_) {
    if (other.has_value_) Emplace(std::move(other.Ref()));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) Emplace(other.Ref());
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) Emplace(std::move(other.Ref()));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    DND_ASSERT(has_value_);
    return Ref();
  }
  const V& value() const& {
    DND_ASSERT(has_value_);
    return Ref();
  }
  V&& value() && {
    DND_ASSERT(has_value_);
    return std::move(Ref());
  }

  E get_error() const noexcept {
    DND_ASSERT(!has_value_);
    return err_;
  }

  V value_or(V fallback) const {
    return has_value_ ? Ref() : fallback;
  }

 private:
  expected() noexcept : has_value_(false), err_() {}

  template <typename U>
  void Emplace(U&& v) {
    ::new (static_cast<void*>(&storage_)) V(std::forward<U>(v));
    has_value_ = true;
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  V& Ref() noexcept { return *reinterpret_cast<V*>(&storage_); }
  const V& Ref() const noexcept {
    return *reinterpret_cast<const V*>(&storage_);
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E err_;
};

/** @brief expected<void, E>: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E()); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  E get_error() const noexcept {
    DND_ASSERT(!ok_);
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

template <typename T>
class optional final {
 public:
  optional() noexcept : engaged_(false) {}

  optional(const T& v) : engaged_(false) { Emplace(v); }  // NOLINT
  optional(T&& v) : engaged_(false) { Emplace(std::move(v)); }  // NOLINT

  optional(const optional& other) : engaged_(false) {
    if (other.engaged_) Emplace(other.Ref());
  }
  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : engaged_(false) {
    if (other.engaged_) Emplace(std::move(other.Ref()));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.engaged_) Emplace(other.Ref());
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.engaged_) Emplace(std::move(other.Ref()));
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return engaged_; }
  explicit operator bool() const noexcept { return engaged_; }

  T& value() {
    DND_ASSERT(engaged_);
    return Ref();
  }
  const T& value() const {
    DND_ASSERT(engaged_);
    return Ref();
  }

  T value_or(T fallback) const { return engaged_ ? Ref() : fallback; }

  void reset() noexcept {
    if (engaged_) {
      Ref().~T();
      engaged_ = false;
    }
  }

 private:
  template <typename U>
  void Emplace(U&& v) {
    ::new (static_cast<void*>(&storage_)) T(std::forward<U>(v));
    engaged_ = true;
  }

  T& Ref() noexcept { return *reinterpret_cast<T*>(&storage_); }
  const T& Ref() const noexcept {
    return *reinterpret_cast<const T*>(&storage_);
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool engaged_;
};

}  // namespace dnd

#endif  // DND_VOCABULARY_HPP_
