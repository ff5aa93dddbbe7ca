/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional.
 *
 * Small, allocation-free building blocks shared by every kcore module.
 * All error paths are value-based (expected<V, E>); nothing here throws.
 */

#ifndef KCORE_VOCABULARY_HPP_
#define KCORE_VOCABULARY_HPP_

#include "kcore/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace kcore {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Either a value of type V or an error of type E.
 *
 * Construct through the named factories success() / error(); there is no
 * implicit conversion from V or E.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    r.Construct(v);
    return r;
  }
  static expected success(V&& v) {
    expected r;
    r.Construct(static_cast<V&&>(v));
    return r;
  }
  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    return r;
  }

  expected(const expected& other) : error_(other.error_), has_value_(false) {
    if (other.has_value_) Construct(*other.Ptr());
  }
  expected(expected&& other) noexcept : error_(other.error_), has_value_(false) {
    if (other.has_value_) Construct(static_cast<V&&>(*other.Ptr()));
  }
  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) Construct(*other.Ptr());
    }
    return *this;
  }
  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) Construct(static_cast<V&&>(*other.Ptr()));
    }
    return *this;
  }
  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    KCORE_ASSERT(has_value_);
    return *Ptr();
  }
  const V& value() const& noexcept {
    KCORE_ASSERT(has_value_);
    return *Ptr();
  }
  V&& value() && noexcept {
    KCORE_ASSERT(has_value_);
    return static_cast<V&&>(*Ptr());
  }

  V value_or(const V& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

  E get_error() const noexcept {
    KCORE_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  template <typename U>
  void Construct(U&& v) {
    ::new (static_cast<void*>(storage_)) V(static_cast<U&&>(v));
    has_value_ = true;
  }
  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }
  V* Ptr() noexcept { return std::launder(reinterpret_cast<V*>(storage_)); }
  const V* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(storage_));
  }

  alignas(V) unsigned char storage_[sizeof(V)];
  E error_;
  bool has_value_;
};

/** @brief expected<void, E>: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E()); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    KCORE_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) noexcept : error_(e), has_value_(ok) {}

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
  optional(const T& v) : has_value_(false) { Construct(v); }  // NOLINT
  optional(T&& v) : has_value_(false) { Construct(static_cast<T&&>(v)); }  // NOLINT

  optional(const optional& other) : has_value_(false) {
    if (other.has_value_) Construct(*other.Ptr());
  }
  optional(optional&& other) noexcept : has_value_(false) {
    if (other.has_value_) Construct(static_cast<T&&>(*other.Ptr()));
  }
  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) Construct(*other.Ptr());
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) Construct(static_cast<T&&>(*other.Ptr()));
    }
    return *this;
  }
  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    KCORE_ASSERT(has_value_);
    return *Ptr();
  }
  const T& value() const noexcept {
    KCORE_ASSERT(has_value_);
    return *Ptr();
  }
  T value_or(const T& fallback) const { return has_value_ ? *Ptr() : fallback; }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  template <typename U>
  void Construct(U&& v) {
    ::new (static_cast<void*>(storage_)) T(static_cast<U&&>(v));
    has_value_ = true;
  }
  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(storage_)); }
  const T* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(storage_));
  }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_;
};

}  // namespace kcore

#endif  // KCORE_VOCABULARY_HPP_
