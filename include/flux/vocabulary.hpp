/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString, shared error enums.
 *
 * Header-only, no heap allocation in the vocabulary types themselves,
 * usable without exceptions.
 */

#ifndef FLUX_VOCABULARY_HPP_
#define FLUX_VOCABULARY_HPP_

#include "flux/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace flux {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kMissingKey,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * Construct through the success() / error() factories. Accessing value()
 * on an error (or get_error() on a value) is a programming error caught by
 * FLUX_ASSERT in debug builds.
 *
 * @tparam V Value type (may be move-only).
 * @tparam E Error type, normally a uint8_t enum class.
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
    r.Construct(std::move(v));
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    return r;
  }

  expected(const expected& other) : has_value_(false) {
    if (other.has_value_) {
      Construct(other.value_);
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(false) {
    if (other.has_value_) {
      Construct(std::move(other.value_));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      if (other.has_value_) {
        Construct(other.value_);
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      if (other.has_value_) {
        Construct(std::move(other.value_));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    FLUX_ASSERT(has_value_);
    return value_;
  }

  const V& value() const& noexcept {
    FLUX_ASSERT(has_value_);
    return value_;
  }

  V&& value() && noexcept {
    FLUX_ASSERT(has_value_);
    return std::move(value_);
  }

  E get_error() const noexcept {
    FLUX_ASSERT(!has_value_);
    return error_;
  }

  template <typename U>
  V value_or(U&& default_value) const& {
    return has_value_ ? value_ : static_cast<V>(std::forward<U>(default_value));
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  template <typename U>
  void Construct(U&& v) {
    ::new (static_cast<void*>(&value_)) V(std::forward<U>(v));
    has_value_ = true;
  }

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

/**
 * @brief expected<void, E> specialization: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    FLUX_ASSERT(!has_value_);
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

/**
 * @brief Minimal optional with in-place storage.
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : dummy_(0), has_value_(false) {}

  optional(const T& v) : dummy_(0), has_value_(false) { emplace(v); }  // NOLINT
  optional(T&& v) : dummy_(0), has_value_(false) { emplace(std::move(v)); }  // NOLINT

  optional(const optional& other) : dummy_(0), has_value_(false) {
    if (other.has_value_) emplace(other.value_);
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : dummy_(0), has_value_(false) {
    if (other.has_value_) emplace(std::move(other.value_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) emplace(other.value_);
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) emplace(std::move(other.value_));
    }
    return *this;
  }

  ~optional() { reset(); }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (static_cast<void*>(&value_)) T(std::forward<Args>(args)...);
    has_value_ = true;
    return value_;
  }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    FLUX_ASSERT(has_value_);
    return value_;
  }

  const T& value() const noexcept {
    FLUX_ASSERT(has_value_);
    return value_;
  }

  template <typename U>
  T value_or(U&& default_value) const {
    return has_value_ ? value_ : static_cast<T>(std::forward<U>(default_value));
  }

 private:
  union {
    char dummy_;
    T value_;
  };
  bool has_value_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

struct TruncateToCapacity_t {
  explicit TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Fixed-capacity, null-terminated string stored inline.
 *
 * Literal construction is checked at compile time; runtime strings must
 * opt in to truncation with TruncateToCapacity.
 *
 * @tparam Capacity Maximum number of characters (excluding terminator).
 */
template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t M>
  FixedString(const char (&str)[M]) noexcept : size_(M - 1U) {  // NOLINT
    static_assert(M - 1U <= Capacity, "string literal exceeds FixedString capacity");
    std::memcpy(buf_, str, M);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    size_ = 0;
    if (str != nullptr) {
      while (size_ < Capacity && str[size_] != '\0') {
        buf_[size_] = str[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }

  template <typename Other>
  bool operator!=(const Other& other) const noexcept {
    return !(*this == other);
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

}  // namespace flux

#endif  // FLUX_VOCABULARY_HPP_
