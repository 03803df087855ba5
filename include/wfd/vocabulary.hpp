/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString, overloaded.
 *
 * Lightweight replacements for std::expected / std::optional that never
 * throw. Accessing the wrong alternative is a programming error caught by
 * WFD_ASSERT in debug builds.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef WFD_VOCABULARY_HPP_
#define WFD_VOCABULARY_HPP_

#include "wfd/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace wfd {

// ============================================================================
// Common error enums
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
 * @brief Value-or-error result type.
 *
 * Usage:
 * @code
 *   expected<int, ConfigError> r = expected<int, ConfigError>::success(42);
 *   if (!r.has_value()) { HandleError(r.get_error()); }
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) { return expected(kValueTag, std::move(v)); }
  static expected error(E e) { return expected(kErrorTag, std::move(e)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      ::new (&storage_.error) E(other.storage_.error);
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      ::new (&storage_.error) E(std::move(other.storage_.error));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        ::new (&storage_.error) E(other.storage_.error);
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
        ::new (&storage_.error) E(std::move(other.storage_.error));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    WFD_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    WFD_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    WFD_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const& {
    WFD_ASSERT(!has_value_);
    return storage_.error;
  }

  V value_or(V default_val) const& {
    return has_value_ ? storage_.value : std::move(default_val);
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    ::new (&storage_.value) V(std::forward<U>(v));
  }
  expected(ErrorTag, E&& e) : has_value_(false) {
    ::new (&storage_.error) E(std::move(e));
  }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.error.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E error;
  } storage_;
  bool has_value_;
};

/** @brief void specialization: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(E e) { return expected(std::move(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    WFD_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept(std::is_nothrow_default_constructible<E>::value)
      : error_(), has_value_(true) {}
  explicit expected(E&& e) : error_(std::move(e)), has_value_(false) {}

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

  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_.value) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(std::move(other.storage_.value));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(other.storage_.value);
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
        ::new (&storage_.value) T(std::move(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    WFD_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const& {
    WFD_ASSERT(has_value_);
    return storage_.value;
  }
  T&& value() && {
    WFD_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  T value_or(T default_val) const& {
    return has_value_ ? storage_.value : std::move(default_val);
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/** @brief Tag requesting silent truncation of over-long input. */
struct TruncateToCapacityTag {};
static constexpr TruncateToCapacityTag TruncateToCapacity{};

/**
 * @brief Fixed-capacity, null-terminated string stored inline.
 *
 * Literals are length-checked at compile time; runtime input must go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be positive");

 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept  // NOLINT(google-explicit-constructor)
      : size_(0U) {
    static_assert(N - 1U <= Capacity, "String literal exceeds FixedString capacity");
    Copy(str, N - 1U);
  }

  FixedString(TruncateToCapacityTag, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacityTag, const char* str, uint32_t len) noexcept
      : size_(0U) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacityTag, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    uint32_t len = 0U;
    while (len < Capacity && str[len] != '\0') ++len;
    Copy(str, len);
  }

  void assign(TruncateToCapacityTag, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    Copy(str, (len < Capacity) ? len : Capacity);
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t OtherCap>
  bool operator==(const FixedString<OtherCap>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }
  template <uint32_t OtherCap>
  bool operator!=(const FixedString<OtherCap>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* str) const noexcept {
    return str != nullptr && std::strcmp(buf_, str) == 0;
  }
  bool operator!=(const char* str) const noexcept { return !(*this == str); }

 private:
  void Copy(const char* src, uint32_t len) noexcept {
    std::memcpy(buf_, src, len);
    buf_[len] = '\0';
    size_ = len;
  }

  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// Overloaded visitor pattern (C++17)
// ============================================================================

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace wfd

#endif  // WFD_VOCABULARY_HPP_
