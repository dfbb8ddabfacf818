/**
 * @file vocabulary.hpp
 * @brief Result, optional and fixed-capacity types plus the shared error enums.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_VOCABULARY_HPP_
#define ZBEACON_VOCABULARY_HPP_

#include "zbeacon/platform.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace zbeacon {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "FileNotFound";
    case ConfigError::kParseError:         return "ParseError";
    case ConfigError::kFormatNotSupported: return "FormatNotSupported";
    case ConfigError::kBufferFull:         return "BufferFull";
    case ConfigError::kInvalidValue:       return "InvalidValue";
    default:                               return "Unknown";
  }
}

enum class BeaconError : uint8_t {
  kNoInterface = 0,
  kSocketFailed,
  kBindFailed,
  kSetOptFailed,
  kAlreadyRunning,
  kChannelFailed,
  kPollerFailed,
  kInvalidAddress
};

inline const char* BeaconErrorName(BeaconError e) noexcept {
  switch (e) {
    case BeaconError::kNoInterface:     return "NoInterface";
    case BeaconError::kSocketFailed:    return "SocketFailed";
    case BeaconError::kBindFailed:      return "BindFailed";
    case BeaconError::kSetOptFailed:    return "SetOptFailed";
    case BeaconError::kAlreadyRunning:  return "AlreadyRunning";
    case BeaconError::kChannelFailed:   return "ChannelFailed";
    case BeaconError::kPollerFailed:    return "PollerFailed";
    case BeaconError::kInvalidAddress:  return "InvalidAddress";
    default:                            return "Unknown";
  }
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result.
 *
 * Built through the named factories success() / error(); there is no
 * implicit conversion from V or E. value() on an error result and
 * get_error() on a success result are contract violations.
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(e, ErrorTag{}); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(*other.Ptr());
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(*other.Ptr()));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(*other.Ptr());
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
        ::new (&storage_) V(std::move(*other.Ptr()));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    ZBEACON_ASSERT(has_value_);
    return *Ptr();
  }
  const V& value() const& {
    ZBEACON_ASSERT(has_value_);
    return *Ptr();
  }
  V&& value() && {
    ZBEACON_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  E get_error() const noexcept {
    ZBEACON_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) { ::new (&storage_) V(v); }
  explicit expected(V&& v) : has_value_(true) {
    ::new (&storage_) V(std::move(v));
  }
  expected(E e, ErrorTag) noexcept : error_(e), has_value_(false) {}

  V* Ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E error_{};
  bool has_value_;
};

/** @brief void specialization: success carries no payload. */
template <typename E>
class expected<void, E> {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    ZBEACON_ASSERT(!has_value_);
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
class optional {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_) T(v);
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) T(*other.Ptr());
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) ::new (&storage_) T(*other.Ptr());
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const T& value() const {
    ZBEACON_ASSERT(has_value_);
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
  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/** @brief Tag selecting the truncating FixedString constructors. */
struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of Capacity characters.
 *
 * Literal construction is checked at compile time; runtime input goes
 * through the TruncateToCapacity overloads.
 */
template <size_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <size_t N>
  FixedString(const char (&str)[N]) noexcept  // NOLINT(google-explicit-constructor)
      : size_(N - 1) {
    static_assert(N - 1 <= Capacity, "string literal exceeds capacity");
    std::memcpy(buf_, str, N - 1);
    buf_[size_] = '\0';
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str, (str == nullptr) ? 0 : std::strlen(str));
  }

  void assign(TruncateToCapacity_t, const char* str, size_t len) noexcept {
    size_ = (str == nullptr) ? 0 : (len < Capacity ? len : Capacity);
    if (size_ > 0) std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr size_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }
  bool operator!=(const char* other) const noexcept { return !(*this == other); }

  template <size_t N>
  bool operator==(const FixedString<N>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

 private:
  char buf_[Capacity + 1];
  size_t size_;
};

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

/**
 * @brief Bounded vector with inline storage.
 *
 * push_back() reports a full vector through its return value instead of
 * growing.
 */
template <typename T, size_t Capacity>
class FixedVector {
 public:
  FixedVector() noexcept : size_(0) {}

  bool push_back(const T& value) {
    if (size_ >= Capacity) return false;
    items_[size_++] = value;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0) return false;
    --size_;
    return true;
  }

  T& operator[](size_t index) noexcept {
    ZBEACON_ASSERT(index < size_);
    return items_[index];
  }
  const T& operator[](size_t index) const noexcept {
    ZBEACON_ASSERT(index < size_);
    return items_[index];
  }

  T* begin() noexcept { return items_.data(); }
  T* end() noexcept { return items_.data() + size_; }
  const T* begin() const noexcept { return items_.data(); }
  const T* end() const noexcept { return items_.data() + size_; }

  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  bool full() const noexcept { return size_ == Capacity; }
  static constexpr size_t capacity() noexcept { return Capacity; }
  void clear() noexcept { size_ = 0; }

 private:
  std::array<T, Capacity> items_{};
  size_t size_;
};

}  // namespace zbeacon

#endif  // ZBEACON_VOCABULARY_HPP_
