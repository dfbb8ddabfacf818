/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 *
 * Besides the compile-time macros, exposes the host OS family as a plain
 * value (PlatformFamily) so code that branches on the OS can take it as an
 * input instead of reading the preprocessor directly.
 */

#ifndef ZBEACON_PLATFORM_HPP_
#define ZBEACON_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace zbeacon {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define ZBEACON_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define ZBEACON_PLATFORM_MACOS 1
#elif defined(__FreeBSD__)
#define ZBEACON_PLATFORM_FREEBSD 1
#elif defined(_WIN32)
#define ZBEACON_PLATFORM_WINDOWS 1
#endif

#if defined(ZBEACON_PLATFORM_LINUX) || defined(ZBEACON_PLATFORM_MACOS) || \
    defined(ZBEACON_PLATFORM_FREEBSD)
#define ZBEACON_HAS_NETWORK 1
#else
#define ZBEACON_HAS_NETWORK 0
#endif

// ============================================================================
// Constants
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// PlatformFamily
// ============================================================================

enum class PlatformFamily : uint8_t {
  kLinux = 0,
  kMacOS,
  kFreeBSD,
  kWindows,
  kOther
};

/** @brief OS family this binary was compiled for. */
constexpr PlatformFamily CurrentPlatform() noexcept {
#if defined(ZBEACON_PLATFORM_LINUX)
  return PlatformFamily::kLinux;
#elif defined(ZBEACON_PLATFORM_MACOS)
  return PlatformFamily::kMacOS;
#elif defined(ZBEACON_PLATFORM_FREEBSD)
  return PlatformFamily::kFreeBSD;
#elif defined(ZBEACON_PLATFORM_WINDOWS)
  return PlatformFamily::kWindows;
#else
  return PlatformFamily::kOther;
#endif
}

inline const char* PlatformName(PlatformFamily family) noexcept {
  switch (family) {
    case PlatformFamily::kLinux:   return "linux";
    case PlatformFamily::kMacOS:   return "darwin";
    case PlatformFamily::kFreeBSD: return "freebsd";
    case PlatformFamily::kWindows: return "win32";
    default:                       return "other";
  }
}

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define ZBEACON_LIKELY(x) __builtin_expect(!!(x), 1)
#define ZBEACON_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define ZBEACON_UNUSED __attribute__((unused))
#else
#define ZBEACON_LIKELY(x) (x)
#define ZBEACON_UNLIKELY(x) (x)
#define ZBEACON_UNUSED
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "ZBEACON_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define ZBEACON_ASSERT(cond) ((void)0)
#else
#define ZBEACON_ASSERT(cond) \
  ((cond) ? ((void)0)        \
          : ::zbeacon::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace zbeacon

#endif  // ZBEACON_PLATFORM_HPP_
