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
 * @file log.hpp
 * @brief Synchronous leveled logging with printf-style macros.
 *
 * Output format:
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [category] message (file:line)
 *
 * ZBEACON_LOG_MIN_LEVEL removes lower levels at compile time; SetLevel()
 * filters at runtime. Lines go to stderr, or to the file passed to Init().
 *
 * Components that must not depend on the process-wide sink take a Logger
 * instead: a category plus an optional LogSinkFn. A Logger without a sink
 * writes through LogWrite().
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_LOG_HPP_
#define ZBEACON_LOG_HPP_

#include "zbeacon/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef ZBEACON_LOG_MIN_LEVEL
#define ZBEACON_LOG_MIN_LEVEL 0
#endif

#ifndef ZBEACON_LOG_LINE_MAX
#define ZBEACON_LOG_LINE_MAX 512U
#endif

namespace zbeacon {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

struct LogState {
  std::mutex mutex;
  FILE* file = nullptr;
  bool initialized = false;

  static LogState& Instance() noexcept {
    static LogState state;
    return state;
  }
};

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return nullptr;
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  struct tm tm_local;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline bool IsEnabled(Level level) noexcept {
  return level != Level::kOff &&
         static_cast<uint8_t>(level) >= static_cast<uint8_t>(GetLevel());
}

/**
 * @brief Initialize the log backend.
 * @param path Log file to append to, or nullptr for stderr.
 * @return false if the file could not be opened (stderr stays active).
 */
inline bool Init(const char* path = nullptr) noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  if (st.file != nullptr) {
    (void)std::fclose(st.file);
    st.file = nullptr;
  }
  st.initialized = true;
  if (path == nullptr) return true;
  st.file = std::fopen(path, "a");
  return st.file != nullptr;
}

inline void Shutdown() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  if (st.file != nullptr) {
    (void)std::fflush(st.file);
    (void)std::fclose(st.file);
    st.file = nullptr;
  }
  st.initialized = false;
}

inline bool IsInitialized() noexcept {
  auto& st = detail::LogState::Instance();
  std::lock_guard<std::mutex> lock(st.mutex);
  return st.initialized;
}

// ============================================================================
// LogWrite
// ============================================================================

/**
 * @brief Format and emit one log line. Thread-safe.
 *
 * @p file may be nullptr, in which case the source location is omitted.
 * kFatal flushes and aborts after writing.
 */
inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (!IsEnabled(level)) return;

  char msg[ZBEACON_LOG_LINE_MAX];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  auto& st = detail::LogState::Instance();
  {
    std::lock_guard<std::mutex> lock(st.mutex);
    FILE* out = (st.file != nullptr) ? st.file : stderr;
    const char* base = detail::Basename(file);
    if (base != nullptr) {
      (void)std::fprintf(out, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                         detail::LevelTag(level), category, msg, base, line);
    } else {
      (void)std::fprintf(out, "[%s] [%s] [%s] %s\n", ts,
                         detail::LevelTag(level), category, msg);
    }
    if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
      (void)std::fflush(out);
    }
  }

  if (level == Level::kFatal) {
    std::abort();
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

// ============================================================================
// Logger - injectable logging collaborator
// ============================================================================

/**
 * @brief Sink for an injected Logger.
 *
 * @param level     Severity of the line.
 * @param category  Logger category.
 * @param message   Pre-formatted, null-terminated message.
 * @param context   User pointer given at construction.
 */
using LogSinkFn = void (*)(Level level, const char* category,
                           const char* message, void* context);

class Logger {
 public:
  Logger() noexcept : category_("zbeacon"), sink_(nullptr), context_(nullptr) {}

  explicit Logger(const char* category, LogSinkFn sink = nullptr,
                  void* context = nullptr) noexcept
      : category_(category), sink_(sink), context_(context) {}

  void Debug(const char* fmt, ...) const noexcept {
    va_list args;
    va_start(args, fmt);
    Emit(Level::kDebug, fmt, args);
    va_end(args);
  }

  void Info(const char* fmt, ...) const noexcept {
    va_list args;
    va_start(args, fmt);
    Emit(Level::kInfo, fmt, args);
    va_end(args);
  }

  void Warn(const char* fmt, ...) const noexcept {
    va_list args;
    va_start(args, fmt);
    Emit(Level::kWarn, fmt, args);
    va_end(args);
  }

  void Error(const char* fmt, ...) const noexcept {
    va_list args;
    va_start(args, fmt);
    Emit(Level::kError, fmt, args);
    va_end(args);
  }

  const char* Category() const noexcept { return category_; }

 private:
  void Emit(Level level, const char* fmt, va_list args) const noexcept {
    if (sink_ == nullptr) {
      LogWriteVa(level, category_, nullptr, 0, fmt, args);
      return;
    }
    if (!IsEnabled(level)) return;
    char msg[ZBEACON_LOG_LINE_MAX];
    (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
    sink_(level, category_, msg, context_);
  }

  const char* category_;
  LogSinkFn sink_;
  void* context_;
};

}  // namespace log
}  // namespace zbeacon

// ============================================================================
// Macros
// ============================================================================

#define ZBEACON_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                     \
    if (ZBEACON_LOG_MIN_LEVEL <= 0) {                                      \
      ::zbeacon::log::LogWrite(::zbeacon::log::Level::kDebug, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define ZBEACON_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                     \
    if (ZBEACON_LOG_MIN_LEVEL <= 1) {                                      \
      ::zbeacon::log::LogWrite(::zbeacon::log::Level::kInfo, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define ZBEACON_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                     \
    if (ZBEACON_LOG_MIN_LEVEL <= 2) {                                      \
      ::zbeacon::log::LogWrite(::zbeacon::log::Level::kWarn, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define ZBEACON_LOG_ERROR(cat, fmt, ...)                                   \
  ::zbeacon::log::LogWrite(::zbeacon::log::Level::kError, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__)

#define ZBEACON_LOG_FATAL(cat, fmt, ...)                                   \
  ::zbeacon::log::LogWrite(::zbeacon::log::Level::kFatal, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__)

#endif  // ZBEACON_LOG_HPP_
