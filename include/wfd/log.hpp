/**
 * @file log.hpp
 * @brief Lightweight synchronous logging with category tags.
 *
 * printf-style macros with a compile-time floor (WFD_LOG_MIN_LEVEL) and a
 * runtime threshold (SetLevel). Output format:
 *
 *   [12:34:56.789] [INFO] [Manager] actor started (manager.hpp:310)
 *
 * Release builds (NDEBUG) omit the file:line suffix. Lines go to stderr
 * unless Init() names another stream.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef WFD_LOG_HPP_
#define WFD_LOG_HPP_

#include "wfd/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#if defined(WFD_PLATFORM_LINUX) || defined(WFD_PLATFORM_MACOS)
#include <sys/time.h>
#include <time.h>
#endif

// ============================================================================
// Compile-Time Configuration
// ============================================================================

/// Levels below this are compiled out (0=DEBUG .. 4=FATAL).
#ifndef WFD_LOG_MIN_LEVEL
#ifdef NDEBUG
#define WFD_LOG_MIN_LEVEL 1
#else
#define WFD_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef WFD_LOG_MESSAGE_SIZE
#define WFD_LOG_MESSAGE_SIZE 512U
#endif

namespace wfd {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

/// nullptr means stderr.
inline std::atomic<FILE*>& SinkRef() noexcept {
  static std::atomic<FILE*> sink{nullptr};
  return sink;
}

inline FILE* Sink() noexcept {
  FILE* out = SinkRef().load(std::memory_order_acquire);
  return (out != nullptr) ? out : stderr;
}

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

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(WFD_PLATFORM_LINUX) || defined(WFD_PLATFORM_MACOS)
  struct timeval tv;
  (void)gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t sec = tv.tv_sec;
  (void)localtime_r(&sec, &tm_buf);
  (void)std::snprintf(buf, size, "%02d:%02d:%02d.%03d", tm_buf.tm_hour,
                      tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<int>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "--:--:--.---");
#endif
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Route log lines to @p sink (stderr when null).
 *
 * The stream is not owned; it must outlive the matching Shutdown().
 */
inline void Init(FILE* sink = nullptr) noexcept {
  detail::SinkRef().store(sink, std::memory_order_release);
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush the current sink and fall back to stderr. */
inline void Shutdown() noexcept {
  (void)std::fflush(detail::Sink());
  detail::SinkRef().store(nullptr, std::memory_order_release);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"), case-insensitive.
 * @return Parsed level, or @p fallback for unknown input.
 */
inline Level ParseLevel(const char* name, Level fallback) noexcept {
  if (name == nullptr) return fallback;
  char lower[8];
  uint32_t i = 0;
  for (; i < sizeof(lower) - 1U && name[i] != '\0'; ++i) {
    char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (name[i] != '\0') return fallback;
  lower[i] = '\0';
  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0) return Level::kWarn;
  if (std::strcmp(lower, "warning") == 0) return Level::kWarn;
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(lower, "off") == 0) return Level::kOff;
  return fallback;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(std::memory_order_relaxed))) {
    return;
  }

  char msg[WFD_LOG_MESSAGE_SIZE];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  FILE* out = detail::Sink();
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(out, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(out, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif

  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(out);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace wfd

// ============================================================================
// Macros
// ============================================================================

#define WFD_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (WFD_LOG_MIN_LEVEL <= 0) {                                           \
      ::wfd::log::LogWrite(::wfd::log::Level::kDebug, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define WFD_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (WFD_LOG_MIN_LEVEL <= 1) {                                           \
      ::wfd::log::LogWrite(::wfd::log::Level::kInfo, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define WFD_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (WFD_LOG_MIN_LEVEL <= 2) {                                           \
      ::wfd::log::LogWrite(::wfd::log::Level::kWarn, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define WFD_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    ::wfd::log::LogWrite(::wfd::log::Level::kError, cat, __FILE__,          \
                         __LINE__, fmt, ##__VA_ARGS__);                     \
  } while (0)

#define WFD_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                      \
    ::wfd::log::LogWrite(::wfd::log::Level::kFatal, cat, __FILE__,          \
                         __LINE__, fmt, ##__VA_ARGS__);                     \
    std::abort();                                                           \
  } while (0)

#endif  // WFD_LOG_HPP_
