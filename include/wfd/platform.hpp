/**
 * @file platform.hpp
 * @brief Platform detection and assertion macro.
 */

#ifndef WFD_PLATFORM_HPP_
#define WFD_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace wfd {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define WFD_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define WFD_PLATFORM_MACOS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

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
  (void)std::fprintf(stderr, "WFD_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define WFD_ASSERT(cond) ((void)0)
#else
#define WFD_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::wfd::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace wfd

#endif  // WFD_PLATFORM_HPP_
