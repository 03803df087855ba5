/**
 * @file error.hpp
 * @brief Error taxonomy shared by the manager, channel and backends.
 */

#ifndef WFD_ERROR_HPP_
#define WFD_ERROR_HPP_

#include "wfd/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>

namespace wfd {

enum class P2pErrorKind : uint8_t {
  kRemoteCallFailure = 0,  ///< Control-service call failed (bus or method error).
  kSerializationFailure,   ///< Malformed data crossing the remote boundary.
  kChannelClosed,          ///< Command queue, topic or result slot is gone.
  kInvalidInput            ///< Caller-provided value rejected (empty name, ...).
};

inline const char* ErrorKindName(P2pErrorKind kind) noexcept {
  switch (kind) {
    case P2pErrorKind::kRemoteCallFailure:    return "remote call failure";
    case P2pErrorKind::kSerializationFailure: return "serialization failure";
    case P2pErrorKind::kChannelClosed:        return "channel closed";
    case P2pErrorKind::kInvalidInput:         return "invalid input";
  }
  return "unknown";
}

static constexpr uint32_t kErrorDetailMaxLen = 127U;

/**
 * @brief Error kind plus bounded context.
 *
 * The detail carries the wrapped collaborator message for remote and
 * serialization failures, the endpoint name for kChannelClosed ("manager",
 * "action", "events"), and a message quoting the rejected value for
 * kInvalidInput.
 */
struct P2pError {
  P2pErrorKind kind{P2pErrorKind::kRemoteCallFailure};
  FixedString<kErrorDetailMaxLen> detail;

  const char* What() const noexcept { return detail.c_str(); }

  bool operator==(const P2pError& other) const noexcept {
    return kind == other.kind && detail == other.detail;
  }
  bool operator!=(const P2pError& other) const noexcept { return !(*this == other); }

  static P2pError Make(P2pErrorKind kind, const char* detail) noexcept {
    P2pError e;
    e.kind = kind;
    e.detail.assign(TruncateToCapacity, detail);
    return e;
  }

  /// printf-style variant; overlong context is truncated.
  static P2pError Format(P2pErrorKind kind, const char* fmt, ...) noexcept {
    char buf[kErrorDetailMaxLen + 1U];
    va_list args;
    va_start(args, fmt);
    (void)std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    return Make(kind, buf);
  }

  static P2pError RemoteCall(const char* detail) noexcept {
    return Make(P2pErrorKind::kRemoteCallFailure, detail);
  }
  static P2pError Serialization(const char* detail) noexcept {
    return Make(P2pErrorKind::kSerializationFailure, detail);
  }
  static P2pError ChannelClosed(const char* endpoint) noexcept {
    return Make(P2pErrorKind::kChannelClosed, endpoint);
  }
  static P2pError InvalidInput(const char* message) noexcept {
    return Make(P2pErrorKind::kInvalidInput, message);
  }
};

/// Outcome of one remote operation / one submitted command.
using ActionResult = expected<void, P2pError>;

}  // namespace wfd

#endif  // WFD_ERROR_HPP_
