/**
 * @file backend.hpp
 * @brief Remote-operation port: the four control-service operations the
 *        manager actor drives.
 *
 * Implementations perform one blocking remote call per method and report
 * the outcome as ActionResult. The manager actor is the only caller, one
 * call at a time, so implementations need no internal locking.
 */

#ifndef WFD_BACKEND_HPP_
#define WFD_BACKEND_HPP_

#include "wfd/device.hpp"
#include "wfd/error.hpp"
#include "wfd/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace wfd {

class P2pBackend {
 public:
  virtual ~P2pBackend() = default;

  /// Start a peer discovery scan (p2p_find).
  virtual ActionResult DiscoverPeers() = 0;
  /// Stop the ongoing peer discovery scan (p2p_stop_find).
  virtual ActionResult StopDiscovery() = 0;
  /// Connect to a peer by device address (p2p_connect).
  virtual ActionResult Connect(const PeerAddress& device_address) = 0;
  /// Create a P2P group (p2p_group_add).
  virtual ActionResult CreateGroup() = 0;
};

/// IFNAMSIZ - 1.
static constexpr uint32_t kInterfaceNameMaxLen = 15U;

using InterfaceName = FixedString<kInterfaceNameMaxLen>;

inline bool IsBlank(const char* str) noexcept {
  if (str == nullptr) return true;
  for (; *str != '\0'; ++str) {
    if (*str != ' ' && *str != '\t' && *str != '\n' && *str != '\r') return false;
  }
  return true;
}

/**
 * @brief Validate a network interface name ("wlan0", "p2p-dev-wlan0", ...).
 *
 * Rejects null, empty, whitespace-only and over-long names with
 * kInvalidInput carrying the offending name.
 */
inline expected<InterfaceName, P2pError> ValidateInterfaceName(const char* name) {
  if (IsBlank(name)) {
    return expected<InterfaceName, P2pError>::error(
        P2pError::Format(P2pErrorKind::kInvalidInput, "invalid interface name: '%s'",
                         name != nullptr ? name : ""));
  }
  if (std::strlen(name) > kInterfaceNameMaxLen) {
    return expected<InterfaceName, P2pError>::error(
        P2pError::Format(P2pErrorKind::kInvalidInput,
                         "interface name too long: '%s'", name));
  }
  return expected<InterfaceName, P2pError>::success(
      InterfaceName(TruncateToCapacity, name));
}

}  // namespace wfd

#endif  // WFD_BACKEND_HPP_
