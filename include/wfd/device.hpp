/**
 * @file device.hpp
 * @brief Snapshot of one discovered Wi-Fi Direct peer.
 */

#ifndef WFD_DEVICE_HPP_
#define WFD_DEVICE_HPP_

#include "wfd/vocabulary.hpp"

#include <cstdint>

namespace wfd {

/// Peer identifier: MAC address ("02:11:22:33:44:55") or D-Bus object path.
static constexpr uint32_t kPeerAddressMaxLen = 63U;
/// Wi-Fi P2P device names are at most 32 octets.
static constexpr uint32_t kDeviceNameMaxLen = 32U;
/// Primary device type, e.g. "1-0050F204-1".
static constexpr uint32_t kDeviceTypeMaxLen = 31U;

using PeerAddress = FixedString<kPeerAddressMaxLen>;
using DeviceName = FixedString<kDeviceNameMaxLen>;
using DeviceType = FixedString<kDeviceTypeMaxLen>;

/**
 * @brief Immutable description of a peer as reported by the P2P layer.
 *
 * Two records describe the same peer when their addresses match; name and
 * type are informational only.
 */
struct P2pDevice {
  PeerAddress mac_address;
  optional<DeviceName> device_name;
  optional<DeviceType> primary_type;

  bool SamePeer(const P2pDevice& other) const noexcept {
    return mac_address == other.mac_address;
  }
};

}  // namespace wfd

#endif  // WFD_DEVICE_HPP_
