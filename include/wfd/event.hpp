/**
 * @file event.hpp
 * @brief Domain events broadcast to every subscriber of a manager.
 */

#ifndef WFD_EVENT_HPP_
#define WFD_EVENT_HPP_

#include "wfd/broadcast.hpp"
#include "wfd/device.hpp"
#include "wfd/vocabulary.hpp"

#include <variant>

namespace wfd {

/// Local discovery request succeeded and the scan is active.
struct DiscoveryStarted {};
/// Local request to stop discovery succeeded.
struct DiscoveryStopped {};
/// Local request to form a group succeeded.
struct GroupCreated {};
/// Local connect request succeeded for the given peer.
struct Connected {
  PeerAddress address;
};
/// A peer was reported by an external signal producer.
struct PeerFound {
  P2pDevice device;
};

using P2pEvent =
    std::variant<DiscoveryStarted, DiscoveryStopped, GroupCreated, Connected, PeerFound>;

using EventPublisher = BroadcastPublisher<P2pEvent>;
using EventReceiver = BroadcastSubscriber<P2pEvent>;

inline const char* EventName(const P2pEvent& event) noexcept {
  return std::visit(
      overloaded{
          [](const DiscoveryStarted&) { return "DiscoveryStarted"; },
          [](const DiscoveryStopped&) { return "DiscoveryStopped"; },
          [](const GroupCreated&) { return "GroupCreated"; },
          [](const Connected&) { return "Connected"; },
          [](const PeerFound&) { return "PeerFound"; },
      },
      event);
}

}  // namespace wfd

#endif  // WFD_EVENT_HPP_
