/**
 * @file channel.hpp
 * @brief Caller-side handle to a running manager actor.
 *
 * Every request is a two-step exchange: the method call enqueues the
 * command and returns an ActionReceiver (submission), and
 * ActionReceiver::Wait() yields the outcome once the actor has run the
 * remote operation. The two steps may happen on different threads.
 *
 * Usage:
 * @code
 *   auto events = channel.SubscribeEvents();
 *   auto pending = channel.DiscoverPeers();
 *   if (pending.has_value()) {
 *     wfd::ActionResult r = pending.value().Wait();
 *   }
 * @endcode
 */

#ifndef WFD_CHANNEL_HPP_
#define WFD_CHANNEL_HPP_

#include "wfd/backend.hpp"
#include "wfd/command.hpp"
#include "wfd/command_queue.hpp"
#include "wfd/error.hpp"
#include "wfd/event.hpp"
#include "wfd/log.hpp"
#include "wfd/oneshot.hpp"

#include <cstdint>
#include <cstring>
#include <utility>

namespace wfd {

// ============================================================================
// ActionReceiver
// ============================================================================

/**
 * @brief Pending outcome of one submitted command.
 *
 * Destroying it before the outcome arrives does not cancel the command.
 */
class ActionReceiver final {
 public:
  ActionReceiver() noexcept = default;
  explicit ActionReceiver(OneShotReceiver<ActionResult> slot) noexcept
      : slot_(std::move(slot)) {}

  ActionReceiver(ActionReceiver&&) noexcept = default;
  ActionReceiver& operator=(ActionReceiver&&) noexcept = default;

  /**
   * @brief Block until the actor resolves the command.
   *
   * A slot dropped unresolved (actor gone) yields ChannelClosed("action").
   */
  ActionResult Wait() { return Unwrap(slot_.Recv()); }

  /**
   * @brief Wait at most @p timeout_ms milliseconds.
   * @return Empty on timeout; the receiver stays usable.
   */
  optional<ActionResult> WaitFor(uint32_t timeout_ms) {
    auto r = slot_.RecvFor(timeout_ms);
    if (!r.has_value() && r.get_error() == OneShotError::kTimeout) {
      return {};
    }
    return optional<ActionResult>(Unwrap(std::move(r)));
  }

 private:
  static ActionResult Unwrap(expected<ActionResult, OneShotError>&& r) {
    if (r.has_value()) return std::move(r).value();
    return ActionResult::error(P2pError::ChannelClosed("action"));
  }

  OneShotReceiver<ActionResult> slot_;
};

using SubmitResult = expected<ActionReceiver, P2pError>;

// ============================================================================
// WifiP2pChannel
// ============================================================================

/**
 * @brief Copyable submission handle: one command sender plus one event
 *        publisher clone.
 *
 * The actor stops once every channel copy is gone and the queue drained,
 * or when the owning manager shuts down.
 */
class WifiP2pChannel final {
 public:
  WifiP2pChannel(QueueSender<ManagerCommand> commands, EventPublisher events) noexcept
      : commands_(std::move(commands)), events_(std::move(events)) {}

  /** @brief Receiver of every event published from now on. */
  EventReceiver SubscribeEvents() const { return events_.Subscribe(); }

  SubmitResult DiscoverPeers() const { return Submit<DiscoverCommand>(); }

  SubmitResult StopDiscovery() const { return Submit<StopDiscoveryCommand>(); }

  /**
   * @brief Connect to @p device_address (MAC address or peer object path).
   *
   * Empty, whitespace-only or over-long addresses are rejected with
   * kInvalidInput without reaching the actor.
   */
  SubmitResult Connect(const char* device_address) const {
    if (IsBlank(device_address)) {
      return SubmitResult::error(
          P2pError::Format(P2pErrorKind::kInvalidInput, "invalid peer address: '%s'",
                           device_address != nullptr ? device_address : ""));
    }
    if (std::strlen(device_address) > kPeerAddressMaxLen) {
      return SubmitResult::error(P2pError::Format(
          P2pErrorKind::kInvalidInput, "peer address too long: '%s'", device_address));
    }
    return Submit<ConnectCommand>(PeerAddress(TruncateToCapacity, device_address));
  }

  SubmitResult CreateGroup() const { return Submit<CreateGroupCommand>(); }

  /** @brief True while the actor still accepts commands. */
  bool IsOpen() const { return !commands_.IsClosed(); }

 private:
  template <typename Command, typename... Args>
  SubmitResult Submit(Args&&... args) const {
    auto slot = MakeOneShot<ActionResult>();
    ManagerCommand cmd(Command{std::forward<Args>(args)..., std::move(slot.first)});
    auto sent = commands_.Send(std::move(cmd));
    if (!sent.has_value()) {
      WFD_LOG_WARN("Channel", "%s rejected: manager is gone", CommandName(cmd));
      return SubmitResult::error(P2pError::ChannelClosed("manager"));
    }
    return SubmitResult::success(ActionReceiver(std::move(slot.second)));
  }

  QueueSender<ManagerCommand> commands_;
  EventPublisher events_;
};

}  // namespace wfd

#endif  // WFD_CHANNEL_HPP_
