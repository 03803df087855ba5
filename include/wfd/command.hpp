/**
 * @file command.hpp
 * @brief Commands carried from channel handles to the manager actor.
 *
 * Every command owns the sending half of a one-shot result slot. The actor
 * resolves it exactly once; if the command is destroyed unprocessed (the
 * actor is gone), the slot closes and the caller observes kChannelClosed.
 */

#ifndef WFD_COMMAND_HPP_
#define WFD_COMMAND_HPP_

#include "wfd/device.hpp"
#include "wfd/error.hpp"
#include "wfd/oneshot.hpp"
#include "wfd/vocabulary.hpp"

#include <variant>

namespace wfd {

using ActionSender = OneShotSender<ActionResult>;

struct DiscoverCommand {
  ActionSender respond_to;
};

struct StopDiscoveryCommand {
  ActionSender respond_to;
};

struct ConnectCommand {
  PeerAddress device_address;
  ActionSender respond_to;
};

struct CreateGroupCommand {
  ActionSender respond_to;
};

using ManagerCommand =
    std::variant<DiscoverCommand, StopDiscoveryCommand, ConnectCommand, CreateGroupCommand>;

inline const char* CommandName(const ManagerCommand& command) noexcept {
  return std::visit(
      overloaded{
          [](const DiscoverCommand&) { return "Discover"; },
          [](const StopDiscoveryCommand&) { return "StopDiscovery"; },
          [](const ConnectCommand&) { return "Connect"; },
          [](const CreateGroupCommand&) { return "CreateGroup"; },
      },
      command);
}

}  // namespace wfd

#endif  // WFD_COMMAND_HPP_
