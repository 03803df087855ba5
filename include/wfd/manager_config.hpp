/**
 * @file manager_config.hpp
 * @brief Tunables for WifiP2pManager: interface, queue depth, topic capacity,
 *        log level.
 *
 * Kept apart from config.hpp so the actor core does not depend on the INI
 * parser. LoadManagerConfig() in config.hpp fills this from a ConfigStore.
 */

#ifndef WFD_MANAGER_CONFIG_HPP_
#define WFD_MANAGER_CONFIG_HPP_

#include "wfd/backend.hpp"
#include "wfd/broadcast.hpp"
#include "wfd/command_queue.hpp"
#include "wfd/log.hpp"

#include <cstdint>

namespace wfd {

static constexpr uint32_t kMaxCommandQueueDepth = 1024U;
static constexpr uint32_t kMaxEventCapacity = 4096U;

struct ManagerConfig {
  InterfaceName interface_name{"wlan0"};
  uint32_t command_queue_depth{kDefaultCommandQueueDepth};
  uint32_t event_capacity{kDefaultBroadcastCapacity};
#ifdef NDEBUG
  log::Level log_level{log::Level::kInfo};
#else
  log::Level log_level{log::Level::kDebug};
#endif
};

}  // namespace wfd

#endif  // WFD_MANAGER_CONFIG_HPP_
