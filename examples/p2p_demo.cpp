// Copyright (c) 2024 liudegui. MIT License.
//
// p2p_demo.cpp -- Wi-Fi Direct discovery through wpa_supplicant.
//
// Demonstrates:
//   1. Optional INI configuration (first argument)
//   2. WpaSupplicantBackend + WifiP2pManager wiring
//   3. Event subscription on a printer thread
//   4. Two-step submission: DiscoverPeers() then Wait()
//
// Usage: p2p_demo [wfd.ini]
// Requires a running wpa_supplicant with the D-Bus control interface
// enabled and permission to talk to it on the system bus.

#include "wfd/config.hpp"
#include "wfd/event.hpp"
#include "wfd/log.hpp"
#include "wfd/manager.hpp"
#include "wfd/wpa_supplicant_backend.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>
#include <variant>

// ============================================================================
// Event printer
// ============================================================================

static void PrintEvent(const wfd::P2pEvent& event) {
  std::visit(
      wfd::overloaded{
          [](const wfd::DiscoveryStarted&) { printf("P2P discovery started\n"); },
          [](const wfd::DiscoveryStopped&) { printf("P2P discovery stopped\n"); },
          [](const wfd::GroupCreated&) { printf("P2P group created\n"); },
          [](const wfd::Connected& e) {
            printf("Connected to peer %s\n", e.address.c_str());
          },
          [](const wfd::PeerFound& e) {
            printf("Peer found: %s (%s)\n", e.device.mac_address.c_str(),
                   e.device.device_name.has_value()
                       ? e.device.device_name.value().c_str()
                       : "unnamed");
          },
      },
      event);
}

static void EventLoop(wfd::EventReceiver events) {
  for (;;) {
    auto r = events.Recv();
    if (r.has_value()) {
      PrintEvent(r.value());
      continue;
    }
    if (r.get_error().kind == wfd::BroadcastErrorKind::kLagged) {
      WFD_LOG_WARN("Demo", "printer lagged, %lu events skipped",
                   static_cast<unsigned long>(r.get_error().skipped));
      continue;
    }
    break;  // kClosed
  }
}

static int RequestDiscovery(const wfd::WifiP2pChannel& channel,
                            const wfd::ManagerConfig& cfg) {
  auto pending = channel.DiscoverPeers();
  if (!pending.has_value()) {
    WFD_LOG_ERROR("Demo", "submit: %s", pending.get_error().What());
    return 1;
  }
  wfd::ActionResult result = pending.value().Wait();
  if (!result.has_value()) {
    printf("discovery failed: %s: %s\n", wfd::ErrorKindName(result.get_error().kind),
           result.get_error().What());
    return 1;
  }
  printf("discovery requested on %s\n", cfg.interface_name.c_str());
  return 0;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  wfd::log::Init();

  wfd::ManagerConfig cfg;
  if (argc > 1) {
    wfd::IniConfig ini;
    auto loaded = ini.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      WFD_LOG_ERROR("Demo", "cannot load %s: %s", argv[1],
                    wfd::ConfigErrorName(loaded.get_error()));
      return 2;
    }
    cfg = wfd::LoadManagerConfig(ini);
  }
  wfd::log::SetLevel(cfg.log_level);

  auto backend = wfd::WpaSupplicantBackend::Create(cfg.interface_name.c_str());
  if (!backend.has_value()) {
    WFD_LOG_ERROR("Demo", "backend: %s: %s",
                  wfd::ErrorKindName(backend.get_error().kind),
                  backend.get_error().What());
    return 1;
  }
  std::shared_ptr<wfd::P2pBackend> port(std::move(backend.value()));

  auto manager = wfd::WifiP2pManager::Create(cfg.interface_name.c_str(), port, cfg);
  if (!manager.has_value()) {
    WFD_LOG_ERROR("Demo", "manager: %s", manager.get_error().What());
    return 1;
  }
  int rc = 0;
  std::thread printer;
  {
    auto channel = manager.value()->Initialize();
    if (!channel.has_value()) {
      WFD_LOG_ERROR("Demo", "initialize: %s", channel.get_error().What());
      return 1;
    }
    printer = std::thread(EventLoop, channel.value().SubscribeEvents());
    rc = RequestDiscovery(channel.value(), cfg);
  }

  manager.value()->Shutdown();
  wfd::ManagerStatsSnapshot stats = manager.value()->Stats();
  printf("commands=%lu failed=%lu events=%lu\n",
         static_cast<unsigned long>(stats.commands_processed),
         static_cast<unsigned long>(stats.commands_failed),
         static_cast<unsigned long>(stats.events_published));

  // Last publisher gone: the printer sees kClosed and exits.
  manager.value().reset();
  printer.join();

  wfd::log::Shutdown();
  return rc;
}
