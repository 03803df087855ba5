/**
 * @file test_manager.cpp
 * @brief Catch2 tests for wfd::WifiP2pManager and the actor loop.
 */

#include "wfd/manager.hpp"

#include "fake_backend.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>
#include <variant>
#include <vector>

// The actor core stands alone; INI parsing stays in config.hpp.
#ifdef WFD_CONFIG_HPP_
#error "manager.hpp must not include config.hpp"
#endif

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct Fixture {
  Fixture() : backend(std::make_shared<test::FakeBackend>()) {
    auto created = wfd::WifiP2pManager::Create("wlan0", backend);
    REQUIRE(created.has_value());
    manager = std::move(created.value());
  }

  wfd::WifiP2pChannel Start() {
    auto channel = manager->Initialize();
    REQUIRE(channel.has_value());
    return channel.value();
  }

  std::shared_ptr<test::FakeBackend> backend;
  std::unique_ptr<wfd::WifiP2pManager> manager;
};

wfd::ActionResult Submit(wfd::SubmitResult pending) {
  REQUIRE(pending.has_value());
  return pending.value().Wait();
}

wfd::P2pEvent NextEvent(wfd::EventReceiver& events) {
  auto e = events.RecvFor(2000U);
  REQUIRE(e.has_value());
  return e.value();
}

bool WaitForState(const wfd::WifiP2pManager& mgr, wfd::ActorState state) {
  for (int i = 0; i < 200; ++i) {
    if (mgr.State() == state) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

}  // namespace

// ============================================================================
// Create / Initialize
// ============================================================================

TEST_CASE("Manager Create rejects bad interface names", "[manager]") {
  auto backend = std::make_shared<test::FakeBackend>();
  const char* bad[] = {"", "   ", "\t\n", "an-interface-too-long"};
  for (const char* name : bad) {
    auto r = wfd::WifiP2pManager::Create(name, backend);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
  }
  REQUIRE(!wfd::WifiP2pManager::Create(nullptr, backend).has_value());
}

TEST_CASE("Manager Create rejects a null backend", "[manager]") {
  auto r = wfd::WifiP2pManager::Create("wlan0", nullptr);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
}

TEST_CASE("Manager Create keeps name, backend and config", "[manager]") {
  auto backend = std::make_shared<test::FakeBackend>();
  wfd::ManagerConfig cfg;
  cfg.command_queue_depth = 3U;
  auto r = wfd::WifiP2pManager::Create("p2p-dev-wlan0", backend, cfg);
  REQUIRE(r.has_value());
  auto& mgr = *r.value();
  REQUIRE(mgr.GetInterfaceName() == "p2p-dev-wlan0");
  REQUIRE(mgr.GetConfig().interface_name == "p2p-dev-wlan0");
  REQUIRE(mgr.GetConfig().command_queue_depth == 3U);
  REQUIRE(mgr.Backend().get() == backend.get());
  REQUIRE(mgr.State() == wfd::ActorState::kNotStarted);
  REQUIRE(!mgr.IsRunning());
}

TEST_CASE("Manager Initialize twice is rejected", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  REQUIRE(f.manager->IsRunning());
  auto again = f.manager->Initialize();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
}

// ============================================================================
// Command execution
// ============================================================================

TEST_CASE("Discover success resolves slot and broadcasts DiscoveryStarted", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();

  REQUIRE(Submit(channel.DiscoverPeers()).has_value());
  REQUIRE(std::holds_alternative<wfd::DiscoveryStarted>(NextEvent(events)));

  auto calls = f.backend->Calls();
  REQUIRE(calls.size() == 1U);
  REQUIRE(calls[0].op == test::Op::kDiscover);
}

TEST_CASE("Every command maps to its backend call and event", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();

  REQUIRE(Submit(channel.StopDiscovery()).has_value());
  REQUIRE(Submit(channel.Connect("02:11:22:33:44:55")).has_value());
  REQUIRE(Submit(channel.CreateGroup()).has_value());

  REQUIRE(std::holds_alternative<wfd::DiscoveryStopped>(NextEvent(events)));
  wfd::P2pEvent connected = NextEvent(events);
  REQUIRE(std::holds_alternative<wfd::Connected>(connected));
  REQUIRE(std::get<wfd::Connected>(connected).address == "02:11:22:33:44:55");
  REQUIRE(std::holds_alternative<wfd::GroupCreated>(NextEvent(events)));

  auto calls = f.backend->Calls();
  REQUIRE(calls.size() == 3U);
  REQUIRE(calls[0].op == test::Op::kStopDiscovery);
  REQUIRE(calls[1].op == test::Op::kConnect);
  REQUIRE(calls[1].address == "02:11:22:33:44:55");
  REQUIRE(calls[2].op == test::Op::kCreateGroup);
}

TEST_CASE("Failed Connect reaches the caller only", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();
  f.backend->FailNext(test::Op::kConnect,
                      wfd::P2pError::RemoteCall("fi.w1.wpa_supplicant1.UnknownError"));

  auto r = Submit(channel.Connect("aa:bb:cc:dd:ee:ff"));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kRemoteCallFailure);
  REQUIRE(r.get_error().detail == "fi.w1.wpa_supplicant1.UnknownError");
  REQUIRE(events.TryRecv().get_error().kind == wfd::BroadcastErrorKind::kEmpty);

  auto stats = f.manager->Stats();
  REQUIRE(stats.commands_processed == 1U);
  REQUIRE(stats.commands_failed == 1U);
  REQUIRE(stats.events_published == 0U);
}

TEST_CASE("Actor keeps running after a failure", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();
  f.backend->FailNext(test::Op::kDiscover, wfd::P2pError::Serialization("bad reply"));

  auto first = Submit(channel.DiscoverPeers());
  REQUIRE(first.get_error().kind == wfd::P2pErrorKind::kSerializationFailure);
  REQUIRE(Submit(channel.DiscoverPeers()).has_value());
  REQUIRE(f.manager->IsRunning());
  REQUIRE(std::holds_alternative<wfd::DiscoveryStarted>(NextEvent(events)));
  REQUIRE(events.TryRecv().get_error().kind == wfd::BroadcastErrorKind::kEmpty);
}

TEST_CASE("Discover then StopDiscovery events arrive in order", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();

  auto discover = channel.DiscoverPeers();
  auto stop = channel.StopDiscovery();
  REQUIRE(discover.has_value());
  REQUIRE(stop.has_value());
  REQUIRE(stop.value().Wait().has_value());
  REQUIRE(discover.value().Wait().has_value());

  REQUIRE(std::holds_alternative<wfd::DiscoveryStarted>(NextEvent(events)));
  REQUIRE(std::holds_alternative<wfd::DiscoveryStopped>(NextEvent(events)));
}

TEST_CASE("Event is not published before the remote call completes", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();
  f.backend->Hold();

  auto pending = channel.CreateGroup();
  REQUIRE(pending.has_value());
  REQUIRE(f.backend->WaitForCalls(1U));
  REQUIRE(events.TryRecv().get_error().kind == wfd::BroadcastErrorKind::kEmpty);
  REQUIRE(!pending.value().WaitFor(20U).has_value());

  f.backend->Release();
  REQUIRE(pending.value().Wait().has_value());
  REQUIRE(std::holds_alternative<wfd::GroupCreated>(NextEvent(events)));
}

TEST_CASE("Commands from many channels run one at a time in order", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> producers;
  std::vector<std::vector<wfd::ActionReceiver>> pending(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([t, copy = channel, &pending]() {
      for (int i = 0; i < kPerThread; ++i) {
        char addr[32];
        std::snprintf(addr, sizeof(addr), "02:00:00:00:%02x:%02x", t, i);
        auto r = copy.Connect(addr);
        if (r.has_value()) pending[t].push_back(std::move(r.value()));
      }
    });
  }
  for (auto& p : producers) p.join();

  uint32_t ok = 0;
  for (auto& per_thread : pending) {
    for (auto& rx : per_thread) {
      if (rx.Wait().has_value()) ++ok;
    }
  }
  REQUIRE(ok == static_cast<uint32_t>(kThreads * kPerThread));
  REQUIRE(f.backend->MaxInFlight() == 1);

  // Per-producer submission order is preserved at the backend.
  auto calls = f.backend->Calls();
  REQUIRE(calls.size() == static_cast<size_t>(kThreads * kPerThread));
  std::vector<int> next(kThreads, 0);
  for (const auto& call : calls) {
    unsigned t = 0;
    unsigned i = 0;
    REQUIRE(std::sscanf(call.address.c_str(), "02:00:00:00:%02x:%02x", &t, &i) == 2);
    REQUIRE(static_cast<int>(i) == next[t]);
    ++next[t];
  }
}

TEST_CASE("Dropped ActionReceiver does not cancel the command", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto events = channel.SubscribeEvents();
  {
    auto pending = channel.DiscoverPeers();
    REQUIRE(pending.has_value());
  }
  REQUIRE(std::holds_alternative<wfd::DiscoveryStarted>(NextEvent(events)));
  REQUIRE(f.backend->CallCount() == 1U);
}

TEST_CASE("Subscriber created after an event does not see it", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  REQUIRE(Submit(channel.DiscoverPeers()).has_value());
  auto late = channel.SubscribeEvents();
  REQUIRE(late.TryRecv().get_error().kind == wfd::BroadcastErrorKind::kEmpty);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Dropping every channel stops the actor", "[manager]") {
  Fixture f;
  {
    auto channel = f.Start();
    auto copy = channel;
    REQUIRE(f.manager->IsRunning());
  }
  REQUIRE(WaitForState(*f.manager, wfd::ActorState::kStopped));
}

TEST_CASE("Command enqueued before closure still resolves", "[manager]") {
  Fixture f;
  f.backend->Hold();
  wfd::SubmitResult first = wfd::SubmitResult::error(wfd::P2pError::ChannelClosed("manager"));
  wfd::SubmitResult second = wfd::SubmitResult::error(wfd::P2pError::ChannelClosed("manager"));
  {
    auto channel = f.Start();
    first = channel.DiscoverPeers();
    REQUIRE(f.backend->WaitForCalls(1U));
    second = channel.CreateGroup();
  }
  f.backend->Release();

  REQUIRE(first.value().Wait().has_value());
  REQUIRE(second.value().Wait().has_value());
  REQUIRE(WaitForState(*f.manager, wfd::ActorState::kStopped));
  REQUIRE(f.backend->CallCount() == 2U);
}

TEST_CASE("Shutdown drains queued commands then rejects new ones", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  f.backend->Hold();
  auto first = channel.DiscoverPeers();
  REQUIRE(f.backend->WaitForCalls(1U));
  auto second = channel.StopDiscovery();

  std::thread stopper([&] { f.manager->Shutdown(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  f.backend->Release();
  stopper.join();

  REQUIRE(first.value().Wait().has_value());
  REQUIRE(second.value().Wait().has_value());
  REQUIRE(f.manager->State() == wfd::ActorState::kStopped);
  REQUIRE(!channel.IsOpen());

  auto late = channel.CreateGroup();
  REQUIRE(!late.has_value());
  REQUIRE(late.get_error().kind == wfd::P2pErrorKind::kChannelClosed);
  REQUIRE(late.get_error().detail == "manager");

  f.manager->Shutdown();  // idempotent
  REQUIRE(f.manager->Stats().commands_processed == 2U);
}

TEST_CASE("Shutdown before Initialize is a no-op", "[manager]") {
  Fixture f;
  f.manager->Shutdown();
  REQUIRE(f.manager->State() == wfd::ActorState::kNotStarted);
}

TEST_CASE("Stopped manager cannot be restarted", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  f.manager->Shutdown();
  auto again = f.manager->Initialize();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
}

TEST_CASE("Topic closes once manager and channels are gone", "[manager]") {
  Fixture f;
  wfd::EventReceiver events;
  {
    auto channel = f.Start();
    events = channel.SubscribeEvents();
    REQUIRE(Submit(channel.CreateGroup()).has_value());
  }
  f.manager.reset();
  REQUIRE(std::holds_alternative<wfd::GroupCreated>(NextEvent(events)));
  REQUIRE(events.Recv().get_error().kind == wfd::BroadcastErrorKind::kClosed);
}

// ============================================================================
// PeerFound injection
// ============================================================================

TEST_CASE("PublishPeerFound before Initialize reports ChannelClosed", "[manager]") {
  Fixture f;
  wfd::P2pDevice device;
  device.mac_address = "02:11:22:33:44:55";
  auto r = f.manager->PublishPeerFound(device);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kChannelClosed);
  REQUIRE(r.get_error().detail == "events");
}

TEST_CASE("PublishPeerFound reaches every subscriber", "[manager]") {
  Fixture f;
  auto channel = f.Start();
  auto a = channel.SubscribeEvents();
  auto b = channel.SubscribeEvents();

  wfd::P2pDevice device;
  device.mac_address = "02:11:22:33:44:55";
  device.device_name = wfd::DeviceName("Living Room TV");
  auto r = f.manager->PublishPeerFound(device);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 2U);

  for (auto* sub : {&a, &b}) {
    wfd::P2pEvent e = NextEvent(*sub);
    REQUIRE(std::holds_alternative<wfd::PeerFound>(e));
    const wfd::P2pDevice& got = std::get<wfd::PeerFound>(e).device;
    REQUIRE(got.SamePeer(device));
    REQUIRE(got.device_name.has_value());
    REQUIRE(got.device_name.value() == "Living Room TV");
    REQUIRE(!got.primary_type.has_value());
  }
  REQUIRE(f.manager->Stats().events_published == 1U);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("Manager honours configured queue depth", "[manager]") {
  auto backend = std::make_shared<test::FakeBackend>();
  wfd::ManagerConfig cfg;
  cfg.command_queue_depth = 1U;
  cfg.event_capacity = 2U;
  auto mgr = wfd::WifiP2pManager::Create("wlan0", backend, cfg);
  REQUIRE(mgr.has_value());
  auto channel = mgr.value()->Initialize();
  REQUIRE(channel.has_value());
  auto events = channel.value().SubscribeEvents();

  backend->Hold();
  auto first = channel.value().DiscoverPeers();
  REQUIRE(backend->WaitForCalls(1U));
  auto second = channel.value().DiscoverPeers();  // fills the queue

  std::atomic<bool> third_sent{false};
  std::thread blocked([&] {
    auto third = channel.value().DiscoverPeers();
    third_sent.store(true);
    if (third.has_value()) (void)third.value().Wait();
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(!third_sent.load());

  backend->Release();
  blocked.join();
  REQUIRE(third_sent.load());
  REQUIRE(first.value().Wait().has_value());
  REQUIRE(second.value().Wait().has_value());

  // Three events into a two-slot history: the subscriber lags by one.
  auto lag = events.RecvFor(2000U);
  REQUIRE(!lag.has_value());
  REQUIRE(lag.get_error().kind == wfd::BroadcastErrorKind::kLagged);
  REQUIRE(lag.get_error().skipped == 1U);
}
