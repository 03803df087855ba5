/**
 * @file test_channel.cpp
 * @brief Tests for channel.hpp against a hand-driven command queue.
 */

#include "wfd/channel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <utility>
#include <variant>

namespace {

struct Harness {
  explicit Harness(uint32_t depth = 4U)
      : queue(wfd::MakeCommandQueue<wfd::ManagerCommand>(depth)),
        events(wfd::MakeBroadcast<wfd::P2pEvent>(8U)),
        channel(queue.first, events) {}

  std::pair<wfd::QueueSender<wfd::ManagerCommand>,
            wfd::QueueReceiver<wfd::ManagerCommand>>
      queue;
  wfd::EventPublisher events;
  wfd::WifiP2pChannel channel;
};

wfd::ActionSender& Slot(wfd::ManagerCommand& cmd) {
  return std::visit([](auto& c) -> wfd::ActionSender& { return c.respond_to; }, cmd);
}

}  // namespace

TEST_CASE("Channel enqueues one command per request", "[channel]") {
  Harness h;
  REQUIRE(h.channel.DiscoverPeers().has_value());
  REQUIRE(h.channel.StopDiscovery().has_value());
  REQUIRE(h.channel.Connect("aa:bb:cc:dd:ee:ff").has_value());
  REQUIRE(h.channel.CreateGroup().has_value());
  REQUIRE(h.queue.second.Size() == 4U);

  auto c0 = h.queue.second.Recv();
  auto c1 = h.queue.second.Recv();
  auto c2 = h.queue.second.Recv();
  auto c3 = h.queue.second.Recv();
  REQUIRE(std::holds_alternative<wfd::DiscoverCommand>(c0.value()));
  REQUIRE(std::holds_alternative<wfd::StopDiscoveryCommand>(c1.value()));
  REQUIRE(std::holds_alternative<wfd::ConnectCommand>(c2.value()));
  REQUIRE(std::get<wfd::ConnectCommand>(c2.value()).device_address == "aa:bb:cc:dd:ee:ff");
  REQUIRE(std::holds_alternative<wfd::CreateGroupCommand>(c3.value()));
}

TEST_CASE("ActionReceiver yields the resolved outcome", "[channel]") {
  Harness h;
  auto pending = h.channel.DiscoverPeers();
  REQUIRE(pending.has_value());

  auto cmd = h.queue.second.Recv();
  REQUIRE(Slot(cmd.value()).Send(wfd::ActionResult::success()));
  REQUIRE(pending.value().Wait().has_value());
}

TEST_CASE("ActionReceiver carries a remote failure", "[channel]") {
  Harness h;
  auto pending = h.channel.CreateGroup();
  auto cmd = h.queue.second.Recv();
  Slot(cmd.value()).Send(
      wfd::ActionResult::error(wfd::P2pError::RemoteCall("fi.w1.wpa_supplicant1.UnknownError")));

  auto r = pending.value().Wait();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kRemoteCallFailure);
  REQUIRE(r.get_error().detail == "fi.w1.wpa_supplicant1.UnknownError");
}

TEST_CASE("ActionReceiver reports ChannelClosed for a dropped slot", "[channel]") {
  Harness h;
  auto pending = h.channel.StopDiscovery();
  { auto cmd = h.queue.second.Recv(); }

  auto r = pending.value().Wait();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kChannelClosed);
  REQUIRE(r.get_error().detail == "action");
}

TEST_CASE("ActionReceiver WaitFor times out then resolves", "[channel]") {
  Harness h;
  auto pending = h.channel.DiscoverPeers();
  REQUIRE(!pending.value().WaitFor(10U).has_value());

  auto cmd = h.queue.second.Recv();
  Slot(cmd.value()).Send(wfd::ActionResult::success());
  auto r = pending.value().WaitFor(10U);
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
}

TEST_CASE("Channel Connect rejects invalid addresses", "[channel]") {
  Harness h;
  auto empty = h.channel.Connect("");
  REQUIRE(!empty.has_value());
  REQUIRE(empty.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
  REQUIRE(empty.get_error().detail == "invalid peer address: ''");

  auto blank = h.channel.Connect("  \t");
  REQUIRE(blank.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
  REQUIRE(blank.get_error().detail == "invalid peer address: '  \t'");

  auto null_addr = h.channel.Connect(nullptr);
  REQUIRE(null_addr.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
  REQUIRE(null_addr.get_error().detail == "invalid peer address: ''");

  std::string long_addr(wfd::kPeerAddressMaxLen + 1U, 'a');
  auto too_long = h.channel.Connect(long_addr.c_str());
  REQUIRE(too_long.get_error().kind == wfd::P2pErrorKind::kInvalidInput);
  std::string expected_detail = "peer address too long: '" + long_addr + "'";
  REQUIRE(too_long.get_error().detail == expected_detail.c_str());

  REQUIRE(h.queue.second.Size() == 0U);
}

TEST_CASE("Channel Connect accepts an object path peer", "[channel]") {
  Harness h;
  const char* path = "/fi/w1/wpa_supplicant1/Interfaces/0/Peers/021122334455";
  REQUIRE(h.channel.Connect(path).has_value());
  auto cmd = h.queue.second.Recv();
  REQUIRE(std::get<wfd::ConnectCommand>(cmd.value()).device_address == path);
}

TEST_CASE("Channel submissions fail after the queue closes", "[channel]") {
  Harness h;
  REQUIRE(h.channel.IsOpen());
  h.queue.second.Close();
  REQUIRE(!h.channel.IsOpen());

  auto r = h.channel.DiscoverPeers();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == wfd::P2pErrorKind::kChannelClosed);
  REQUIRE(r.get_error().detail == "manager");
}

TEST_CASE("Channel copies share one queue", "[channel]") {
  Harness h;
  wfd::WifiP2pChannel copy = h.channel;
  REQUIRE(h.queue.second.SenderCount() == 3U);
  REQUIRE(copy.DiscoverPeers().has_value());
  REQUIRE(h.channel.StopDiscovery().has_value());
  REQUIRE(h.queue.second.Size() == 2U);
}

TEST_CASE("Channel SubscribeEvents observes published events", "[channel]") {
  Harness h;
  auto events = h.channel.SubscribeEvents();
  h.events.Publish(wfd::GroupCreated{});
  auto e = events.TryRecv();
  REQUIRE(e.has_value());
  REQUIRE(std::holds_alternative<wfd::GroupCreated>(e.value()));
}
