/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file manager.hpp
 * @brief WifiP2pManager - single-writer actor in front of a P2pBackend.
 *
 * Architecture:
 *   WifiP2pChannel::DiscoverPeers() ... -> CommandQueue (bounded MPSC)
 *                    |
 *              Actor thread (RunManager loop)
 *                    | one command at a time, FIFO
 *              P2pBackend (blocking remote call)
 *                    |
 *              event -> Broadcast topic (success only)
 *              outcome -> command's one-shot slot
 *
 * Lifecycle:
 *   Create() validates the interface name and backend. Initialize() builds
 *   the queue and topic, spawns the actor and returns the first channel.
 *   The actor stops once every channel is gone and the queue drained, or
 *   when Shutdown() closes the queue. Stopped is terminal.
 *
 * Usage:
 *   auto backend = std::make_shared<MyBackend>();
 *   auto mgr = wfd::WifiP2pManager::Create("wlan0", backend);
 *   auto channel = mgr.value()->Initialize();
 *   auto pending = channel.value().DiscoverPeers();
 *   wfd::ActionResult r = pending.value().Wait();
 */

#ifndef WFD_MANAGER_HPP_
#define WFD_MANAGER_HPP_

#include "wfd/backend.hpp"
#include "wfd/broadcast.hpp"
#include "wfd/channel.hpp"
#include "wfd/command.hpp"
#include "wfd/command_queue.hpp"
#include "wfd/error.hpp"
#include "wfd/event.hpp"
#include "wfd/log.hpp"
#include "wfd/manager_config.hpp"
#include "wfd/platform.hpp"
#include "wfd/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

namespace wfd {

// ============================================================================
// Actor state and statistics
// ============================================================================

enum class ActorState : uint8_t {
  kNotStarted = 0,  ///< Initialize() not called yet.
  kRunning,         ///< Actor thread is consuming commands.
  kStopped          ///< Queue closed and drained; terminal.
};

inline const char* ActorStateName(ActorState state) noexcept {
  switch (state) {
    case ActorState::kNotStarted: return "NotStarted";
    case ActorState::kRunning:    return "Running";
    case ActorState::kStopped:    return "Stopped";
  }
  return "Unknown";
}

struct ManagerStatsSnapshot {
  uint64_t commands_processed{0U};
  uint64_t commands_failed{0U};
  uint64_t events_published{0U};
};

class ManagerStatistics final {
 public:
  void RecordProcessed(bool failed) noexcept {
    processed_.fetch_add(1U, std::memory_order_relaxed);
    if (failed) failed_.fetch_add(1U, std::memory_order_relaxed);
  }

  void RecordPublished() noexcept {
    published_.fetch_add(1U, std::memory_order_relaxed);
  }

  ManagerStatsSnapshot Snapshot() const noexcept {
    ManagerStatsSnapshot s;
    s.commands_processed = processed_.load(std::memory_order_acquire);
    s.commands_failed = failed_.load(std::memory_order_acquire);
    s.events_published = published_.load(std::memory_order_acquire);
    return s;
  }

 private:
  alignas(kCacheLineSize) std::atomic<uint64_t> processed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> failed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> published_{0U};
};

// ============================================================================
// Actor loop
// ============================================================================

/**
 * @brief State shared between the manager and its actor thread.
 *
 * The command receiver is touched only by the actor thread, except for
 * Close() which the manager may call from any thread.
 */
struct ActorContext {
  ActorContext(QueueReceiver<ManagerCommand> rx, EventPublisher tx,
               std::shared_ptr<P2pBackend> port) noexcept
      : commands(std::move(rx)), events(std::move(tx)), backend(std::move(port)) {}

  QueueReceiver<ManagerCommand> commands;
  EventPublisher events;
  std::shared_ptr<P2pBackend> backend;
  ManagerStatistics stats;
  std::atomic<ActorState> state{ActorState::kNotStarted};
};

namespace detail {

/// Publish on success, then resolve the caller's slot.
inline void Complete(ActorContext& ctx, const char* name, ActionResult result,
                     ActionSender& respond_to, const P2pEvent& event) {
  if (result.has_value()) {
    (void)ctx.events.Publish(event);
    ctx.stats.RecordPublished();
  } else {
    WFD_LOG_WARN("Manager", "%s failed: %s: %s", name,
                 ErrorKindName(result.get_error().kind), result.get_error().What());
  }
  ctx.stats.RecordProcessed(!result.has_value());
  if (!respond_to.Send(std::move(result))) {
    WFD_LOG_DEBUG("Manager", "%s outcome dropped: caller stopped waiting", name);
  }
}

}  // namespace detail

/**
 * @brief Run one command against the backend and report its outcome.
 */
inline void ExecuteCommand(ActorContext& ctx, ManagerCommand& command) {
  const char* name = CommandName(command);
  WFD_LOG_DEBUG("Manager", "executing %s", name);
  P2pBackend& port = *ctx.backend;
  std::visit(
      overloaded{
          [&](DiscoverCommand& c) {
            detail::Complete(ctx, name, port.DiscoverPeers(), c.respond_to,
                             DiscoveryStarted{});
          },
          [&](StopDiscoveryCommand& c) {
            detail::Complete(ctx, name, port.StopDiscovery(), c.respond_to,
                             DiscoveryStopped{});
          },
          [&](ConnectCommand& c) {
            detail::Complete(ctx, name, port.Connect(c.device_address), c.respond_to,
                             Connected{c.device_address});
          },
          [&](CreateGroupCommand& c) {
            detail::Complete(ctx, name, port.CreateGroup(), c.respond_to,
                             GroupCreated{});
          },
      },
      command);
}

/**
 * @brief Actor body: drain the command queue until it is closed and empty.
 *
 * Remote failures never end the loop. Returns with the state set to
 * kStopped.
 */
inline void RunManager(ActorContext& ctx) {
  ctx.state.store(ActorState::kRunning, std::memory_order_release);
  WFD_LOG_DEBUG("Manager", "actor running");
  for (;;) {
    optional<ManagerCommand> next = ctx.commands.Recv();
    if (!next.has_value()) break;
    ExecuteCommand(ctx, next.value());
  }
  ctx.state.store(ActorState::kStopped, std::memory_order_release);
  ManagerStatsSnapshot s = ctx.stats.Snapshot();
  WFD_LOG_INFO("Manager", "actor stopped (processed=%lu failed=%lu events=%lu)",
               static_cast<unsigned long>(s.commands_processed),
               static_cast<unsigned long>(s.commands_failed),
               static_cast<unsigned long>(s.events_published));
}

// ============================================================================
// WifiP2pManager
// ============================================================================

class WifiP2pManager final {
 public:
  using CreateResult = expected<std::unique_ptr<WifiP2pManager>, P2pError>;

  /**
   * @brief Validate inputs and build an idle manager.
   *
   * @param interface_name Managed interface ("wlan0"); 1..15 characters.
   * @param backend Remote-operation port used exclusively by the actor.
   * @param config Queue depth, topic capacity; interface_name is ignored.
   */
  static CreateResult Create(const char* interface_name,
                             std::shared_ptr<P2pBackend> backend,
                             const ManagerConfig& config = ManagerConfig{}) {
    auto name = ValidateInterfaceName(interface_name);
    if (!name.has_value()) {
      WFD_LOG_WARN("Manager", "rejected interface: %s", name.get_error().What());
      return CreateResult::error(name.get_error());
    }
    if (!backend) {
      return CreateResult::error(P2pError::InvalidInput("null backend"));
    }
    return CreateResult::success(std::unique_ptr<WifiP2pManager>(
        new WifiP2pManager(name.value(), std::move(backend), config)));
  }

  ~WifiP2pManager() { Shutdown(); }

  WifiP2pManager(const WifiP2pManager&) = delete;
  WifiP2pManager& operator=(const WifiP2pManager&) = delete;
  WifiP2pManager(WifiP2pManager&&) = delete;
  WifiP2pManager& operator=(WifiP2pManager&&) = delete;

  /**
   * @brief Spawn the actor and return the first channel.
   *
   * A manager drives exactly one actor; a second call fails with
   * kInvalidInput.
   */
  expected<WifiP2pChannel, P2pError> Initialize() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (ctx_) {
      return expected<WifiP2pChannel, P2pError>::error(
          P2pError::InvalidInput("manager already initialized"));
    }

    auto queue = MakeCommandQueue<ManagerCommand>(config_.command_queue_depth);
    EventPublisher events = MakeBroadcast<P2pEvent>(config_.event_capacity);
    WifiP2pChannel channel(std::move(queue.first), events);

    ctx_ = std::make_shared<ActorContext>(std::move(queue.second), std::move(events),
                                          backend_);
    ctx_->state.store(ActorState::kRunning, std::memory_order_release);
    std::shared_ptr<ActorContext> ctx = ctx_;
    actor_thread_ = std::thread([ctx]() { RunManager(*ctx); });

    WFD_LOG_INFO("Manager", "initialized on %s (queue=%u events=%u)",
                 interface_name_.c_str(), config_.command_queue_depth,
                 config_.event_capacity);
    return expected<WifiP2pChannel, P2pError>::success(std::move(channel));
  }

  /**
   * @brief Stop accepting commands, let the actor finish what is queued,
   *        and join it. Idempotent.
   */
  void Shutdown() {
    std::thread actor;
    {
      std::lock_guard<std::mutex> lk(lifecycle_mtx_);
      if (!ctx_) return;
      ctx_->commands.Close();
      actor = std::move(actor_thread_);
    }
    if (actor.joinable()) {
      actor.join();
    }
  }

  /**
   * @brief Inject a peer report from an external signal source.
   * @return Subscribers reached, or ChannelClosed("events") before
   *         Initialize().
   */
  expected<uint32_t, P2pError> PublishPeerFound(const P2pDevice& device) {
    std::shared_ptr<ActorContext> ctx = Context();
    if (!ctx) {
      return expected<uint32_t, P2pError>::error(P2pError::ChannelClosed("events"));
    }
    uint32_t reached = ctx->events.Publish(PeerFound{device});
    ctx->stats.RecordPublished();
    return expected<uint32_t, P2pError>::success(reached);
  }

  ActorState State() const {
    std::shared_ptr<ActorContext> ctx = Context();
    return ctx ? ctx->state.load(std::memory_order_acquire) : ActorState::kNotStarted;
  }

  bool IsRunning() const { return State() == ActorState::kRunning; }

  ManagerStatsSnapshot Stats() const {
    std::shared_ptr<ActorContext> ctx = Context();
    return ctx ? ctx->stats.Snapshot() : ManagerStatsSnapshot{};
  }

  const InterfaceName& GetInterfaceName() const noexcept { return interface_name_; }
  const std::shared_ptr<P2pBackend>& Backend() const noexcept { return backend_; }
  const ManagerConfig& GetConfig() const noexcept { return config_; }

 private:
  WifiP2pManager(const InterfaceName& name, std::shared_ptr<P2pBackend> backend,
                 const ManagerConfig& config)
      : interface_name_(name), backend_(std::move(backend)), config_(config) {
    config_.interface_name = name;
  }

  std::shared_ptr<ActorContext> Context() const {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    return ctx_;
  }

  InterfaceName interface_name_;
  std::shared_ptr<P2pBackend> backend_;
  ManagerConfig config_;

  mutable std::mutex lifecycle_mtx_;
  std::shared_ptr<ActorContext> ctx_;
  std::thread actor_thread_;
};

}  // namespace wfd

#endif  // WFD_MANAGER_HPP_
