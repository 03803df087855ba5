/**
 * @file oneshot.hpp
 * @brief Single-use rendezvous channel: one value, one sender, one receiver.
 *
 * The sender delivers at most one value. Destroying the sender without
 * sending closes the slot, which the receiver observes as kClosed instead
 * of blocking forever. Destroying the receiver makes a later Send() return
 * false; the value is discarded.
 *
 * Usage:
 * @code
 *   auto slot = wfd::MakeOneShot<int>();
 *   std::thread t([tx = std::move(slot.first)]() mutable { tx.Send(42); });
 *   auto r = slot.second.Recv();   // r.value() == 42
 * @endcode
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef WFD_ONESHOT_HPP_
#define WFD_ONESHOT_HPP_

#include "wfd/platform.hpp"
#include "wfd/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace wfd {

enum class OneShotError : uint8_t {
  kClosed = 0,  ///< Sender dropped without a value, or value already taken.
  kEmpty,       ///< TryRecv(): nothing delivered yet.
  kTimeout      ///< RecvFor(): deadline passed before delivery.
};

namespace detail {

template <typename T>
struct OneShotState {
  std::mutex mtx;
  std::condition_variable cv;
  optional<T> value;
  bool sender_alive{true};
  bool receiver_alive{true};
};

}  // namespace detail

// ============================================================================
// OneShotSender<T>
// ============================================================================

template <typename T>
class OneShotSender final {
 public:
  OneShotSender() noexcept = default;
  explicit OneShotSender(std::shared_ptr<detail::OneShotState<T>> state) noexcept
      : state_(std::move(state)) {}

  ~OneShotSender() { Drop(); }

  OneShotSender(const OneShotSender&) = delete;
  OneShotSender& operator=(const OneShotSender&) = delete;

  OneShotSender(OneShotSender&& other) noexcept : state_(std::move(other.state_)) {}
  OneShotSender& operator=(OneShotSender&& other) noexcept {
    if (this != &other) {
      Drop();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  /**
   * @brief Deliver the value and release the slot.
   * @return false if the receiver is gone or this sender was already used.
   */
  bool Send(T value) {
    if (!state_) return false;
    bool delivered = false;
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      if (state_->receiver_alive) {
        state_->value = optional<T>(std::move(value));
        delivered = true;
      }
      state_->sender_alive = false;
    }
    state_->cv.notify_all();
    state_.reset();
    return delivered;
  }

  /** @brief True once the receiver has been destroyed (or Send() ran). */
  bool IsClosed() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return !state_->receiver_alive;
  }

 private:
  void Drop() noexcept {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      state_->sender_alive = false;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::OneShotState<T>> state_;
};

// ============================================================================
// OneShotReceiver<T>
// ============================================================================

template <typename T>
class OneShotReceiver final {
 public:
  OneShotReceiver() noexcept = default;
  explicit OneShotReceiver(std::shared_ptr<detail::OneShotState<T>> state) noexcept
      : state_(std::move(state)) {}

  ~OneShotReceiver() { Drop(); }

  OneShotReceiver(const OneShotReceiver&) = delete;
  OneShotReceiver& operator=(const OneShotReceiver&) = delete;

  OneShotReceiver(OneShotReceiver&& other) noexcept : state_(std::move(other.state_)) {}
  OneShotReceiver& operator=(OneShotReceiver&& other) noexcept {
    if (this != &other) {
      Drop();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  /** @brief Block until the value arrives or the sender is gone. */
  expected<T, OneShotError> Recv() {
    if (!state_) return expected<T, OneShotError>::error(OneShotError::kClosed);
    std::unique_lock<std::mutex> lk(state_->mtx);
    state_->cv.wait(lk, [this] {
      return state_->value.has_value() || !state_->sender_alive;
    });
    return TakeLocked();
  }

  /** @brief Non-blocking poll. */
  expected<T, OneShotError> TryRecv() {
    if (!state_) return expected<T, OneShotError>::error(OneShotError::kClosed);
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (!state_->value.has_value() && state_->sender_alive) {
      return expected<T, OneShotError>::error(OneShotError::kEmpty);
    }
    return TakeLocked();
  }

  /**
   * @brief Wait at most @p timeout_ms milliseconds.
   *
   * A timeout leaves the slot intact; a later Recv() still gets the value.
   */
  expected<T, OneShotError> RecvFor(uint32_t timeout_ms) {
    if (!state_) return expected<T, OneShotError>::error(OneShotError::kClosed);
    std::unique_lock<std::mutex> lk(state_->mtx);
    bool ready = state_->cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] {
      return state_->value.has_value() || !state_->sender_alive;
    });
    if (!ready) return expected<T, OneShotError>::error(OneShotError::kTimeout);
    return TakeLocked();
  }

 private:
  expected<T, OneShotError> TakeLocked() {
    if (!state_->value.has_value()) {
      return expected<T, OneShotError>::error(OneShotError::kClosed);
    }
    T out(std::move(state_->value.value()));
    state_->value.reset();
    return expected<T, OneShotError>::success(std::move(out));
  }

  void Drop() noexcept {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      state_->receiver_alive = false;
      state_->value.reset();
    }
    state_.reset();
  }

  std::shared_ptr<detail::OneShotState<T>> state_;
};

// ============================================================================
// Factory
// ============================================================================

template <typename T>
std::pair<OneShotSender<T>, OneShotReceiver<T>> MakeOneShot() {
  auto state = std::make_shared<detail::OneShotState<T>>();
  return {OneShotSender<T>(state), OneShotReceiver<T>(state)};
}

}  // namespace wfd

#endif  // WFD_ONESHOT_HPP_
