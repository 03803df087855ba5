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
 * @file broadcast.hpp
 * @brief Bounded fan-out topic: publishers never block, slow subscribers lag.
 *
 * Architecture:
 *                           +--> BroadcastSubscriber (cursor a)
 *   BroadcastPublisher ---> history[capacity] --> BroadcastSubscriber (cursor b)
 *                           +--> BroadcastSubscriber (cursor c)
 *
 * Every published value gets a monotonically increasing sequence number and
 * is written into a shared history ring of fixed capacity, overwriting the
 * oldest entry. Each subscriber keeps its own cursor:
 *
 * - A subscriber starts at the current tail, so it never sees values
 *   published before it subscribed.
 * - When its cursor falls out of the retained window, the next receive
 *   reports kLagged with the number of skipped values and repositions the
 *   cursor at the oldest retained value.
 * - Once every publisher is gone and the cursor reached the tail, receives
 *   report kClosed.
 *
 * Publish() only takes the topic lock for the slot write; it never waits
 * for subscribers.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef WFD_BROADCAST_HPP_
#define WFD_BROADCAST_HPP_

#include "wfd/platform.hpp"
#include "wfd/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace wfd {

enum class BroadcastErrorKind : uint8_t {
  kEmpty = 0,  ///< TryRecv(): nothing new.
  kLagged,     ///< Cursor overrun; see BroadcastRecvError::skipped.
  kClosed,     ///< All publishers gone and history drained.
  kTimeout     ///< RecvFor(): deadline passed.
};

struct BroadcastRecvError {
  BroadcastErrorKind kind;
  uint64_t skipped;  ///< Values lost to overrun (kLagged only).
};

static constexpr uint32_t kDefaultBroadcastCapacity = 64U;

namespace detail {

template <typename T>
class BroadcastState final {
 public:
  explicit BroadcastState(uint32_t capacity)
      : capacity_(capacity == 0U ? 1U : capacity), history_(capacity_) {}

  BroadcastState(const BroadcastState&) = delete;
  BroadcastState& operator=(const BroadcastState&) = delete;

  uint32_t Publish(const T& value) {
    uint32_t receivers = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      history_[static_cast<size_t>(tail_ % capacity_)] = optional<T>(value);
      ++tail_;
      receivers = subscribers_;
    }
    cv_.notify_all();
    return receivers;
  }

  uint64_t Subscribe() {
    std::lock_guard<std::mutex> lk(mtx_);
    ++subscribers_;
    return tail_;
  }

  void Unsubscribe() {
    std::lock_guard<std::mutex> lk(mtx_);
    WFD_ASSERT(subscribers_ > 0U);
    --subscribers_;
  }

  void AddPublisher() {
    std::lock_guard<std::mutex> lk(mtx_);
    ++publishers_;
  }

  void RemovePublisher() {
    bool last = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      WFD_ASSERT(publishers_ > 0U);
      --publishers_;
      last = (publishers_ == 0U);
    }
    if (last) cv_.notify_all();
  }

  /**
   * @brief Core receive. @p timeout_ms < 0 blocks indefinitely, 0 polls.
   */
  expected<T, BroadcastRecvError> Recv(uint64_t& cursor, int64_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto ready = [this, &cursor] { return cursor < tail_ || publishers_ == 0U; };

    if (timeout_ms < 0) {
      cv_.wait(lk, ready);
    } else if (timeout_ms > 0) {
      if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), ready)) {
        return Error(BroadcastErrorKind::kTimeout, 0U);
      }
    } else if (!ready()) {
      return Error(BroadcastErrorKind::kEmpty, 0U);
    }

    if (cursor >= tail_) {
      return Error(BroadcastErrorKind::kClosed, 0U);
    }

    const uint64_t oldest = (tail_ > capacity_) ? (tail_ - capacity_) : 0U;
    if (cursor < oldest) {
      const uint64_t skipped = oldest - cursor;
      cursor = oldest;
      return Error(BroadcastErrorKind::kLagged, skipped);
    }

    const optional<T>& slot = history_[static_cast<size_t>(cursor % capacity_)];
    WFD_ASSERT(slot.has_value());
    ++cursor;
    return expected<T, BroadcastRecvError>::success(slot.value());
  }

  uint32_t SubscriberCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return subscribers_;
  }

  uint32_t PublisherCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return publishers_;
  }

  uint32_t Capacity() const noexcept { return static_cast<uint32_t>(capacity_); }

 private:
  static expected<T, BroadcastRecvError> Error(BroadcastErrorKind kind,
                                               uint64_t skipped) {
    return expected<T, BroadcastRecvError>::error(BroadcastRecvError{kind, skipped});
  }

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  const uint64_t capacity_;
  std::vector<optional<T>> history_;
  uint64_t tail_{0U};  ///< Sequence number of the next published value.
  uint32_t subscribers_{0U};
  uint32_t publishers_{0U};
};

}  // namespace detail

// ============================================================================
// BroadcastSubscriber<T>
// ============================================================================

template <typename T>
class BroadcastSubscriber final {
 public:
  BroadcastSubscriber() noexcept = default;

  explicit BroadcastSubscriber(std::shared_ptr<detail::BroadcastState<T>> state)
      : state_(std::move(state)), cursor_(state_ ? state_->Subscribe() : 0U) {}

  BroadcastSubscriber(const BroadcastSubscriber&) = delete;
  BroadcastSubscriber& operator=(const BroadcastSubscriber&) = delete;

  BroadcastSubscriber(BroadcastSubscriber&& other) noexcept
      : state_(std::move(other.state_)), cursor_(other.cursor_) {}

  BroadcastSubscriber& operator=(BroadcastSubscriber&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
      cursor_ = other.cursor_;
    }
    return *this;
  }

  ~BroadcastSubscriber() { Release(); }

  /** @brief Block until the next value, a lag report, or closure. */
  expected<T, BroadcastRecvError> Recv() { return RecvImpl(-1); }

  /** @brief Non-blocking receive; kEmpty when nothing is pending. */
  expected<T, BroadcastRecvError> TryRecv() { return RecvImpl(0); }

  /** @brief Receive with a deadline; kTimeout when it expires. */
  expected<T, BroadcastRecvError> RecvFor(uint32_t timeout_ms) {
    // A zero deadline behaves like TryRecv() but reports kTimeout.
    if (timeout_ms == 0U) {
      auto r = RecvImpl(0);
      if (!r.has_value() && r.get_error().kind == BroadcastErrorKind::kEmpty) {
        return expected<T, BroadcastRecvError>::error(
            BroadcastRecvError{BroadcastErrorKind::kTimeout, 0U});
      }
      return r;
    }
    return RecvImpl(static_cast<int64_t>(timeout_ms));
  }

 private:
  expected<T, BroadcastRecvError> RecvImpl(int64_t timeout_ms) {
    if (!state_) {
      return expected<T, BroadcastRecvError>::error(
          BroadcastRecvError{BroadcastErrorKind::kClosed, 0U});
    }
    return state_->Recv(cursor_, timeout_ms);
  }

  void Release() noexcept {
    if (state_) {
      state_->Unsubscribe();
      state_.reset();
    }
  }

  std::shared_ptr<detail::BroadcastState<T>> state_;
  uint64_t cursor_{0U};
};

// ============================================================================
// BroadcastPublisher<T>
// ============================================================================

/**
 * @brief Publishing handle. Copies share the topic; the topic closes for
 *        subscribers once every copy is gone.
 */
template <typename T>
class BroadcastPublisher final {
 public:
  BroadcastPublisher() noexcept = default;

  explicit BroadcastPublisher(std::shared_ptr<detail::BroadcastState<T>> state)
      : state_(std::move(state)) {
    if (state_) state_->AddPublisher();
  }

  BroadcastPublisher(const BroadcastPublisher& other) : state_(other.state_) {
    if (state_) state_->AddPublisher();
  }

  BroadcastPublisher& operator=(const BroadcastPublisher& other) {
    if (this != &other) {
      Release();
      state_ = other.state_;
      if (state_) state_->AddPublisher();
    }
    return *this;
  }

  BroadcastPublisher(BroadcastPublisher&& other) noexcept
      : state_(std::move(other.state_)) {}

  BroadcastPublisher& operator=(BroadcastPublisher&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~BroadcastPublisher() { Release(); }

  /**
   * @brief Copy @p value to every current subscriber.
   * @return Number of subscribers at publish time (0 is not an error).
   */
  uint32_t Publish(const T& value) const {
    return state_ ? state_->Publish(value) : 0U;
  }

  /** @brief New subscriber positioned after everything published so far. */
  BroadcastSubscriber<T> Subscribe() const { return BroadcastSubscriber<T>(state_); }

  bool IsValid() const noexcept { return static_cast<bool>(state_); }
  uint32_t SubscriberCount() const { return state_ ? state_->SubscriberCount() : 0U; }
  uint32_t Capacity() const { return state_ ? state_->Capacity() : 0U; }

 private:
  void Release() noexcept {
    if (state_) {
      state_->RemovePublisher();
      state_.reset();
    }
  }

  std::shared_ptr<detail::BroadcastState<T>> state_;
};

template <typename T>
BroadcastPublisher<T> MakeBroadcast(uint32_t capacity = kDefaultBroadcastCapacity) {
  return BroadcastPublisher<T>(std::make_shared<detail::BroadcastState<T>>(capacity));
}

}  // namespace wfd

#endif  // WFD_BROADCAST_HPP_
