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
 * @file command_queue.hpp
 * @brief Bounded blocking MPSC queue with sender counting and closure.
 *
 * Architecture:
 *   QueueSender (copy 0) --+
 *   QueueSender (copy 1) --+--> ring[capacity] --> QueueReceiver (single)
 *   QueueSender (copy N) --+
 *
 * - Send() blocks while the ring is full; it never drops or reorders.
 * - Destroying the last sender closes the queue for input. Items already
 *   buffered stay receivable; Recv() reports end of input (empty optional)
 *   only once the queue is closed AND drained.
 * - Destroying the receiver closes the queue and destroys buffered items.
 *
 * Usage:
 * @code
 *   auto q = wfd::MakeCommandQueue<int>(32);
 *   q.first.Send(7);
 *   auto item = q.second.Recv();   // item.value() == 7
 * @endcode
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef WFD_COMMAND_QUEUE_HPP_
#define WFD_COMMAND_QUEUE_HPP_

#include "wfd/platform.hpp"
#include "wfd/vocabulary.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace wfd {

enum class QueueError : uint8_t {
  kFull = 0,  ///< TrySend(): ring at capacity.
  kClosed     ///< Receiver gone or queue closed for input.
};

static constexpr uint32_t kDefaultCommandQueueDepth = 32U;

namespace detail {

template <typename T>
class CommandQueueState final {
 public:
  explicit CommandQueueState(uint32_t capacity)
      : capacity_(capacity == 0U ? 1U : capacity), slots_(capacity_) {}

  CommandQueueState(const CommandQueueState&) = delete;
  CommandQueueState& operator=(const CommandQueueState&) = delete;

  expected<void, QueueError> Push(T&& item, bool wait) {
    {
      std::unique_lock<std::mutex> lk(mtx_);
      if (wait) {
        not_full_.wait(lk, [this] { return count_ < capacity_ || closed_; });
      }
      if (closed_) return expected<void, QueueError>::error(QueueError::kClosed);
      if (count_ == capacity_) return expected<void, QueueError>::error(QueueError::kFull);
      slots_[(head_ + count_) % capacity_] = optional<T>(std::move(item));
      ++count_;
    }
    not_empty_.notify_one();
    return expected<void, QueueError>::success();
  }

  optional<T> Pop() {
    optional<T> out;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      not_empty_.wait(lk, [this] { return count_ > 0U || closed_; });
      if (count_ == 0U) return out;
      out = std::move(slots_[head_]);
      slots_[head_].reset();
      head_ = (head_ + 1U) % capacity_;
      --count_;
    }
    not_full_.notify_one();
    return out;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  /// Close and hand back everything still buffered (destroyed by caller).
  std::vector<optional<T>> CloseAndTake() {
    std::vector<optional<T>> drained;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
      drained.reserve(count_);
      while (count_ > 0U) {
        drained.push_back(std::move(slots_[head_]));
        slots_[head_].reset();
        head_ = (head_ + 1U) % capacity_;
        --count_;
      }
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    return drained;
  }

  void AddSender() {
    std::lock_guard<std::mutex> lk(mtx_);
    ++senders_;
  }

  void RemoveSender() {
    bool last = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      WFD_ASSERT(senders_ > 0U);
      --senders_;
      last = (senders_ == 0U);
    }
    if (last) Close();
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
  }

  uint32_t SenderCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return senders_;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  const uint32_t capacity_;
  std::vector<optional<T>> slots_;
  uint32_t head_{0U};
  uint32_t count_{0U};
  uint32_t senders_{0U};
  bool closed_{false};
};

}  // namespace detail

// ============================================================================
// QueueSender<T>
// ============================================================================

/**
 * @brief Producer handle. Copies share the queue and each counts as a
 *        live producer.
 */
template <typename T>
class QueueSender final {
 public:
  QueueSender() noexcept = default;

  explicit QueueSender(std::shared_ptr<detail::CommandQueueState<T>> state)
      : state_(std::move(state)) {
    if (state_) state_->AddSender();
  }

  QueueSender(const QueueSender& other) : state_(other.state_) {
    if (state_) state_->AddSender();
  }

  QueueSender& operator=(const QueueSender& other) {
    if (this != &other) {
      Release();
      state_ = other.state_;
      if (state_) state_->AddSender();
    }
    return *this;
  }

  QueueSender(QueueSender&& other) noexcept : state_(std::move(other.state_)) {}

  QueueSender& operator=(QueueSender&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~QueueSender() { Release(); }

  /**
   * @brief Enqueue, blocking while the queue is full.
   *
   * On kClosed the item is left with the caller.
   */
  expected<void, QueueError> Send(T&& item) const {
    if (!state_) return expected<void, QueueError>::error(QueueError::kClosed);
    return state_->Push(std::move(item), true);
  }

  /** @brief Enqueue without blocking; fails with kFull or kClosed. */
  expected<void, QueueError> TrySend(T&& item) const {
    if (!state_) return expected<void, QueueError>::error(QueueError::kClosed);
    return state_->Push(std::move(item), false);
  }

  bool IsClosed() const { return !state_ || state_->IsClosed(); }
  uint32_t Capacity() const { return state_ ? state_->Capacity() : 0U; }

 private:
  void Release() noexcept {
    if (state_) {
      state_->RemoveSender();
      state_.reset();
    }
  }

  std::shared_ptr<detail::CommandQueueState<T>> state_;
};

// ============================================================================
// QueueReceiver<T>
// ============================================================================

/** @brief The single consumer handle (move-only). */
template <typename T>
class QueueReceiver final {
 public:
  QueueReceiver() noexcept = default;

  explicit QueueReceiver(std::shared_ptr<detail::CommandQueueState<T>> state) noexcept
      : state_(std::move(state)) {}

  QueueReceiver(const QueueReceiver&) = delete;
  QueueReceiver& operator=(const QueueReceiver&) = delete;

  QueueReceiver(QueueReceiver&& other) noexcept : state_(std::move(other.state_)) {}

  QueueReceiver& operator=(QueueReceiver&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~QueueReceiver() { Release(); }

  /**
   * @brief Block until an item is available.
   * @return The next item in FIFO order, or an empty optional once the
   *         queue is closed and drained.
   */
  optional<T> Recv() {
    if (!state_) return optional<T>();
    return state_->Pop();
  }

  /**
   * @brief Stop accepting new items. Buffered items remain receivable.
   *
   * Safe to call from a thread other than the one blocked in Recv().
   */
  void Close() const {
    if (state_) state_->Close();
  }

  uint32_t Size() const { return state_ ? state_->Size() : 0U; }
  uint32_t Capacity() const { return state_ ? state_->Capacity() : 0U; }
  uint32_t SenderCount() const { return state_ ? state_->SenderCount() : 0U; }
  bool IsClosed() const { return !state_ || state_->IsClosed(); }

 private:
  void Release() {
    if (!state_) return;
    // Destroy leftovers outside the queue lock.
    std::vector<optional<T>> leftovers = state_->CloseAndTake();
    leftovers.clear();
    state_.reset();
  }

  std::shared_ptr<detail::CommandQueueState<T>> state_;
};

// ============================================================================
// Factory
// ============================================================================

template <typename T>
std::pair<QueueSender<T>, QueueReceiver<T>> MakeCommandQueue(
    uint32_t capacity = kDefaultCommandQueueDepth) {
  auto state = std::make_shared<detail::CommandQueueState<T>>(capacity);
  return {QueueSender<T>(state), QueueReceiver<T>(state)};
}

}  // namespace wfd

#endif  // WFD_COMMAND_QUEUE_HPP_
