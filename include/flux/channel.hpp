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
 * @file channel.hpp
 * @brief Channel - unbuffered rendezvous channel with close semantics.
 *
 * A value handed to Send() is transferred directly to one receiver; there
 * is a single hand-off slot and no internal queue. Close() wakes every
 * waiter: pending receivers get QueueError::kClosed, blocked senders whose
 * value was not yet taken get false back.
 *
 * TrySend() only succeeds when a receiver is already waiting and the slot
 * is free, which lets a single owner thread (Queue's manager) offer a value
 * without ever blocking on consumer pace. SetReadyHook() tells that owner
 * when retrying may succeed.
 *
 * Usage:
 *   flux::Channel<int> ch;
 *   std::thread consumer([&] {
 *     while (auto v = ch.Receive()) { use(v.value()); }
 *   });
 *   ch.Send(1);
 *   ch.Close();
 *   consumer.join();
 */

#ifndef FLUX_CHANNEL_HPP_
#define FLUX_CHANNEL_HPP_

#include "flux/buffer.hpp"
#include "flux/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>

namespace flux {

/**
 * @brief Unbuffered rendezvous channel.
 *
 * @tparam T Value type (must be move-constructible; TrySend() copies).
 */
template <typename T>
class Channel final {
 public:
  /// Invoked under the channel lock; must not call back into the channel.
  using ReadyHookFn = void (*)(void* context);

  Channel() = default;
  ~Channel() = default;

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&) = delete;
  Channel& operator=(Channel&&) = delete;

  /**
   * @brief Hand @p item to a receiver, blocking until it is taken.
   * @return true once a receiver took the value, false if the channel was
   *         closed first (the value is withdrawn).
   */
  bool Send(T item) {
    std::unique_lock<std::mutex> lk(mtx_);
    send_cv_.wait(lk, [this] { return !slot_.has_value() || closed_; });
    if (closed_) {
      return false;
    }
    slot_.emplace(std::move(item));
    const uint64_t seq = ++put_seq_;
    recv_cv_.notify_one();

    send_cv_.wait(lk, [this, seq] { return taken_seq_ >= seq || closed_; });
    if (taken_seq_ >= seq) {
      return true;
    }
    // Closed while our value still sat in the slot.
    slot_.reset();
    taken_seq_ = seq;
    send_cv_.notify_all();
    return false;
  }

  /**
   * @brief Non-blocking hand-off to an already waiting receiver.
   *
   * Succeeds only if at least one receiver is blocked in Receive() or
   * ReceiveFor() and the slot is free. A value accepted here is delivered
   * even if the channel is closed before the receiver wakes up.
   */
  bool TrySend(const T& item) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_ || slot_.has_value() || waiting_ == 0U) {
      return false;
    }
    slot_.emplace(item);
    ++put_seq_;
    recv_cv_.notify_one();
    return true;
  }

  /**
   * @brief Block until a value arrives or the channel is closed.
   * @return The value, or QueueError::kClosed.
   */
  expected<T, QueueError> Receive() {
    std::unique_lock<std::mutex> lk(mtx_);
    ++waiting_;
    FireReadyHook();
    recv_cv_.wait(lk, [this] { return slot_.has_value() || closed_; });
    --waiting_;
    return TakeLocked();
  }

  /**
   * @brief Bounded Receive().
   * @return The value, QueueError::kQueueEmpty on timeout, or kClosed.
   */
  template <typename Rep, typename Period>
  expected<T, QueueError> ReceiveFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    ++waiting_;
    FireReadyHook();
    const bool ready =
        recv_cv_.wait_for(lk, timeout, [this] { return slot_.has_value() || closed_; });
    --waiting_;
    if (!ready) {
      return expected<T, QueueError>::error(QueueError::kQueueEmpty);
    }
    return TakeLocked();
  }

  /**
   * @brief Close the channel. Idempotent.
   */
  void Close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    recv_cv_.notify_all();
    send_cv_.notify_all();
  }

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  uint32_t WaitingReceivers() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return waiting_;
  }

  /**
   * @brief Install (or clear with nullptr) the single readiness observer.
   *
   * The hook runs whenever a receiver starts waiting or takes a value.
   */
  void SetReadyHook(ReadyHookFn fn, void* context) noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    hook_ = fn;
    hook_context_ = context;
  }

 private:
  expected<T, QueueError> TakeLocked() {
    if (!slot_.has_value()) {
      return expected<T, QueueError>::error(QueueError::kClosed);
    }
    auto v = expected<T, QueueError>::success(std::move(slot_.value()));
    slot_.reset();
    ++taken_seq_;
    send_cv_.notify_all();
    FireReadyHook();
    return v;
  }

  void FireReadyHook() noexcept {
    if (hook_ != nullptr) {
      hook_(hook_context_);
    }
  }

  mutable std::mutex mtx_;
  std::condition_variable recv_cv_;
  std::condition_variable send_cv_;

  optional<T> slot_;
  uint64_t put_seq_{0U};
  uint64_t taken_seq_{0U};
  uint32_t waiting_{0U};
  bool closed_{false};

  ReadyHookFn hook_{nullptr};
  void* hook_context_{nullptr};
};

}  // namespace flux

#endif  // FLUX_CHANNEL_HPP_
