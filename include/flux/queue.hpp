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
 * @file queue.hpp
 * @brief Queue - unbounded relay from producers to one output Channel.
 *
 * Architecture:
 *   Enqueue() --inbox/ack--> ManagerThread --TrySend(head)--> Channel (Deq)
 *                                 |
 *                              Buffer<T>
 *
 * The manager thread is the only owner of the buffer order and the only
 * sender on the output channel. Producers never wait for the consumer: an
 * Enqueue() returns as soon as the manager has put the item in the buffer.
 *
 * The head item is copied with Peek() before it is offered and popped only
 * after the channel accepted it, so an item arriving on the inbox at the
 * same time can neither overtake nor replace it.
 *
 * Close() is a fast shutdown: items still buffered are discarded. Consumers
 * that need every item must drain the output channel before closing.
 *
 * Usage:
 *   flux::Channel<int> out;
 *   flux::Queue<int> q(out);
 *   q.Enqueue(1);              // returns once buffered
 *   auto v = out.Receive();    // v.value() == 1
 *   q.Close();                 // also closes `out`
 */

#ifndef FLUX_QUEUE_HPP_
#define FLUX_QUEUE_HPP_

#include "flux/buffer.hpp"
#include "flux/channel.hpp"
#include "flux/log.hpp"
#include "flux/vocabulary.hpp"

#include <cstdint>

#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

namespace flux {

/**
 * @brief Back-pressure-free delivery queue in front of a caller's Channel.
 *
 * @tparam T Item type (copyable; the head is copied before each offer).
 */
template <typename T>
class Queue final {
 public:
  /**
   * @brief Start the manager thread relaying into @p deq.
   *
   * @p deq must outlive the Queue and must have no other sender.
   */
  explicit Queue(Channel<T>& deq) : deq_(deq) {
    deq_.SetReadyHook(&Queue::OnOutputReady, this);
    manager_ = std::thread(&Queue::ManagerLoop, this);
  }

  ~Queue() { Close(); }

  Queue(const Queue&) = delete;
  Queue& operator=(const Queue&) = delete;
  Queue(Queue&&) = delete;
  Queue& operator=(Queue&&) = delete;

  /**
   * @brief Hand @p item to the manager and wait until it is buffered.
   *
   * Concurrent producers are serialised; each one's items keep their order.
   *
   * @return true once buffered, false if the queue is closed first.
   */
  bool Enqueue(T item) {
    std::lock_guard<std::mutex> producer(enqueue_mtx_);
    std::unique_lock<std::mutex> lk(mtx_);
    if (closed_) {
      return false;
    }
    inbox_.emplace(std::move(item));
    cv_.notify_one();
    done_cv_.wait(lk, [this] { return !inbox_.has_value() || closed_; });
    if (inbox_.has_value()) {
      inbox_.reset();
      return false;
    }
    return true;
  }

  /**
   * @brief Stop the manager, then close the output channel.
   *
   * Items buffered but not yet delivered are discarded. Idempotent.
   */
  void Close() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) {
        return;
      }
      closed_ = true;
    }
    cv_.notify_all();
    done_cv_.notify_all();
    if (manager_.joinable()) {
      manager_.join();
    }

    deq_.SetReadyHook(nullptr, nullptr);
    const uint32_t dropped = buffer_.Length();
    if (dropped > 0U) {
      FLUX_LOG_DEBUG("Queue", "closed with %u undelivered item(s)", dropped);
    }
    buffer_.Clear();
    deq_.Close();
  }

  /// Advisory: may change before the caller uses it.
  uint32_t Length() const { return buffer_.Length(); }

 private:
  static void OnOutputReady(void* context) noexcept {
    auto* self = static_cast<Queue*>(context);
    {
      std::lock_guard<std::mutex> lk(self->mtx_);
      ++self->ready_epoch_;
    }
    self->cv_.notify_one();
  }

  void ManagerLoop() {
    for (;;) {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this] {
        return closed_ || inbox_.has_value() ||
               (ready_epoch_ != seen_epoch_ && buffer_.Length() > 0U);
      });
      if (closed_) {
        return;
      }

      if (inbox_.has_value()) {
        buffer_.Enqueue(std::move(inbox_.value()));
        inbox_.reset();
        done_cv_.notify_one();
        continue;
      }

      // Readiness seen before this offer; a later receiver bumps the epoch.
      seen_epoch_ = ready_epoch_;
      lk.unlock();

      auto head = buffer_.Peek();
      if (!head.has_value()) {
        continue;
      }
      if (deq_.TrySend(head.value())) {
        (void)buffer_.Dequeue();  // head delivered; nobody else pops
      }
    }
  }

  Channel<T>& deq_;
  Buffer<T> buffer_;

  std::mutex enqueue_mtx_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::condition_variable done_cv_;
  optional<T> inbox_;
  uint64_t ready_epoch_{1U};
  uint64_t seen_epoch_{0U};
  bool closed_{false};

  std::thread manager_;
};

}  // namespace flux

#endif  // FLUX_QUEUE_HPP_
