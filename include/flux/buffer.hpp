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
 * @file buffer.hpp
 * @brief Buffer - unbounded, reader/writer-locked FIFO of opaque items.
 *
 * Buffer is the storage behind Queue. It never blocks on capacity: items
 * are appended at the tail and removed from the head, index 0 always being
 * the oldest item still buffered.
 *
 * Every operation holds the lock for its whole duration, but Peek() followed
 * by Dequeue() is not atomic as a pair. Callers that rely on both returning
 * the same item must guarantee a single consumer (Queue does this with its
 * manager thread).
 *
 * Usage:
 *   flux::Buffer<int> buf;
 *   buf.Enqueue(1);
 *   auto head = buf.Peek();     // head.value() == 1, still buffered
 *   auto item = buf.Dequeue();  // item.value() == 1, removed
 */

#ifndef FLUX_BUFFER_HPP_
#define FLUX_BUFFER_HPP_

#include "flux/vocabulary.hpp"

#include <cstdint>

#include <deque>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace flux {

// ============================================================================
// QueueError
// ============================================================================

enum class QueueError : uint8_t {
  kBufferEmpty = 0,  ///< Peek/Dequeue on an empty Buffer.
  kQueueEmpty,       ///< Nothing was delivered within a bounded receive.
  kClosed,           ///< Channel or queue closed.
};

// ============================================================================
// Buffer
// ============================================================================

/**
 * @brief Unbounded FIFO guarded by a reader/writer lock.
 *
 * @tparam T Item type. Peek() returns a copy, so T must be copyable.
 */
template <typename T>
class Buffer final {
 public:
  Buffer() = default;
  ~Buffer() = default;

  Buffer(const Buffer&) = delete;
  Buffer& operator=(const Buffer&) = delete;
  Buffer(Buffer&&) = delete;
  Buffer& operator=(Buffer&&) = delete;

  /**
   * @brief Append @p item at the tail.
   */
  void Enqueue(const T& item) {
    std::unique_lock<std::shared_mutex> lock(rw_);
    items_.push_back(item);
  }

  void Enqueue(T&& item) {
    std::unique_lock<std::shared_mutex> lock(rw_);
    items_.push_back(std::move(item));
  }

  /**
   * @brief Remove and return the head item.
   * @return The oldest item, or QueueError::kBufferEmpty.
   */
  expected<T, QueueError> Dequeue() {
    std::unique_lock<std::shared_mutex> lock(rw_);
    if (items_.empty()) {
      return expected<T, QueueError>::error(QueueError::kBufferEmpty);
    }
    auto head = expected<T, QueueError>::success(std::move(items_.front()));
    items_.pop_front();
    return head;
  }

  /**
   * @brief Return a copy of the head item without removing it.
   * @return The oldest item, or QueueError::kBufferEmpty.
   */
  expected<T, QueueError> Peek() const {
    std::shared_lock<std::shared_mutex> lock(rw_);
    if (items_.empty()) {
      return expected<T, QueueError>::error(QueueError::kBufferEmpty);
    }
    return expected<T, QueueError>::success(items_.front());
  }

  uint32_t Length() const {
    std::shared_lock<std::shared_mutex> lock(rw_);
    return static_cast<uint32_t>(items_.size());
  }

  /**
   * @brief Drop every buffered item.
   */
  void Clear() {
    std::unique_lock<std::shared_mutex> lock(rw_);
    std::deque<T>().swap(items_);
  }

 private:
  mutable std::shared_mutex rw_;
  std::deque<T> items_;
};

}  // namespace flux

#endif  // FLUX_BUFFER_HPP_
