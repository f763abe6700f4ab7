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
 * @file pressure_stream.hpp
 * @brief PressureStream - paired signal/error Queues behind two Channels.
 *
 * Producers push data with SendSignal() and failures with SendError();
 * neither call waits for the consumer. Consumers read Signals() and
 * Errors() independently. The two pipelines share nothing except that
 * Close() shuts both down.
 *
 * Usage:
 *   flux::PressureStream<int, std::string> ps;
 *   ps.SendSignal(7);
 *   ps.SendError("disk full");
 *   auto sig = ps.Signals().Receive();   // 7
 *   auto err = ps.Errors().Receive();    // "disk full"
 *   ps.Close();
 */

#ifndef FLUX_PRESSURE_STREAM_HPP_
#define FLUX_PRESSURE_STREAM_HPP_

#include "flux/channel.hpp"
#include "flux/log.hpp"
#include "flux/queue.hpp"

#include <cstdint>

#include <memory>

namespace flux {

/**
 * @brief Two-level back-pressure stream.
 *
 * @tparam SignalT Data signal type.
 * @tparam ErrorT  Error payload type.
 */
template <typename SignalT, typename ErrorT>
class PressureStream final {
 public:
  /**
   * @brief Stream owning both output channels.
   */
  PressureStream()
      : owned_signals_(std::make_unique<Channel<SignalT>>()),
        owned_errors_(std::make_unique<Channel<ErrorT>>()),
        signals_(*owned_signals_),
        errors_(*owned_errors_),
        signal_queue_(signals_),
        error_queue_(errors_) {}

  /**
   * @brief Stream feeding caller-supplied channels.
   *
   * Both channels must outlive the stream; Close() closes them.
   */
  PressureStream(Channel<SignalT>& signals, Channel<ErrorT>& errors)
      : signals_(signals), errors_(errors), signal_queue_(signals_), error_queue_(errors_) {}

  ~PressureStream() { Close(); }

  PressureStream(const PressureStream&) = delete;
  PressureStream& operator=(const PressureStream&) = delete;
  PressureStream(PressureStream&&) = delete;
  PressureStream& operator=(PressureStream&&) = delete;

  Channel<SignalT>& Signals() noexcept { return signals_; }
  Channel<ErrorT>& Errors() noexcept { return errors_; }

  /// @return false if the stream is already closed.
  bool SendSignal(SignalT signal) { return signal_queue_.Enqueue(std::move(signal)); }

  /// @return false if the stream is already closed.
  bool SendError(ErrorT error) { return error_queue_.Enqueue(std::move(error)); }

  uint32_t RemainingSignals() const { return signal_queue_.Length(); }
  uint32_t RemainingErrors() const { return error_queue_.Length(); }

  /**
   * @brief Close both queues (and so both channels). Idempotent.
   *
   * Undelivered signals and errors are discarded.
   */
  void Close() {
    const uint32_t signals = signal_queue_.Length();
    const uint32_t errors = error_queue_.Length();
    if (signals > 0U || errors > 0U) {
      FLUX_LOG_DEBUG("Stream", "closing with %u signal(s) and %u error(s) pending", signals,
                     errors);
    }
    signal_queue_.Close();
    error_queue_.Close();
  }

 private:
  std::unique_ptr<Channel<SignalT>> owned_signals_;
  std::unique_ptr<Channel<ErrorT>> owned_errors_;
  Channel<SignalT>& signals_;
  Channel<ErrorT>& errors_;
  Queue<SignalT> signal_queue_;
  Queue<ErrorT> error_queue_;
};

}  // namespace flux

#endif  // FLUX_PRESSURE_STREAM_HPP_
