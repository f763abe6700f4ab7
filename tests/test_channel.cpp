/**
 * @file test_channel.cpp
 * @brief Catch2 tests for flux::Channel.
 */

#include "flux/channel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("Channel Send blocks until Receive takes the value", "[channel]") {
  flux::Channel<int> ch;
  std::atomic<bool> sent{false};

  std::thread sender([&] { sent.store(ch.Send(42)); });

  std::this_thread::sleep_for(20ms);
  REQUIRE_FALSE(sent.load());

  auto r = ch.Receive();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 42);
  sender.join();
  REQUIRE(sent.load());
}

TEST_CASE("Channel TrySend needs a waiting receiver", "[channel]") {
  flux::Channel<int> ch;
  REQUIRE_FALSE(ch.TrySend(1));

  std::atomic<int> got{-1};
  std::thread receiver([&] {
    auto r = ch.Receive();
    got.store(r.has_value() ? r.value() : -2);
  });

  while (ch.WaitingReceivers() == 0U) std::this_thread::yield();
  REQUIRE(ch.TrySend(7));
  receiver.join();
  REQUIRE(got.load() == 7);
}

TEST_CASE("Channel ReceiveFor times out with kQueueEmpty", "[channel]") {
  flux::Channel<int> ch;
  auto r = ch.ReceiveFor(10ms);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == flux::QueueError::kQueueEmpty);
  REQUIRE(ch.WaitingReceivers() == 0U);
}

TEST_CASE("Channel Close wakes receivers and rejects senders", "[channel]") {
  flux::Channel<int> ch;

  std::atomic<bool> closed_seen{false};
  std::thread receiver([&] {
    auto r = ch.Receive();
    closed_seen.store(!r.has_value() && r.get_error() == flux::QueueError::kClosed);
  });

  while (ch.WaitingReceivers() == 0U) std::this_thread::yield();
  ch.Close();
  receiver.join();
  REQUIRE(closed_seen.load());

  REQUIRE(ch.IsClosed());
  REQUIRE_FALSE(ch.Send(1));
  REQUIRE_FALSE(ch.TrySend(1));
  ch.Close();
}

TEST_CASE("Channel Close withdraws an untaken Send", "[channel]") {
  flux::Channel<int> ch;
  std::atomic<int> result{-1};

  std::thread sender([&] { result.store(ch.Send(5) ? 1 : 0); });
  std::this_thread::sleep_for(10ms);
  ch.Close();
  sender.join();

  REQUIRE(result.load() == 0);
  REQUIRE(ch.Receive().get_error() == flux::QueueError::kClosed);
}

namespace {

struct HookCounter {
  std::atomic<int> fired{0};
};

void CountHook(void* context) noexcept {
  static_cast<HookCounter*>(context)->fired.fetch_add(1);
}

}  // namespace

TEST_CASE("Channel ready hook fires on wait and on take", "[channel]") {
  flux::Channel<int> ch;
  HookCounter counter;
  ch.SetReadyHook(&CountHook, &counter);

  REQUIRE(ch.ReceiveFor(1ms).get_error() == flux::QueueError::kQueueEmpty);
  REQUIRE(counter.fired.load() == 1);

  std::atomic<bool> sent{false};
  std::thread sender([&] { sent.store(ch.Send(3)); });
  REQUIRE(ch.Receive().value() == 3);
  sender.join();
  REQUIRE(sent.load());
  // One for starting to wait, one for taking.
  REQUIRE(counter.fired.load() == 3);

  ch.SetReadyHook(nullptr, nullptr);
  REQUIRE(ch.ReceiveFor(1ms).get_error() == flux::QueueError::kQueueEmpty);
  REQUIRE(counter.fired.load() == 3);
}
