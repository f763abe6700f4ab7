/**
 * @file test_queue.cpp
 * @brief Catch2 tests for flux::Queue.
 */

#include "flux/queue.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("Queue Enqueue never waits for a consumer", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);

  for (int i = 0; i < 1000; ++i) {
    REQUIRE(q.Enqueue(i));
  }
  REQUIRE(q.Length() == 1000U);
  q.Close();
}

TEST_CASE("Queue delivers in FIFO order", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);
  constexpr int kCount = 5000;

  for (int i = 0; i < kCount; ++i) REQUIRE(q.Enqueue(i));

  for (int i = 0; i < kCount; ++i) {
    auto r = out.Receive();
    REQUIRE(r.has_value());
    REQUIRE(r.value() == i);
  }
}

TEST_CASE("Queue keeps order with producer and consumer interleaved", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);
  constexpr int kCount = 10000;

  std::atomic<int> accepted{0};
  std::thread producer([&] {
    for (int i = 0; i < kCount; ++i) {
      if (q.Enqueue(i)) accepted.fetch_add(1);
    }
  });

  int expected = 0;
  while (expected < kCount) {
    auto r = out.Receive();
    REQUIRE(r.has_value());
    REQUIRE(r.value() == expected);
    ++expected;
  }
  producer.join();
  REQUIRE(accepted.load() == kCount);
}

TEST_CASE("Queue serves several producers without loss", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);
  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;

  std::atomic<int> accepted{0};
  std::vector<std::thread> producers;
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([&q, &accepted, t] {
      for (int i = 0; i < kPerThread; ++i) {
        if (q.Enqueue(t * kPerThread + i)) accepted.fetch_add(1);
      }
    });
  }

  std::vector<int> last(kThreads, -1);
  for (int n = 0; n < kThreads * kPerThread; ++n) {
    auto r = out.Receive();
    REQUIRE(r.has_value());
    const int producer = r.value() / kPerThread;
    REQUIRE(r.value() > last[producer]);
    last[producer] = r.value();
  }
  for (auto& th : producers) th.join();
  REQUIRE(accepted.load() == kThreads * kPerThread);
}

TEST_CASE("Queue Close returns promptly and closes the output", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);
  for (int i = 0; i < 100; ++i) REQUIRE(q.Enqueue(i));

  const auto start = std::chrono::steady_clock::now();
  q.Close();
  REQUIRE(std::chrono::steady_clock::now() - start < 1s);

  REQUIRE(out.IsClosed());
  REQUIRE(q.Length() == 0U);
  REQUIRE_FALSE(q.Enqueue(1));
  REQUIRE(out.Receive().get_error() == flux::QueueError::kClosed);
  q.Close();
}

TEST_CASE("Queue Close wakes a blocked consumer", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);
  std::atomic<bool> woke{false};

  std::thread consumer([&] {
    auto r = out.Receive();
    woke.store(!r.has_value());
  });

  while (out.WaitingReceivers() == 0U) std::this_thread::yield();
  q.Close();
  consumer.join();
  REQUIRE(woke.load());
}

TEST_CASE("Queue hands over to a consumer that was already waiting", "[queue]") {
  flux::Channel<int> out;
  flux::Queue<int> q(out);

  std::atomic<int> got{-1};
  std::thread consumer([&] {
    auto r = out.ReceiveFor(2s);
    got.store(r.has_value() ? r.value() : -2);
  });

  while (out.WaitingReceivers() == 0U) std::this_thread::yield();
  std::this_thread::sleep_for(5ms);
  REQUIRE(q.Enqueue(99));
  consumer.join();
  REQUIRE(got.load() == 99);
}
