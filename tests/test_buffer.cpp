/**
 * @file test_buffer.cpp
 * @brief Catch2 tests for flux::Buffer.
 */

#include "flux/buffer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

TEST_CASE("Buffer dequeue on empty reports kBufferEmpty", "[buffer]") {
  flux::Buffer<int> buf;
  auto r = buf.Dequeue();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == flux::QueueError::kBufferEmpty);
  REQUIRE(buf.Peek().get_error() == flux::QueueError::kBufferEmpty);
  REQUIRE(buf.Length() == 0U);
}

TEST_CASE("Buffer preserves FIFO order", "[buffer]") {
  flux::Buffer<std::string> buf;
  buf.Enqueue("alpha");
  buf.Enqueue(std::string("beta"));
  buf.Enqueue("gamma");
  REQUIRE(buf.Length() == 3U);

  REQUIRE(buf.Peek().value() == "alpha");
  REQUIRE(buf.Length() == 3U);

  REQUIRE(buf.Dequeue().value() == "alpha");
  REQUIRE(buf.Dequeue().value() == "beta");
  REQUIRE(buf.Dequeue().value() == "gamma");
  REQUIRE(buf.Length() == 0U);
}

TEST_CASE("Buffer Clear drops everything", "[buffer]") {
  flux::Buffer<int> buf;
  for (int i = 0; i < 10; ++i) buf.Enqueue(i);
  buf.Clear();
  REQUIRE(buf.Length() == 0U);
  REQUIRE_FALSE(buf.Dequeue().has_value());
}

TEST_CASE("Buffer concurrent producers lose nothing", "[buffer]") {
  flux::Buffer<int> buf;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 2500;

  std::vector<std::thread> producers;
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([&buf, t] {
      for (int i = 0; i < kPerThread; ++i) buf.Enqueue(t * kPerThread + i);
    });
  }
  for (auto& th : producers) th.join();

  REQUIRE(buf.Length() == static_cast<uint32_t>(kThreads * kPerThread));

  std::vector<int> last(kThreads, -1);
  int count = 0;
  for (auto r = buf.Dequeue(); r.has_value(); r = buf.Dequeue()) {
    const int producer = r.value() / kPerThread;
    // Per-producer order survives interleaving.
    REQUIRE(r.value() > last[producer]);
    last[producer] = r.value();
    ++count;
  }
  REQUIRE(count == kThreads * kPerThread);
}
