/**
 * @file test_pressure_stream.cpp
 * @brief Catch2 tests for flux::PressureStream.
 */

#include "flux/pressure_stream.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

struct Reading {
  uint32_t seq;
  uint32_t reserved = 0;
};

}  // namespace

TEST_CASE("PressureStream delivers 10000 signals in order", "[pressure_stream]") {
  flux::PressureStream<Reading, std::string> stream;
  constexpr uint32_t kCount = 10000;

  std::atomic<uint32_t> sent{0};
  std::thread producer([&] {
    for (uint32_t i = 0; i < kCount; ++i) {
      if (stream.SendSignal(Reading{i})) sent.fetch_add(1);
    }
  });

  for (uint32_t i = 0; i < kCount; ++i) {
    auto r = stream.Signals().Receive();
    REQUIRE(r.has_value());
    REQUIRE(r.value().seq == i);
  }
  producer.join();
  REQUIRE(sent.load() == kCount);
  stream.Close();
}

TEST_CASE("PressureStream absorbs bursts with no consumer", "[pressure_stream]") {
  flux::PressureStream<int, int> stream;
  constexpr int kCount = 10000;

  for (int i = 0; i < kCount; ++i) REQUIRE(stream.SendSignal(i));
  for (int i = 0; i < kCount; ++i) REQUIRE(stream.SendError(-i));

  REQUIRE(stream.RemainingSignals() == static_cast<uint32_t>(kCount));
  REQUIRE(stream.RemainingErrors() == static_cast<uint32_t>(kCount));

  REQUIRE(stream.Signals().Receive().value() == 0);
  REQUIRE(stream.Errors().Receive().value() == 0);
  REQUIRE(stream.Errors().Receive().value() == -1);
}

TEST_CASE("PressureStream keeps signals and errors apart", "[pressure_stream]") {
  flux::PressureStream<int, std::string> stream;
  REQUIRE(stream.SendSignal(1));
  REQUIRE(stream.SendError("disk full"));
  REQUIRE(stream.SendSignal(2));

  REQUIRE(stream.Errors().Receive().value() == "disk full");
  REQUIRE(stream.Signals().Receive().value() == 1);
  REQUIRE(stream.Signals().Receive().value() == 2);
  REQUIRE(stream.Errors().ReceiveFor(5ms).get_error() == flux::QueueError::kQueueEmpty);
}

TEST_CASE("PressureStream Close closes both channels", "[pressure_stream]") {
  flux::PressureStream<int, int> stream;
  for (int i = 0; i < 100; ++i) REQUIRE(stream.SendSignal(i));

  stream.Close();
  REQUIRE(stream.Signals().IsClosed());
  REQUIRE(stream.Errors().IsClosed());
  REQUIRE_FALSE(stream.SendSignal(1));
  REQUIRE_FALSE(stream.SendError(1));
  REQUIRE(stream.Signals().Receive().get_error() == flux::QueueError::kClosed);
  stream.Close();
}

TEST_CASE("PressureStream feeds caller-owned channels", "[pressure_stream]") {
  flux::Channel<int> signals;
  flux::Channel<int> errors;
  {
    flux::PressureStream<int, int> stream(signals, errors);
    REQUIRE(stream.SendSignal(11));
    REQUIRE(&stream.Signals() == &signals);
    REQUIRE(signals.Receive().value() == 11);
  }
  REQUIRE(signals.IsClosed());
  REQUIRE(errors.IsClosed());
}
