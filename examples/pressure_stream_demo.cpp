// Copyright (c) 2024 liudegui. MIT License.
//
// pressure_stream_demo.cpp -- PressureStream demo.
//
// Demonstrates:
//   1. A fast producer decoupled from a slow consumer
//   2. Signal and error lanes consumed independently
//   3. Close while items are still buffered

#include "flux/log.hpp"
#include "flux/platform.hpp"
#include "flux/pressure_stream.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <thread>

using namespace std::chrono_literals;

struct Sample {
  uint32_t seq;
  uint32_t value;
};

struct Fault {
  uint32_t seq;
  uint32_t code;
};

using SampleStream = flux::PressureStream<Sample, Fault>;

// ============================================================================
// Demo 1: Fast producer, slow consumer
// ============================================================================

static void DemoBackpressure() {
  printf("\n=== Demo 1: Fast Producer, Slow Consumer ===\n");
  SampleStream stream;
  constexpr uint32_t kCount = 2000;

  const uint64_t t0 = flux::SteadyNowUs();
  for (uint32_t i = 0; i < kCount; ++i) {
    if (!stream.SendSignal(Sample{i, i * 3U})) {
      printf("  stream closed at %u\n", i);
      return;
    }
  }
  const uint64_t t1 = flux::SteadyNowUs();
  printf("  produced %u samples in %" PRIu64 " us, %u buffered\n", kCount, t1 - t0,
         stream.RemainingSignals());

  uint32_t in_order = 0;
  for (uint32_t i = 0; i < kCount; ++i) {
    auto r = stream.Signals().Receive();
    if (!r) break;
    if (r.value().seq == i) ++in_order;
    if ((i % 500U) == 0U) std::this_thread::sleep_for(1ms);
  }
  printf("  consumed %u/%u in order\n", in_order, kCount);
}

// ============================================================================
// Demo 2: Separate lanes
// ============================================================================

static void DemoLanes() {
  printf("\n=== Demo 2: Signal And Error Lanes ===\n");
  SampleStream stream;
  std::atomic<uint32_t> faults{0};

  std::thread fault_reader([&] {
    for (;;) {
      auto r = stream.Errors().Receive();
      if (!r) break;
      faults.fetch_add(1, std::memory_order_relaxed);
    }
  });

  uint32_t samples = 0;
  std::thread producer([&] {
    for (uint32_t i = 0; i < 1000; ++i) {
      if ((i % 10U) == 0U) {
        (void)stream.SendError(Fault{i, 0xE1U});
      } else {
        (void)stream.SendSignal(Sample{i, i});
      }
    }
  });

  while (samples < 900U) {
    auto r = stream.Signals().Receive();
    if (!r) break;
    ++samples;
  }
  producer.join();
  while (faults.load(std::memory_order_relaxed) < 100U) std::this_thread::sleep_for(1ms);

  stream.Close();
  fault_reader.join();
  printf("  samples=%u faults=%u\n", samples, faults.load());
}

// ============================================================================
// Demo 3: Close with pending items
// ============================================================================

static void DemoClose() {
  printf("\n=== Demo 3: Close With Pending Items ===\n");
  SampleStream stream;
  for (uint32_t i = 0; i < 500; ++i) (void)stream.SendSignal(Sample{i, 0});
  printf("  buffered before close: %u\n", stream.RemainingSignals());

  const uint64_t t0 = flux::SteadyNowUs();
  stream.Close();
  const uint64_t t1 = flux::SteadyNowUs();
  printf("  close took %" PRIu64 " us, send after close: %s\n", t1 - t0,
         stream.SendSignal(Sample{0, 0}) ? "accepted" : "rejected");
}

int main() {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  flux::log::Init();

  printf("PressureStream Demo\n");
  printf("===================\n");

  DemoBackpressure();
  DemoLanes();
  DemoClose();

  printf("\nAll demos completed.\n");
  flux::log::Shutdown();
  return 0;
}
