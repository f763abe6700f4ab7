// Copyright (c) 2024 liudegui. MIT License.
//
// work_pool_demo.cpp -- WorkPool demo.
//
// Demonstrates:
//   1. Bulk submission with autoscaling
//   2. DoWait admission timeout on a saturated pool
//   3. Failure containment (error results and exceptions)
//   4. Manual Add / Reset and periodic metrics
//   5. Pool sizing from an INI file (when inih is available)

#include "flux/config.hpp"
#include "flux/log.hpp"
#include "flux/platform.hpp"
#include "flux/work_pool.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

static void PrintStat(const flux::PoolStat& s) {
  printf("  workers=%" PRId64 " [%" PRId64 "..%" PRId64 "] executed=%" PRId64
         " active=%" PRId64 " pending=%" PRId64 " failed=%" PRId64 "\n",
         s.workers, s.min_workers, s.max_workers, s.executed, s.active, s.pending, s.failed);
}

// ============================================================================
// Work types
// ============================================================================

struct ChecksumWork final : public flux::Work {
  std::atomic<uint64_t> total{0};

  flux::WorkResult Run(void* context, int32_t /*worker_id*/) override {
    const auto rounds = static_cast<uint32_t>(reinterpret_cast<uintptr_t>(context));
    volatile uint64_t sum = 0;
    for (uint32_t i = 0; i < rounds; ++i) sum += i;
    total.fetch_add(sum, std::memory_order_relaxed);
    std::this_thread::sleep_for(200us);
    return flux::WorkResult::success();
  }
};

struct SleepWork final : public flux::Work {
  flux::WorkResult Run(void* context, int32_t /*worker_id*/) override {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(reinterpret_cast<uintptr_t>(context)));
    return flux::WorkResult::success();
  }
};

static flux::WorkResult RejectOdd(void* context, int32_t worker_id) {
  const auto n = reinterpret_cast<uintptr_t>(context);
  if ((n % 2U) != 0U) {
    FLUX_LOG_WARN("Demo", "worker #%d rejects item %zu", worker_id, static_cast<size_t>(n));
    return flux::WorkResult::error(flux::WorkError::kFailed);
  }
  return flux::WorkResult::success();
}

struct ThrowWork final : public flux::Work {
  flux::WorkResult Run(void* /*context*/, int32_t /*worker_id*/) override {
    throw std::logic_error("corrupt record");
  }
};

// ============================================================================
// Demo 1: Bulk submission
// ============================================================================

static void DemoBulk() {
  printf("\n=== Demo 1: Bulk Submission ===\n");
  flux::PoolConfig cfg;
  cfg.min_workers = 4;
  cfg.max_workers = 100;

  ChecksumWork work;
  auto created = flux::WorkPool::Create("bulk", cfg);
  if (!created) {
    printf("  create failed: %u\n", static_cast<unsigned>(created.get_error()));
    return;
  }
  auto pool = std::move(created).value();

  uint32_t peak = 0;
  const uint64_t t0 = flux::SteadyNowUs();
  for (uint32_t i = 0; i < 10000; ++i) {
    auto r = pool->Do(reinterpret_cast<void*>(static_cast<uintptr_t>(i % 512U)), work);
    if (!r) printf("  Do failed: %u\n", static_cast<unsigned>(r.get_error()));
    const auto w = static_cast<uint32_t>(pool->Stat().workers);
    if (w > peak) peak = w;
  }
  pool->Shutdown();
  const uint64_t t1 = flux::SteadyNowUs();

  printf("  10000 tasks in %" PRIu64 " us, peak workers %u\n", t1 - t0, peak);
  PrintStat(pool->Stat());
}

// ============================================================================
// Demo 2: DoWait admission timeout
// ============================================================================

static void DemoDoWait() {
  printf("\n=== Demo 2: DoWait Timeout ===\n");
  flux::PoolConfig cfg;
  cfg.min_workers = 1;
  cfg.max_workers = 1;
  SleepWork slow;  // must outlive every task handed to the pool
  auto pool = std::move(flux::WorkPool::Create("single", cfg)).value();

  (void)pool->Do(reinterpret_cast<void*>(static_cast<uintptr_t>(100U)), slow);

  auto r = pool->DoWait(reinterpret_cast<void*>(static_cast<uintptr_t>(1U)), slow, 10ms);
  printf("  DoWait(10ms) while busy: %s\n",
         (!r && r.get_error() == flux::PoolError::kWorkRequestDenied) ? "denied" : "accepted");

  r = pool->DoWait(reinterpret_cast<void*>(static_cast<uintptr_t>(1U)), slow, 500ms);
  printf("  DoWait(500ms) while busy: %s\n", r ? "accepted" : "denied");
  pool->Shutdown();
}

// ============================================================================
// Demo 3: Failure containment
// ============================================================================

static void DemoFailures() {
  printf("\n=== Demo 3: Failure Containment ===\n");
  flux::PoolConfig cfg;
  cfg.min_workers = 2;
  cfg.max_workers = 4;
  flux::FunctionWork reject(&RejectOdd);
  ThrowWork thrower;
  auto pool = std::move(flux::WorkPool::Create("guarded", cfg)).value();

  for (uintptr_t i = 0; i < 6U; ++i) {
    (void)pool->Do(reinterpret_cast<void*>(i), reject);
  }
  (void)pool->Do(nullptr, thrower);
  pool->Shutdown();
  PrintStat(pool->Stat());
}

// ============================================================================
// Demo 4: Manual scaling and metrics
// ============================================================================

static void OnMetric(const flux::PoolStat& s, void* /*context*/) {
  printf("  [metric]");
  PrintStat(s);
}

static void DemoScaling() {
  printf("\n=== Demo 4: Add / Reset / Metrics ===\n");
  flux::PoolConfig cfg;
  cfg.min_workers = 2;
  cfg.max_workers = 16;
  cfg.metric_interval_ms = 1000U;
  cfg.metric_handler = &OnMetric;
  auto pool = std::move(flux::WorkPool::Create("manual", cfg)).value();

  (void)pool->Add(10);
  std::this_thread::sleep_for(50ms);
  printf("  after Add(10):");
  PrintStat(pool->Stat());

  (void)pool->Reset(4);
  std::this_thread::sleep_for(50ms);
  printf("  after Reset(4):");
  PrintStat(pool->Stat());

  std::this_thread::sleep_for(1200ms);
  pool->Shutdown();
}

// ============================================================================
// Demo 5: Config file
// ============================================================================

static void DemoConfig(const char* path) {
  printf("\n=== Demo 5: Pool From Config ===\n");
  flux::IniConfig ini;
  auto loaded = ini.LoadFile(path);
  if (!loaded) {
    printf("  %s not loaded (error %u)\n", path, static_cast<unsigned>(loaded.get_error()));
    return;
  }
  auto pool_cfg = flux::LoadPoolConfig(ini, "pool");
  if (!pool_cfg) {
    printf("  [pool] invalid (error %u)\n", static_cast<unsigned>(pool_cfg.get_error()));
    return;
  }
  auto pool = flux::WorkPool::Create("configured", pool_cfg.value());
  if (!pool) {
    printf("  create failed (error %u)\n", static_cast<unsigned>(pool.get_error()));
    return;
  }
  PrintStat(pool.value()->Stat());
}

int main(int argc, char* argv[]) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  flux::log::Init();
  flux::log::SetLevel(flux::log::Level::kInfo);

  printf("WorkPool Demo\n");
  printf("=============\n");

  DemoBulk();
  DemoDoWait();
  DemoFailures();
  DemoScaling();
  DemoConfig((argc > 1) ? argv[1] : "pool.ini");

  printf("\nAll demos completed.\n");
  flux::log::Shutdown();
  return 0;
}
