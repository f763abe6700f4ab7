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
 * @file work_pool.hpp
 * @brief WorkPool - self-scaling pool of worker threads.
 *
 * Architecture:
 *   Do()/DoWait() --offer--> [idle worker takes it] --> Work::Run()
 *        |
 *   MeasureHealth() --Add()--> commands --> ManagerThread
 *                                             |-- spawn worker (<= max)
 *                                             |-- kill token   (>= min)
 *                                             |-- metric tick
 *
 * A submission is a hand-off: Do() blocks until an idle worker has accepted
 * the task, then returns while the task runs. DoWait() gives up after its
 * timeout with PoolError::kWorkRequestDenied.
 *
 * Worker count changes are requested through Add()/Reset() and carried out
 * by the manager thread alone, which is what keeps the count inside
 * [min_workers, max_workers]. Every submission first runs the Autoscaler
 * heuristic, so the pool grows under saturation and drops back to
 * min_workers when fully idle.
 *
 * Failures raised by a task (error result or exception) are contained by
 * RecoveryHandler() and counted in PoolStat::failed; the worker keeps
 * serving.
 *
 * Shutdown() rejects queued submissions, lets running tasks finish, and
 * joins every thread. Afterwards Stat().workers == 0.
 */

#ifndef FLUX_WORK_POOL_HPP_
#define FLUX_WORK_POOL_HPP_

#include "flux/autoscaler.hpp"
#include "flux/log.hpp"
#include "flux/platform.hpp"
#include "flux/recovery.hpp"
#include "flux/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace flux {

// ============================================================================
// Error / Work types
// ============================================================================

enum class PoolError : uint8_t {
  kInvalidMinWorkers = 0,
  kInvalidMaxWorkers,
  kInvalidAddRequest,
  kWorkRequestDenied,
  kShutdown,
};

/**
 * @brief Unit of work executed by a WorkPool worker.
 *
 * @p context is the pointer given to Do()/DoWait(); @p worker_id
 * identifies the executing worker (ids start at 1).
 */
class Work {
 public:
  virtual ~Work() = default;
  virtual WorkResult Run(void* context, int32_t worker_id) = 0;
};

/// Plain function usable as Work through FunctionWork.
using WorkFn = WorkResult (*)(void* context, int32_t worker_id);

/**
 * @brief Work adapter around a free function.
 */
class FunctionWork final : public Work {
 public:
  explicit FunctionWork(WorkFn fn) noexcept : fn_(fn) {}

  WorkResult Run(void* context, int32_t worker_id) override {
    return fn_(context, worker_id);
  }

 private:
  WorkFn fn_;
};

/// A submitted task. Both pointers are borrowed from the submitter.
struct DoWork {
  void* context{nullptr};
  Work* work{nullptr};
};

// ============================================================================
// Stats / Config
// ============================================================================

/// Snapshot of pool counters.
struct PoolStat {
  uint64_t stamp_us{0};  ///< Wall clock of the snapshot.
  int64_t max_workers{0};
  int64_t min_workers{0};
  int64_t workers{0};   ///< Live worker threads.
  int64_t executed{0};  ///< Tasks finished, failed ones included.
  int64_t pending{0};   ///< Submitters waiting for a worker.
  int64_t active{0};    ///< Tasks currently running.
  int64_t failed{0};    ///< Tasks that returned an error or threw.
};

/// Returns the next metric interval in milliseconds (0 disables).
using MetricIntervalFn = uint32_t (*)(void* context);
using MetricHandlerFn = void (*)(const PoolStat& stat, void* context);

static constexpr uint32_t kMinMetricIntervalMs = 1000U;
static constexpr uint32_t kPoolNameCapacity = 32U;

struct PoolConfig {
  int64_t max_workers{1};
  int64_t min_workers{1};
  MetricIntervalFn metric_interval{nullptr};  ///< Overrides metric_interval_ms.
  uint32_t metric_interval_ms{0U};            ///< 0 disables metrics.
  MetricHandlerFn metric_handler{nullptr};
  void* metric_context{nullptr};
};

// ============================================================================
// WorkPool
// ============================================================================

class WorkPool final {
 public:
  /**
   * @brief Validate @p cfg and start a pool with min_workers workers.
   *
   * @return The pool, or kInvalidMinWorkers (min < 1) /
   *         kInvalidMaxWorkers (max < min).
   */
  static expected<std::unique_ptr<WorkPool>, PoolError> Create(const char* name,
                                                               const PoolConfig& cfg) {
    if (cfg.min_workers < 1) {
      FLUX_LOG_ERROR("WorkPool", "%s: min_workers %" PRId64 " must be >= 1",
                     (name != nullptr) ? name : "", cfg.min_workers);
      return expected<std::unique_ptr<WorkPool>, PoolError>::error(PoolError::kInvalidMinWorkers);
    }
    if (cfg.max_workers < cfg.min_workers) {
      FLUX_LOG_ERROR("WorkPool", "%s: max_workers %" PRId64 " below min_workers %" PRId64,
                     (name != nullptr) ? name : "", cfg.max_workers, cfg.min_workers);
      return expected<std::unique_ptr<WorkPool>, PoolError>::error(PoolError::kInvalidMaxWorkers);
    }

    std::unique_ptr<WorkPool> pool(new WorkPool(name, cfg));
    pool->Start();
    return expected<std::unique_ptr<WorkPool>, PoolError>::success(std::move(pool));
  }

  ~WorkPool() { Shutdown(); }

  WorkPool(const WorkPool&) = delete;
  WorkPool& operator=(const WorkPool&) = delete;
  WorkPool(WorkPool&&) = delete;
  WorkPool& operator=(WorkPool&&) = delete;

  /**
   * @brief Hand @p work to a worker, blocking until one accepts it.
   *
   * Returns before the task runs: @p work (and @p context) must stay alive
   * until the task finishes, e.g. until Shutdown() returns.
   *
   * @return success once accepted, kShutdown if the pool is (or becomes)
   *         shut down before acceptance.
   */
  expected<void, PoolError> Do(void* context, Work& work) {
    return Submit(context, work, nullptr);
  }

  /**
   * @brief Like Do(), but give up after @p timeout.
   *
   * Once accepted, @p work must outlive the task exactly as for Do().
   *
   * @return kWorkRequestDenied if no worker accepted in time.
   */
  template <typename Rep, typename Period>
  expected<void, PoolError> DoWait(void* context, Work& work,
                                   std::chrono::duration<Rep, Period> timeout) {
    const std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);
    return Submit(context, work, &deadline);
  }

  /**
   * @brief Request |delta| workers more (delta > 0) or fewer (delta < 0).
   *
   * Requests past max_workers / below min_workers are dropped by the
   * manager. Returns kInvalidAddRequest for 0, kShutdown after Shutdown().
   */
  expected<void, PoolError> Add(int64_t delta) {
    if (delta == 0) {
      return expected<void, PoolError>::error(PoolError::kInvalidAddRequest);
    }

    const Command cmd = (delta > 0) ? Command::kAddWorker : Command::kRemoveWorker;
    int64_t count = (delta > 0) ? delta : -delta;
    if (count > cfg_.max_workers) {
      count = cfg_.max_workers;
    }

    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (shutdown_) {
        return expected<void, PoolError>::error(PoolError::kShutdown);
      }
      update_pending_.fetch_add(count, std::memory_order_acq_rel);
      commands_.insert(commands_.end(), static_cast<size_t>(count), cmd);
    }
    manager_cv_.notify_one();
    return expected<void, PoolError>::success();
  }

  /**
   * @brief Request scaling towards @p target workers (negative means 0).
   *
   * The result is still bounded by [min_workers, max_workers].
   */
  expected<void, PoolError> Reset(int64_t target) {
    if (target < 0) {
      target = 0;
    }
    const int64_t delta = target - current_workers_.load(std::memory_order_acquire);
    if (delta == 0) {
      return expected<void, PoolError>::success();
    }
    return Add(delta);
  }

  PoolStat Stat() const noexcept {
    PoolStat s;
    s.stamp_us = WallNowUs();
    s.max_workers = cfg_.max_workers;
    s.min_workers = cfg_.min_workers;
    s.workers = current_workers_.load(std::memory_order_acquire);
    s.executed = executed_work_.load(std::memory_order_acquire);
    s.pending = pending_work_.load(std::memory_order_acquire);
    s.active = active_work_.load(std::memory_order_acquire);
    s.failed = failed_work_.load(std::memory_order_acquire);
    return s;
  }

  const char* Name() const noexcept { return name_.c_str(); }

  /**
   * @brief Stop the pool and join every thread. Idempotent.
   *
   * Concurrent callers all return only after the join has finished.
   * Must not be called from inside a task.
   */
  void Shutdown() {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      if (shutdown_) {
        stopped_cv_.wait(lock, [this] { return stopped_; });
        return;
      }
      shutdown_ = true;
      for (Offer* offer : offers_) {
        offer->state = OfferState::kRejected;
        offer->cv.notify_one();
      }
      offers_.clear();
      commands_.clear();
    }
    manager_cv_.notify_all();
    if (manager_.joinable()) {
      manager_.join();
    }

    std::vector<std::thread> remaining;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      remaining.reserve(workers_.size());
      for (auto& kv : workers_) {
        remaining.push_back(std::move(kv.second));
      }
      workers_.clear();
      exited_.clear();
    }
    for (std::thread& t : remaining) {
      if (t.joinable()) {
        t.join();
      }
    }
    {
      std::lock_guard<std::mutex> lock(mtx_);
      stopped_ = true;
    }
    stopped_cv_.notify_all();

    FLUX_LOG_INFO("WorkPool", "%s: shut down, executed=%" PRId64 " failed=%" PRId64,
                  name_.c_str(), executed_work_.load(std::memory_order_acquire),
                  failed_work_.load(std::memory_order_acquire));
  }

 private:
  enum class Command : uint8_t { kAddWorker = 0, kRemoveWorker };
  enum class OfferState : uint8_t { kWaiting = 0, kAccepted, kRejected };

  /// Lives on the submitter's stack until it is accepted or rejected.
  struct Offer {
    DoWork task;
    OfferState state{OfferState::kWaiting};
    std::condition_variable cv;
  };

  WorkPool(const char* name, const PoolConfig& cfg)
      : name_(TruncateToCapacity, name), cfg_(cfg) {}

  void Start() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      for (int64_t i = 0; i < cfg_.min_workers; ++i) {
        SpawnWorkerLocked();
      }
    }
    manager_ = std::thread([this] { ManagerLoop(); });
    FLUX_LOG_INFO("WorkPool", "%s: started, min=%" PRId64 " max=%" PRId64, name_.c_str(),
                  cfg_.min_workers, cfg_.max_workers);
  }

  expected<void, PoolError> Submit(void* context, Work& work,
                                   const std::chrono::steady_clock::time_point* deadline) {
    MeasureHealth();
    pending_work_.fetch_add(1, std::memory_order_acq_rel);

    Offer offer;
    offer.task.context = context;
    offer.task.work = &work;

    std::unique_lock<std::mutex> lock(mtx_);
    if (shutdown_) {
      pending_work_.fetch_sub(1, std::memory_order_acq_rel);
      return expected<void, PoolError>::error(PoolError::kShutdown);
    }
    offers_.push_back(&offer);
    worker_cv_.notify_one();

    auto settled = [&offer] { return offer.state != OfferState::kWaiting; };
    if (deadline == nullptr) {
      offer.cv.wait(lock, settled);
    } else if (!offer.cv.wait_until(lock, *deadline, settled)) {
      auto it = std::find(offers_.begin(), offers_.end(), &offer);
      if (it != offers_.end()) {
        offers_.erase(it);
      }
      pending_work_.fetch_sub(1, std::memory_order_acq_rel);
      FLUX_LOG_DEBUG("WorkPool", "%s: work request denied after timeout", name_.c_str());
      return expected<void, PoolError>::error(PoolError::kWorkRequestDenied);
    }

    pending_work_.fetch_sub(1, std::memory_order_acq_rel);
    if (offer.state == OfferState::kRejected) {
      return expected<void, PoolError>::error(PoolError::kShutdown);
    }
    return expected<void, PoolError>::success();
  }

  /// Runs the Autoscaler unless a previous request is still in flight.
  void MeasureHealth() {
    if (update_pending_.load(std::memory_order_acquire) != 0) {
      return;
    }
    std::lock_guard<std::mutex> guard(health_mtx_);

    Autoscaler scaler;
    scaler.min_workers = cfg_.min_workers;
    scaler.max_workers = cfg_.max_workers;
    scaler.current_workers = current_workers_.load(std::memory_order_acquire);
    scaler.change_pending = update_pending_.load(std::memory_order_acquire) != 0;

    const int64_t delta = scaler.Evaluate(active_work_.load(std::memory_order_acquire),
                                          pending_work_.load(std::memory_order_acquire));
    if (delta == 0) {
      return;
    }
    auto r = Add(delta);
    if (!r) {
      FLUX_LOG_DEBUG("WorkPool", "%s: scaling by %" PRId64 " skipped (error %u)",
                     name_.c_str(), delta, static_cast<unsigned>(r.get_error()));
    }
  }

  void SpawnWorkerLocked() {
    const int32_t id = ++next_worker_id_;
    current_workers_.fetch_add(1, std::memory_order_acq_rel);
    workers_.emplace(id, std::thread([this, id] { WorkerLoop(id); }));
  }

  void WorkerLoop(int32_t id) {
    FLUX_LOG_DEBUG("WorkPool", "%s: worker #%d started", name_.c_str(), id);
    for (;;) {
      std::unique_lock<std::mutex> lock(mtx_);
      worker_cv_.wait(lock, [this] { return !offers_.empty() || kill_tokens_ > 0U; });

      // Tasks before kill tokens: accepted work is never dropped.
      if (!offers_.empty()) {
        Offer* offer = offers_.front();
        offers_.pop_front();
        const DoWork task = offer->task;
        offer->state = OfferState::kAccepted;
        offer->cv.notify_one();
        active_work_.fetch_add(1, std::memory_order_acq_rel);
        lock.unlock();

        Execute(id, task);
        executed_work_.fetch_add(1, std::memory_order_acq_rel);
        active_work_.fetch_sub(1, std::memory_order_acq_rel);
        continue;
      }

      --kill_tokens_;
      current_workers_.fetch_sub(1, std::memory_order_acq_rel);
      exited_.push_back(id);
      update_pending_.fetch_sub(1, std::memory_order_acq_rel);
      break;
    }
    manager_cv_.notify_one();
    FLUX_LOG_DEBUG("WorkPool", "%s: worker #%d stopped", name_.c_str(), id);
  }

  void Execute(int32_t id, const DoWork& task) {
    char tag[kPoolNameCapacity + 24U];
    (void)std::snprintf(tag, sizeof(tag), "%s#%d", name_.c_str(), id);

    const WorkResult r =
        RecoveryHandler(tag, [&task, id] { return task.work->Run(task.context, id); });
    if (!r) {
      failed_work_.fetch_add(1, std::memory_order_acq_rel);
      if (r.get_error() == WorkError::kFailed) {
        FLUX_LOG_WARN("WorkPool", "%s: task failed on worker #%d", name_.c_str(), id);
      }
    }
  }

  uint32_t NextMetricInterval() const {
    if (cfg_.metric_handler == nullptr) {
      return 0U;
    }
    uint32_t ms = (cfg_.metric_interval != nullptr) ? cfg_.metric_interval(cfg_.metric_context)
                                                    : cfg_.metric_interval_ms;
    if (ms != 0U && ms < kMinMetricIntervalMs) {
      ms = kMinMetricIntervalMs;
    }
    return ms;
  }

  void ApplyLocked(Command cmd) {
    const int64_t live = current_workers_.load(std::memory_order_acquire);
    if (cmd == Command::kAddWorker) {
      if (live >= cfg_.max_workers) {
        FLUX_LOG_DEBUG("WorkPool", "%s: at max_workers, add dropped", name_.c_str());
      } else {
        SpawnWorkerLocked();
      }
      update_pending_.fetch_sub(1, std::memory_order_acq_rel);
      return;
    }

    if (live - static_cast<int64_t>(kill_tokens_) <= cfg_.min_workers) {
      FLUX_LOG_DEBUG("WorkPool", "%s: at min_workers, remove dropped", name_.c_str());
      update_pending_.fetch_sub(1, std::memory_order_acq_rel);
      return;
    }
    // The exiting worker clears its own pending update.
    ++kill_tokens_;
    worker_cv_.notify_one();
  }

  void ManagerLoop() {
    using Clock = std::chrono::steady_clock;
    uint32_t interval = NextMetricInterval();
    Clock::time_point next_tick = Clock::now() + std::chrono::milliseconds(interval);

    for (;;) {
      std::vector<std::thread> reaped;
      bool stop = false;
      {
        std::unique_lock<std::mutex> lock(mtx_);
        auto wake = [this] { return shutdown_ || !commands_.empty() || !exited_.empty(); };
        if (interval != 0U) {
          manager_cv_.wait_until(lock, next_tick, wake);
        } else {
          manager_cv_.wait(lock, wake);
        }

        for (int32_t id : exited_) {
          auto it = workers_.find(id);
          if (it != workers_.end()) {
            reaped.push_back(std::move(it->second));
            workers_.erase(it);
          }
        }
        exited_.clear();

        if (shutdown_) {
          const int64_t live = current_workers_.load(std::memory_order_acquire);
          const int64_t extra = live - static_cast<int64_t>(kill_tokens_);
          if (extra > 0) {
            update_pending_.fetch_add(extra, std::memory_order_acq_rel);
            kill_tokens_ = static_cast<uint32_t>(live);
          }
          worker_cv_.notify_all();
          stop = true;
        } else {
          while (!commands_.empty()) {
            const Command cmd = commands_.front();
            commands_.pop_front();
            ApplyLocked(cmd);
          }
        }
      }

      for (std::thread& t : reaped) {
        t.join();
      }
      if (stop) {
        return;
      }

      if (interval != 0U && Clock::now() >= next_tick) {
        cfg_.metric_handler(Stat(), cfg_.metric_context);
        interval = NextMetricInterval();
        next_tick = Clock::now() + std::chrono::milliseconds(interval);
      }
    }
  }

  FixedString<kPoolNameCapacity> name_;
  const PoolConfig cfg_;

  std::mutex mtx_;
  std::condition_variable worker_cv_;
  std::condition_variable manager_cv_;
  std::deque<Offer*> offers_;
  std::deque<Command> commands_;
  std::unordered_map<int32_t, std::thread> workers_;
  std::vector<int32_t> exited_;
  uint32_t kill_tokens_{0U};
  int32_t next_worker_id_{0};
  bool shutdown_{false};
  bool stopped_{false};
  std::condition_variable stopped_cv_;
  std::thread manager_;

  std::mutex health_mtx_;
  std::atomic<int64_t> current_workers_{0};
  std::atomic<int64_t> update_pending_{0};
  std::atomic<int64_t> active_work_{0};
  std::atomic<int64_t> pending_work_{0};
  std::atomic<int64_t> executed_work_{0};
  std::atomic<int64_t> failed_work_{0};
};

}  // namespace flux

#endif  // FLUX_WORK_POOL_HPP_
