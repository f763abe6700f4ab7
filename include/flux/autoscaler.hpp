/**
 * @file autoscaler.hpp
 * @brief Autoscaler - load heuristic deciding WorkPool growth and shrink.
 *
 * Pure value type: given the worker bounds, the current worker count,
 * whether a previous scaling request is still in flight, and the load,
 * Evaluate() returns the worker delta to request (0 = leave alone).
 *
 * Rules:
 *   - a scaling request still in flight -> 0 (no overlapping storms)
 *   - fully idle and above min         -> shrink to exactly min
 *   - saturated and below max          -> grow by max(1, 20% of workers),
 *                                         clamped to max
 */

#ifndef FLUX_AUTOSCALER_HPP_
#define FLUX_AUTOSCALER_HPP_

#include <cstdint>

namespace flux {

/// Growth step in percent of the current worker count.
static constexpr int64_t kScaleUpPercent = 20;

struct Autoscaler {
  int64_t min_workers{1};
  int64_t max_workers{1};
  int64_t current_workers{0};
  bool change_pending{false};

  /**
   * @brief Worker delta for the observed load.
   *
   * @param active  Tasks currently executing.
   * @param pending Submitters waiting for a worker.
   * @return Positive to grow, negative to shrink, 0 to keep.
   */
  int64_t Evaluate(int64_t active, int64_t pending) const noexcept {
    if (change_pending) {
      return 0;
    }

    if (active == 0 && pending == 0 && current_workers > min_workers) {
      return min_workers - current_workers;
    }

    if (active >= current_workers && current_workers < max_workers) {
      int64_t grow = (current_workers * kScaleUpPercent) / 100;
      if (grow == 0) {
        grow = 1;
      }
      if (current_workers + grow > max_workers) {
        grow = max_workers - current_workers;
      }
      return grow;
    }

    return 0;
  }
};

}  // namespace flux

#endif  // FLUX_AUTOSCALER_HPP_
