#ifndef YARDSTICK_PROFILER_SCALING_SWEEP_HPP
#define YARDSTICK_PROFILER_SCALING_SWEEP_HPP
/**
 * @file ScalingSweep.hpp
 * @brief Worker-count sweep and scaling-cliff inference.
 *
 * efficiency(k) = throughput(k) / (throughput(1) * k) * 100
 *
 * The cliff is the smallest sampled k whose efficiency is below the threshold
 * and stays below it for every later sampled k. A transient dip that
 * recovers is not a cliff.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace yardstick {

namespace profiler {

/* ----------------------------- Constants ----------------------------- */

/// Efficiency (percent) below which scaling is considered lost.
inline constexpr double DEFAULT_CLIFF_THRESHOLD_PERCENT = 70.0;

/* ----------------------------- Series ----------------------------- */

/**
 * @brief Aggregate throughput at one worker count.
 */
struct WorkerSample {
  std::size_t workers{0};
  std::optional<double> throughput{};

  [[nodiscard]] bool valid() const noexcept { return throughput.has_value(); }
};

/// Worker sweep, ascending worker count.
using WorkerSeries = std::vector<WorkerSample>;

/**
 * @brief Efficiency at one valid worker count.
 */
struct EfficiencyPoint {
  std::size_t workers{0};
  double throughput{0.0};
  double efficiencyPercent{0.0};
};

/* ----------------------------- Findings ----------------------------- */

/**
 * @brief Efficiency curve and the cliff, if any.
 */
struct ScalingCliffReport {
  std::vector<EfficiencyPoint> points{};
  std::optional<std::size_t> cliffWorkers{};
  double thresholdPercent{DEFAULT_CLIFF_THRESHOLD_PERCENT};

  /// "cliff at 4 workers (60% efficiency)" or "no cliff detected (threshold 70%)".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Worker counts to sample up to maxWorkers.
 * @param dense Every count 1..maxWorkers when true; otherwise powers of two
 *        plus maxWorkers itself.
 */
[[nodiscard]] std::vector<std::size_t> workerCounts(std::size_t maxWorkers, bool dense);

/**
 * @brief Efficiency of each valid point relative to the single-worker point.
 * @return Points, or nullopt without a valid k=1 point or with fewer than
 *         two valid points.
 */
[[nodiscard]] std::optional<std::vector<EfficiencyPoint>>
computeEfficiency(const WorkerSeries& series);

/**
 * @brief Efficiency curve plus the sustained cliff.
 * @return Report, or nullopt when efficiency cannot be computed.
 */
[[nodiscard]] std::optional<ScalingCliffReport>
detectScalingCliff(const WorkerSeries& series,
                   double thresholdPercent = DEFAULT_CLIFF_THRESHOLD_PERCENT);

/**
 * @brief Run the probe through the scaling harness at each worker count.
 * @param budgetSec Measurement budget per point.
 * @param timeoutSec Harness timeout per point (0 = derived).
 * @return Series; failed or timed-out points are gaps.
 */
[[nodiscard]] WorkerSeries sweepWorkers(const probe::Probe& p,
                                        const std::vector<std::size_t>& counts, double budgetSec,
                                        double timeoutSec = 0.0);

} // namespace profiler

} // namespace yardstick

#endif // YARDSTICK_PROFILER_SCALING_SWEEP_HPP
