#ifndef YARDSTICK_PROFILER_QUEUE_DEPTH_SWEEP_HPP
#define YARDSTICK_PROFILER_QUEUE_DEPTH_SWEEP_HPP
/**
 * @file QueueDepthSweep.hpp
 * @brief I/O queue-depth sweep and diminishing-returns inference.
 *
 * The optimal depth is the smallest sampled depth after which every further
 * step gains less than the marginal-gain threshold. Read and write are swept
 * and judged independently.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace yardstick {

namespace profiler {

/* ----------------------------- Constants ----------------------------- */

/// Marginal gain below which deeper queues stop paying off (fraction).
inline constexpr double DEFAULT_GAIN_THRESHOLD = 0.10;

/// Deepest queue swept by default.
inline constexpr std::size_t DEFAULT_MAX_QUEUE_DEPTH = 32;

/* ----------------------------- Series ----------------------------- */

/**
 * @brief Throughput at one queue depth.
 */
struct DepthSample {
  std::size_t depth{0};
  std::optional<double> throughput{};

  [[nodiscard]] bool valid() const noexcept { return throughput.has_value(); }
};

/// Queue-depth sweep, ascending depth.
using DepthSeries = std::vector<DepthSample>;

/// Builds a probe issuing `depth` concurrent I/O streams.
using DepthProbeFactory = std::function<probe::Probe(std::size_t depth)>;

/* ----------------------------- Findings ----------------------------- */

/**
 * @brief Optimal depth of one direction.
 */
struct QueueDepthFinding {
  std::size_t optimalDepth{0};
  double throughputAtOptimal{0.0};
  std::size_t peakDepth{0};
  double peakThroughput{0.0};

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Read and write findings; either may be omitted.
 */
struct QueueDepthReport {
  std::optional<QueueDepthFinding> read{};
  std::optional<QueueDepthFinding> write{};
  double gainThreshold{DEFAULT_GAIN_THRESHOLD};

  [[nodiscard]] bool empty() const noexcept { return !read && !write; }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/// Depths 1, 2, 4, ... up to and including maxDepth (when a power of two).
[[nodiscard]] std::vector<std::size_t> queueDepths(std::size_t maxDepth = DEFAULT_MAX_QUEUE_DEPTH);

/**
 * @brief Smallest depth after which every step gains less than gainThreshold.
 * @return Finding, or nullopt with fewer than two valid points.
 */
[[nodiscard]] std::optional<QueueDepthFinding>
findOptimalQueueDepth(const DepthSeries& series, double gainThreshold = DEFAULT_GAIN_THRESHOLD);

/// Sample a depth probe at each depth for budgetSec; failures become gaps.
[[nodiscard]] DepthSeries sweepDepths(const DepthProbeFactory& factory,
                                      const std::vector<std::size_t>& depths, double budgetSec);

} // namespace profiler

} // namespace yardstick

#endif // YARDSTICK_PROFILER_QUEUE_DEPTH_SWEEP_HPP
