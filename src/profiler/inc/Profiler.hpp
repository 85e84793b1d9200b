#ifndef YARDSTICK_PROFILER_PROFILER_HPP
#define YARDSTICK_PROFILER_PROFILER_HPP
/**
 * @file Profiler.hpp
 * @brief Advanced profiling: cache boundaries, queue depth, scaling cliff.
 *
 * Sweeps run sequentially in a fixed order (cache sizes, strides, read
 * depths, write depths, worker counts). Each produces a series; each finding
 * is inferred from its series alone and is omitted when the series has fewer
 * than two valid points.
 */

#include "src/profiler/inc/CacheSweep.hpp"
#include "src/profiler/inc/QueueDepthSweep.hpp"
#include "src/profiler/inc/ScalingSweep.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace yardstick {

namespace profiler {

/* ----------------------------- ProfileConfig ----------------------------- */

/**
 * @brief Sweep ranges, budgets and inference thresholds.
 */
struct ProfileConfig {
  std::uint64_t minSizeBytes{4ULL * 1024};          ///< First working-set size
  std::uint64_t maxSizeBytes{64ULL * 1024 * 1024};  ///< Last working-set size
  std::uint64_t strideSetBytes{32ULL * 1024 * 1024}; ///< Working set of the stride sweep
  std::uint64_t minStrideBytes{8};
  std::uint64_t maxStrideBytes{4096};
  std::size_t maxQueueDepth{DEFAULT_MAX_QUEUE_DEPTH};
  std::size_t maxWorkers{0};     ///< 0 = logical CPU count
  bool denseWorkerSweep{true};   ///< Every worker count instead of powers of two
  double pointBudgetSec{0.5};    ///< Sampling budget per sweep point
  double dropThreshold{DEFAULT_DROP_THRESHOLD};
  double gainThreshold{DEFAULT_GAIN_THRESHOLD};
  double cliffThresholdPercent{DEFAULT_CLIFF_THRESHOLD_PERCENT};

  /// Short sweeps for a first look.
  [[nodiscard]] static ProfileConfig quick() noexcept;

  /// Long, dense sweeps.
  [[nodiscard]] static ProfileConfig thorough() noexcept;

  [[nodiscard]] bool isValid() const noexcept;

  /// maxWorkers, or the logical CPU count when 0.
  [[nodiscard]] std::size_t resolvedMaxWorkers() const noexcept;
};

/* ----------------------------- ProfileProbes ----------------------------- */

/**
 * @brief Probe sources for each sweep. An empty source skips its sweep.
 */
struct ProfileProbes {
  SizeProbeFactory sizeProbe{};
  StrideProbeFactory strideProbe{};
  DepthProbeFactory readDepthProbe{};
  DepthProbeFactory writeDepthProbe{};
  std::optional<probe::Probe> scalingProbe{};
};

/* ----------------------------- ProfileReport ----------------------------- */

/**
 * @brief Raw series and inferred findings of a profiling run.
 */
struct ProfileReport {
  SizeSeries sizeSeries{};
  StrideSeries strideSeries{};
  DepthSeries readDepthSeries{};
  DepthSeries writeDepthSeries{};
  WorkerSeries workerSeries{};

  std::optional<CacheReport> cache{};
  std::optional<StrideReport> stride{};
  QueueDepthReport queueDepth{};
  std::optional<ScalingCliffReport> scaling{};

  /// Multi-section text report.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/// Sweep about to start ("cache", "stride", "read-depth", "write-depth", "scaling").
using ProfileObserver = std::function<void(const char* sweep)>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Infer every finding from already collected series.
 *
 * Pure: fills the finding fields of `report` from its series fields.
 */
void inferFindings(ProfileReport& report, const ProfileConfig& cfg,
                   const std::vector<std::uint64_t>& knownCacheSizes);

/**
 * @brief Run every sweep with a probe source, then infer findings.
 * @param knownCacheSizes Kernel-reported cache sizes in level order.
 * @return Report; an invalid config yields an empty report.
 */
[[nodiscard]] ProfileReport runProfile(const ProfileProbes& probes, const ProfileConfig& cfg,
                                       const std::vector<std::uint64_t>& knownCacheSizes,
                                       const ProfileObserver& observer = {});

} // namespace profiler

} // namespace yardstick

#endif // YARDSTICK_PROFILER_PROFILER_HPP
