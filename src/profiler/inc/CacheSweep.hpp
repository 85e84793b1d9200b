#ifndef YARDSTICK_PROFILER_CACHE_SWEEP_HPP
#define YARDSTICK_PROFILER_CACHE_SWEEP_HPP
/**
 * @file CacheSweep.hpp
 * @brief Working-set and stride sweeps with cache-boundary inference.
 *
 * A sweep is an ordered series of (parameter, throughput?) points. A point
 * with no throughput is a gap (allocation refused or probe failed) and is
 * skipped by every inference; it never counts as zero.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace yardstick {

namespace profiler {

/* ----------------------------- Constants ----------------------------- */

/// Drop from the previous valid point that marks a boundary (fraction).
inline constexpr double DEFAULT_DROP_THRESHOLD = 0.15;

/// Known cache sizes within this factor of a boundary are considered a match.
inline constexpr double CACHE_MATCH_FACTOR = 4.0;

/* ----------------------------- Series ----------------------------- */

/**
 * @brief Throughput at one working-set size.
 */
struct SizeSample {
  std::uint64_t sizeBytes{0};
  std::optional<double> throughput{};

  [[nodiscard]] bool valid() const noexcept { return throughput.has_value(); }
};

/// Working-set sweep, ascending size.
using SizeSeries = std::vector<SizeSample>;

/**
 * @brief Throughput at one access stride over a fixed working set.
 */
struct StrideSample {
  std::uint64_t strideBytes{0};
  std::optional<double> throughput{};

  [[nodiscard]] bool valid() const noexcept { return throughput.has_value(); }
};

/// Stride sweep, ascending stride.
using StrideSeries = std::vector<StrideSample>;

/// Builds a throughput probe for one working-set size.
using SizeProbeFactory = std::function<probe::Probe(std::uint64_t sizeBytes)>;

/// Builds a throughput probe for one stride.
using StrideProbeFactory = std::function<probe::Probe(std::uint64_t strideBytes)>;

/* ----------------------------- Findings ----------------------------- */

/**
 * @brief One inferred cache boundary.
 */
struct CacheBoundary {
  std::uint64_t lastFitBytes{0};  ///< Largest size before the drop (approximate capacity)
  std::uint64_t boundaryBytes{0}; ///< First size after the drop
  double dropFraction{0.0};       ///< (prev - cur) / prev
  int estimatedLevel{0};          ///< 1=L1, 2=L2, ...

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Boundaries found in a working-set sweep, ordered by size.
 */
struct CacheReport {
  std::vector<CacheBoundary> boundaries{};
  std::size_t validPoints{0};

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Stride sweep finding.
 */
struct StrideReport {
  std::uint64_t peakStrideBytes{0};
  double peakThroughput{0.0};
  std::optional<std::uint64_t> sequentialLimitBytes{}; ///< First stride far below the peak

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Sizes from minBytes doubling up to and including maxBytes.
 * @return Empty when minBytes is 0 or greater than maxBytes.
 */
[[nodiscard]] std::vector<std::uint64_t> doublingSizes(std::uint64_t minBytes,
                                                       std::uint64_t maxBytes);

/**
 * @brief Estimate the cache level whose capacity a boundary reflects.
 *
 * Matches `lastFitBytes` against the kernel-reported sizes (level order,
 * index + 1 = level) by closest log distance within CACHE_MATCH_FACTOR.
 * Falls back to `ordinal` (1-based boundary order) when nothing matches.
 */
[[nodiscard]] int estimateCacheLevel(std::uint64_t lastFitBytes,
                                     const std::vector<std::uint64_t>& knownCacheSizes,
                                     int ordinal) noexcept;

/**
 * @brief Find throughput drops larger than `threshold` between valid points.
 * @return Report, or nullopt with fewer than two valid points.
 */
[[nodiscard]] std::optional<CacheReport>
detectCacheBoundaries(const SizeSeries& series, double threshold = DEFAULT_DROP_THRESHOLD,
                      const std::vector<std::uint64_t>& knownCacheSizes = {});

/**
 * @brief Peak stride and the first later stride below peak * (1 - threshold).
 * @return Report, or nullopt with fewer than two valid points.
 */
[[nodiscard]] std::optional<StrideReport>
analyzeStrides(const StrideSeries& series, double threshold = DEFAULT_DROP_THRESHOLD);

/// Sample a size probe at each size for budgetSec; failures become gaps.
[[nodiscard]] SizeSeries sweepSizes(const SizeProbeFactory& factory,
                                    const std::vector<std::uint64_t>& sizes, double budgetSec);

/// Sample a stride probe at each stride for budgetSec; failures become gaps.
[[nodiscard]] StrideSeries sweepStrides(const StrideProbeFactory& factory,
                                        const std::vector<std::uint64_t>& strides,
                                        double budgetSec);

} // namespace profiler

} // namespace yardstick

#endif // YARDSTICK_PROFILER_CACHE_SWEEP_HPP
