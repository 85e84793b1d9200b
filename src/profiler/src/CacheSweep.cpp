/**
 * @file CacheSweep.cpp
 * @brief Cache-boundary and stride inference over sweep series.
 */

#include "src/profiler/inc/CacheSweep.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/profiler/inc/Measure.hpp"

#include <cmath>

#include <fmt/core.h>

namespace yardstick {

namespace profiler {

using yardstick::helpers::format::bytesBinary;

/* ----------------------------- Findings ----------------------------- */

std::string CacheBoundary::toString() const {
  return fmt::format("~{} (L{}): {:.0f}% drop at {}", bytesBinary(lastFitBytes), estimatedLevel,
                     dropFraction * 100.0, bytesBinary(boundaryBytes));
}

std::string CacheReport::toString() const {
  if (boundaries.empty()) {
    return fmt::format("no cache boundaries detected ({} points)", validPoints);
  }
  std::string out;
  for (const CacheBoundary& B : boundaries) {
    if (!out.empty()) {
      out += "\n";
    }
    out += B.toString();
  }
  return out;
}

std::string StrideReport::toString() const {
  std::string out = fmt::format("peak at stride {} ({:.2f})", bytesBinary(peakStrideBytes),
                                peakThroughput);
  if (sequentialLimitBytes) {
    out += fmt::format(", sequential advantage lost at {}", bytesBinary(*sequentialLimitBytes));
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

std::vector<std::uint64_t> doublingSizes(std::uint64_t minBytes, std::uint64_t maxBytes) {
  std::vector<std::uint64_t> out;
  if (minBytes == 0 || minBytes > maxBytes) {
    return out;
  }
  for (std::uint64_t s = minBytes; s <= maxBytes; s *= 2) {
    out.push_back(s);
    if (s > maxBytes / 2) {
      break;
    }
  }
  return out;
}

int estimateCacheLevel(std::uint64_t lastFitBytes,
                       const std::vector<std::uint64_t>& knownCacheSizes, int ordinal) noexcept {
  if (lastFitBytes == 0) {
    return ordinal;
  }
  const double FIT_LOG = std::log2(static_cast<double>(lastFitBytes));
  const double MAX_DIST = std::log2(CACHE_MATCH_FACTOR);

  int best = 0;
  double bestDist = MAX_DIST;
  for (std::size_t i = 0; i < knownCacheSizes.size(); ++i) {
    if (knownCacheSizes[i] == 0) {
      continue;
    }
    const double DIST = std::fabs(std::log2(static_cast<double>(knownCacheSizes[i])) - FIT_LOG);
    // Ties go to the larger level.
    if (DIST <= bestDist) {
      bestDist = DIST;
      best = static_cast<int>(i) + 1;
    }
  }
  return (best > 0) ? best : ordinal;
}

std::optional<CacheReport> detectCacheBoundaries(const SizeSeries& series, double threshold,
                                                 const std::vector<std::uint64_t>& knownCacheSizes) {
  CacheReport report{};
  const SizeSample* prev = nullptr;
  for (const SizeSample& S : series) {
    if (!S.valid()) {
      continue;
    }
    ++report.validPoints;
    if (prev != nullptr && *prev->throughput > 0.0) {
      const double DROP = (*prev->throughput - *S.throughput) / *prev->throughput;
      if (DROP > threshold) {
        CacheBoundary b{};
        b.lastFitBytes = prev->sizeBytes;
        b.boundaryBytes = S.sizeBytes;
        b.dropFraction = DROP;
        b.estimatedLevel = estimateCacheLevel(b.lastFitBytes, knownCacheSizes,
                                              static_cast<int>(report.boundaries.size()) + 1);
        report.boundaries.push_back(b);
      }
    }
    prev = &S;
  }
  if (report.validPoints < 2) {
    return std::nullopt;
  }
  return report;
}

std::optional<StrideReport> analyzeStrides(const StrideSeries& series, double threshold) {
  std::size_t valid = 0;
  const StrideSample* peak = nullptr;
  for (const StrideSample& S : series) {
    if (!S.valid()) {
      continue;
    }
    ++valid;
    if (peak == nullptr || *S.throughput > *peak->throughput) {
      peak = &S;
    }
  }
  if (valid < 2 || peak == nullptr) {
    return std::nullopt;
  }

  StrideReport report{};
  report.peakStrideBytes = peak->strideBytes;
  report.peakThroughput = *peak->throughput;

  const double FLOOR = report.peakThroughput * (1.0 - threshold);
  for (const StrideSample& S : series) {
    if (S.valid() && S.strideBytes > peak->strideBytes && *S.throughput < FLOOR) {
      report.sequentialLimitBytes = S.strideBytes;
      break;
    }
  }
  return report;
}

SizeSeries sweepSizes(const SizeProbeFactory& factory, const std::vector<std::uint64_t>& sizes,
                      double budgetSec) {
  SizeSeries out;
  out.reserve(sizes.size());
  for (const std::uint64_t SIZE : sizes) {
    SizeSample s{};
    s.sizeBytes = SIZE;
    if (factory) {
      s.throughput = measurePoint(factory(SIZE), budgetSec);
    }
    out.push_back(s);
  }
  return out;
}

StrideSeries sweepStrides(const StrideProbeFactory& factory,
                          const std::vector<std::uint64_t>& strides, double budgetSec) {
  StrideSeries out;
  out.reserve(strides.size());
  for (const std::uint64_t STRIDE : strides) {
    StrideSample s{};
    s.strideBytes = STRIDE;
    if (factory) {
      s.throughput = measurePoint(factory(STRIDE), budgetSec);
    }
    out.push_back(s);
  }
  return out;
}

} // namespace profiler

} // namespace yardstick
