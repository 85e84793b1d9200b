/**
 * @file Profiler.cpp
 * @brief Sweep orchestration and report assembly.
 */

#include "src/profiler/inc/Profiler.hpp"

#include <unistd.h> // sysconf

#include <cmath>

#include <fmt/core.h>

namespace yardstick {

namespace profiler {

/* ----------------------------- ProfileConfig ----------------------------- */

ProfileConfig ProfileConfig::quick() noexcept {
  ProfileConfig cfg{};
  cfg.maxSizeBytes = 32ULL * 1024 * 1024;
  cfg.strideSetBytes = 16ULL * 1024 * 1024;
  cfg.denseWorkerSweep = false;
  cfg.pointBudgetSec = 0.2;
  return cfg;
}

ProfileConfig ProfileConfig::thorough() noexcept {
  ProfileConfig cfg{};
  cfg.maxSizeBytes = 256ULL * 1024 * 1024;
  cfg.strideSetBytes = 64ULL * 1024 * 1024;
  cfg.denseWorkerSweep = true;
  cfg.pointBudgetSec = 2.0;
  return cfg;
}

bool ProfileConfig::isValid() const noexcept {
  const auto FRACTION = [](double v) { return std::isfinite(v) && v > 0.0 && v < 1.0; };
  return minSizeBytes > 0 && minSizeBytes <= maxSizeBytes && strideSetBytes > 0 &&
         minStrideBytes > 0 && minStrideBytes <= maxStrideBytes && maxQueueDepth > 0 &&
         std::isfinite(pointBudgetSec) && pointBudgetSec > 0.0 && FRACTION(dropThreshold) &&
         FRACTION(gainThreshold) && cliffThresholdPercent > 0.0 && cliffThresholdPercent < 100.0;
}

std::size_t ProfileConfig::resolvedMaxWorkers() const noexcept {
  if (maxWorkers > 0) {
    return maxWorkers;
  }
  const long N = ::sysconf(_SC_NPROCESSORS_ONLN);
  return (N > 0) ? static_cast<std::size_t>(N) : 1U;
}

/* ----------------------------- ProfileReport ----------------------------- */

std::string ProfileReport::toString() const {
  std::string out = "Cache boundaries:\n";
  out += cache ? cache->toString() : std::string("omitted (insufficient data)");
  out += "\nStride:\n";
  out += stride ? stride->toString() : std::string("omitted (insufficient data)");
  out += "\nQueue depth:\n";
  out += queueDepth.empty() ? std::string("omitted (insufficient data)") : queueDepth.toString();
  out += "\nScaling:\n";
  out += scaling ? scaling->toString() : std::string("omitted (insufficient data)");
  return out;
}

/* ----------------------------- API ----------------------------- */

void inferFindings(ProfileReport& report, const ProfileConfig& cfg,
                   const std::vector<std::uint64_t>& knownCacheSizes) {
  report.cache = detectCacheBoundaries(report.sizeSeries, cfg.dropThreshold, knownCacheSizes);
  report.stride = analyzeStrides(report.strideSeries, cfg.dropThreshold);
  report.queueDepth.gainThreshold = cfg.gainThreshold;
  report.queueDepth.read = findOptimalQueueDepth(report.readDepthSeries, cfg.gainThreshold);
  report.queueDepth.write = findOptimalQueueDepth(report.writeDepthSeries, cfg.gainThreshold);
  report.scaling = detectScalingCliff(report.workerSeries, cfg.cliffThresholdPercent);
}

ProfileReport runProfile(const ProfileProbes& probes, const ProfileConfig& cfg,
                         const std::vector<std::uint64_t>& knownCacheSizes,
                         const ProfileObserver& observer) {
  ProfileReport report{};
  if (!cfg.isValid()) {
    return report;
  }

  const auto NOTIFY = [&observer](const char* sweep) {
    if (observer) {
      observer(sweep);
    }
  };

  if (probes.sizeProbe) {
    NOTIFY("cache");
    report.sizeSeries = sweepSizes(probes.sizeProbe,
                                   doublingSizes(cfg.minSizeBytes, cfg.maxSizeBytes),
                                   cfg.pointBudgetSec);
  }
  if (probes.strideProbe) {
    NOTIFY("stride");
    report.strideSeries = sweepStrides(probes.strideProbe,
                                       doublingSizes(cfg.minStrideBytes, cfg.maxStrideBytes),
                                       cfg.pointBudgetSec);
  }
  const std::vector<std::size_t> DEPTHS = queueDepths(cfg.maxQueueDepth);
  if (probes.readDepthProbe) {
    NOTIFY("read-depth");
    report.readDepthSeries = sweepDepths(probes.readDepthProbe, DEPTHS, cfg.pointBudgetSec);
  }
  if (probes.writeDepthProbe) {
    NOTIFY("write-depth");
    report.writeDepthSeries = sweepDepths(probes.writeDepthProbe, DEPTHS, cfg.pointBudgetSec);
  }
  if (probes.scalingProbe) {
    NOTIFY("scaling");
    report.workerSeries =
        sweepWorkers(*probes.scalingProbe,
                     workerCounts(cfg.resolvedMaxWorkers(), cfg.denseWorkerSweep),
                     cfg.pointBudgetSec);
  }

  inferFindings(report, cfg, knownCacheSizes);
  return report;
}

} // namespace profiler

} // namespace yardstick
