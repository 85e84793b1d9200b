/**
 * @file ScalingSweep.cpp
 * @brief Efficiency curve and sustained-cliff detection.
 */

#include "src/profiler/inc/ScalingSweep.hpp"
#include "src/engine/inc/ScalingHarness.hpp"

#include <utility>

#include <fmt/core.h>

namespace yardstick {

namespace profiler {

/* ----------------------------- Findings ----------------------------- */

std::string ScalingCliffReport::toString() const {
  if (!cliffWorkers) {
    return fmt::format("no cliff detected (threshold {:.0f}%)", thresholdPercent);
  }
  double eff = 0.0;
  for (const EfficiencyPoint& P : points) {
    if (P.workers == *cliffWorkers) {
      eff = P.efficiencyPercent;
      break;
    }
  }
  return fmt::format("cliff at {} workers ({:.0f}% efficiency, threshold {:.0f}%)", *cliffWorkers,
                     eff, thresholdPercent);
}

/* ----------------------------- API ----------------------------- */

std::vector<std::size_t> workerCounts(std::size_t maxWorkers, bool dense) {
  std::vector<std::size_t> out;
  if (maxWorkers == 0) {
    return out;
  }
  if (dense) {
    for (std::size_t k = 1; k <= maxWorkers; ++k) {
      out.push_back(k);
    }
    return out;
  }
  for (std::size_t k = 1; k < maxWorkers; k *= 2) {
    out.push_back(k);
  }
  out.push_back(maxWorkers);
  return out;
}

std::optional<std::vector<EfficiencyPoint>> computeEfficiency(const WorkerSeries& series) {
  const WorkerSample* single = nullptr;
  for (const WorkerSample& S : series) {
    if (S.workers == 1 && S.valid() && *S.throughput > 0.0) {
      single = &S;
      break;
    }
  }
  if (single == nullptr) {
    return std::nullopt;
  }

  const double BASE = *single->throughput;
  std::vector<EfficiencyPoint> points;
  points.reserve(series.size());
  for (const WorkerSample& S : series) {
    if (!S.valid() || S.workers == 0) {
      continue;
    }
    EfficiencyPoint p{};
    p.workers = S.workers;
    p.throughput = *S.throughput;
    p.efficiencyPercent = *S.throughput / (BASE * static_cast<double>(S.workers)) * 100.0;
    points.push_back(p);
  }
  if (points.size() < 2) {
    return std::nullopt;
  }
  return points;
}

std::optional<ScalingCliffReport> detectScalingCliff(const WorkerSeries& series,
                                                     double thresholdPercent) {
  auto points = computeEfficiency(series);
  if (!points) {
    return std::nullopt;
  }

  ScalingCliffReport report{};
  report.thresholdPercent = thresholdPercent;
  report.points = std::move(*points);

  // Scan from the end; the cliff is where the trailing below-threshold run begins.
  for (std::size_t i = report.points.size(); i > 0; --i) {
    const EfficiencyPoint& P = report.points[i - 1];
    if (P.efficiencyPercent >= thresholdPercent) {
      break;
    }
    report.cliffWorkers = P.workers;
  }
  return report;
}

WorkerSeries sweepWorkers(const probe::Probe& p, const std::vector<std::size_t>& counts,
                          double budgetSec, double timeoutSec) {
  WorkerSeries out;
  out.reserve(counts.size());
  for (const std::size_t K : counts) {
    WorkerSample s{};
    s.workers = K;

    engine::ScalingConfig cfg{};
    cfg.workers = K;
    cfg.budgetSec = budgetSec;
    cfg.warmup = true;
    cfg.timeoutSec = timeoutSec;
    if (K > 0 && cfg.isValid()) {
      const engine::ScalingResult R = engine::runScaled(p, cfg);
      if (R.success()) {
        s.throughput = R.aggregateThroughput;
      }
    }
    out.push_back(s);
  }
  return out;
}

} // namespace profiler

} // namespace yardstick
