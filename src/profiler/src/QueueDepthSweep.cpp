/**
 * @file QueueDepthSweep.cpp
 * @brief Diminishing-returns search over a queue-depth series.
 */

#include "src/profiler/inc/QueueDepthSweep.hpp"
#include "src/profiler/inc/Measure.hpp"

#include <fmt/core.h>

namespace yardstick {

namespace profiler {

/* ----------------------------- Findings ----------------------------- */

std::string QueueDepthFinding::toString() const {
  return fmt::format("optimal QD{} ({:.0f}), peak QD{} ({:.0f})", optimalDepth,
                     throughputAtOptimal, peakDepth, peakThroughput);
}

std::string QueueDepthReport::toString() const {
  return fmt::format("read: {}\nwrite: {}", read ? read->toString() : std::string("n/a"),
                     write ? write->toString() : std::string("n/a"));
}

/* ----------------------------- API ----------------------------- */

std::vector<std::size_t> queueDepths(std::size_t maxDepth) {
  std::vector<std::size_t> out;
  for (std::size_t d = 1; d <= maxDepth && d != 0; d *= 2) {
    out.push_back(d);
  }
  return out;
}

std::optional<QueueDepthFinding> findOptimalQueueDepth(const DepthSeries& series,
                                                       double gainThreshold) {
  std::vector<const DepthSample*> valid;
  valid.reserve(series.size());
  for (const DepthSample& S : series) {
    if (S.valid()) {
      valid.push_back(&S);
    }
  }
  if (valid.size() < 2) {
    return std::nullopt;
  }

  // Walk backwards while the step into the next point stays below the threshold.
  std::size_t optimal = valid.size() - 1;
  while (optimal > 0) {
    const double PREV = *valid[optimal - 1]->throughput;
    const double CUR = *valid[optimal]->throughput;
    const double GAIN = (PREV > 0.0) ? (CUR - PREV) / PREV : 0.0;
    if (GAIN >= gainThreshold) {
      break;
    }
    --optimal;
  }

  QueueDepthFinding f{};
  f.optimalDepth = valid[optimal]->depth;
  f.throughputAtOptimal = *valid[optimal]->throughput;
  for (const DepthSample* S : valid) {
    if (*S->throughput > f.peakThroughput) {
      f.peakThroughput = *S->throughput;
      f.peakDepth = S->depth;
    }
  }
  return f;
}

DepthSeries sweepDepths(const DepthProbeFactory& factory, const std::vector<std::size_t>& depths,
                        double budgetSec) {
  DepthSeries out;
  out.reserve(depths.size());
  for (const std::size_t DEPTH : depths) {
    DepthSample s{};
    s.depth = DEPTH;
    if (factory) {
      s.throughput = measurePoint(factory(DEPTH), budgetSec);
    }
    out.push_back(s);
  }
  return out;
}

} // namespace profiler

} // namespace yardstick
