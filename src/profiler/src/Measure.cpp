/**
 * @file Measure.cpp
 * @brief Sweep-point measurement over the sampling loop.
 */

#include "src/profiler/inc/Measure.hpp"
#include "src/engine/inc/Sampling.hpp"

namespace yardstick {

namespace profiler {

std::optional<double> measurePoint(const probe::Probe& p, double budgetSec) noexcept {
  if (!p.isValid()) {
    return std::nullopt;
  }
  engine::SamplingConfig cfg{};
  cfg.budgetSec = budgetSec;
  cfg.warmup = true;
  if (!cfg.isValid()) {
    return std::nullopt;
  }
  const engine::SampleAggregate AGG = engine::sampleForDuration(p, cfg);
  if (!AGG.success()) {
    return std::nullopt;
  }
  return AGG.average();
}

} // namespace profiler

} // namespace yardstick
