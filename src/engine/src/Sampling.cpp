/**
 * @file Sampling.cpp
 * @brief Duration-bound and fixed-iteration sampling loops.
 */

#include "src/engine/inc/Sampling.hpp"

#include "src/helpers/inc/Clock.hpp"

#include <cmath>

#include <fmt/core.h>

namespace yardstick {

namespace engine {

using yardstick::helpers::clock::deadlineAfter;
using yardstick::helpers::clock::getMonotonicNs;
using yardstick::helpers::clock::nsToSec;
using yardstick::helpers::clock::secToNs;

/* ----------------------------- SamplingConfig ----------------------------- */

bool SamplingConfig::isValid() const noexcept {
  return std::isfinite(budgetSec) && budgetSec > 0.0;
}

/* ----------------------------- SampleAggregate ----------------------------- */

void SampleAggregate::add(const probe::ProbeOutcome& outcome) noexcept {
  if (outcome.ok()) {
    sum += outcome.value;
    ++count;
  } else {
    ++failures;
  }
}

double SampleAggregate::average() const noexcept {
  return (count == 0) ? 0.0 : sum / static_cast<double>(count);
}

std::string SampleAggregate::toString() const {
  return fmt::format("avg={:.4f} samples={} failures={} elapsed={:.3f}s", average(), count,
                     failures, nsToSec(elapsedNs));
}

/* ----------------------------- API ----------------------------- */

SampleAggregate sampleUntil(const probe::Probe& p, std::uint64_t deadlineNs) noexcept {
  SampleAggregate agg{};
  const std::uint64_t START = getMonotonicNs();
  std::uint64_t now = START;
  while (now < deadlineNs) {
    agg.add(p.invoke());
    now = getMonotonicNs();
  }
  agg.elapsedNs = now - START;
  return agg;
}

SampleAggregate sampleForDuration(const probe::Probe& p, const SamplingConfig& cfg) noexcept {
  if (!cfg.isValid()) {
    return SampleAggregate{};
  }
  if (cfg.warmup) {
    (void)p.invoke();
  }
  return sampleUntil(p, deadlineAfter(getMonotonicNs(), secToNs(cfg.budgetSec)));
}

SampleAggregate sampleIterations(const probe::Probe& p, std::size_t iterations,
                                 std::size_t warmup) noexcept {
  for (std::size_t i = 0; i < warmup; ++i) {
    (void)p.invoke();
  }

  SampleAggregate agg{};
  const std::uint64_t START = getMonotonicNs();
  for (std::size_t i = 0; i < iterations; ++i) {
    agg.add(p.invoke());
  }
  agg.elapsedNs = getMonotonicNs() - START;
  return agg;
}

} // namespace engine

} // namespace yardstick
