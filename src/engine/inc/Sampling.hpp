#ifndef YARDSTICK_ENGINE_SAMPLING_HPP
#define YARDSTICK_ENGINE_SAMPLING_HPP
/**
 * @file Sampling.hpp
 * @brief Duration-bound and fixed-iteration probe sampling.
 * @note Thread-safe: Functions are stateless; each call owns its aggregate.
 *
 * The duration loop performs one untimed warm-up invocation (unless disabled),
 * then invokes the probe back to back until the monotonic clock reaches the
 * deadline. Only successful values enter the running (sum, count) aggregate;
 * failed invocations are counted separately and never retried.
 *
 * An invocation that starts before the deadline always completes and is
 * recorded, so a probe slower than the budget yields exactly one sample.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace yardstick {

namespace engine {

/* ----------------------------- Constants ----------------------------- */

/// Default per-probe budget (seconds).
inline constexpr double DEFAULT_SAMPLE_BUDGET_SEC = 2.0;

/* ----------------------------- SamplingConfig ----------------------------- */

/**
 * @brief Budget and warm-up policy for one sampled probe.
 */
struct SamplingConfig {
  double budgetSec{DEFAULT_SAMPLE_BUDGET_SEC}; ///< Measured wall-clock budget
  bool warmup{true};                           ///< One discarded invocation first

  [[nodiscard]] bool isValid() const noexcept;
};

/* ----------------------------- SampleAggregate ----------------------------- */

/**
 * @brief Running aggregate of a sampling loop.
 */
struct SampleAggregate {
  double sum{0.0};            ///< Sum of successful values
  std::uint64_t count{0};     ///< Successful invocations
  std::uint64_t failures{0};  ///< Failed invocations (excluded from sum)
  std::uint64_t elapsedNs{0}; ///< Measured wall-clock time (excludes warm-up)

  /// Record one outcome.
  void add(const probe::ProbeOutcome& outcome) noexcept;

  /// sum / count, or 0 when nothing succeeded.
  [[nodiscard]] double average() const noexcept;

  /// At least one successful sample.
  [[nodiscard]] bool success() const noexcept { return count > 0; }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Sample until an absolute monotonic deadline (no warm-up).
 * @param p Probe to invoke.
 * @param deadlineNs CLOCK_MONOTONIC deadline in nanoseconds.
 * @return Aggregate; empty when the deadline has already passed.
 */
[[nodiscard]] SampleAggregate sampleUntil(const probe::Probe& p, std::uint64_t deadlineNs) noexcept;

/**
 * @brief Warm up (optionally), then sample for cfg.budgetSec.
 * @return Aggregate; its average() is the probe's measurement for the budget.
 */
[[nodiscard]] SampleAggregate sampleForDuration(const probe::Probe& p,
                                                const SamplingConfig& cfg) noexcept;

/**
 * @brief Run `warmup` discarded invocations, then exactly `iterations` measured ones.
 *
 * Used by probes whose single invocation already covers a large fixed amount
 * of work (file-backed disk probes).
 */
[[nodiscard]] SampleAggregate sampleIterations(const probe::Probe& p, std::size_t iterations,
                                               std::size_t warmup) noexcept;

} // namespace engine

} // namespace yardstick

#endif // YARDSTICK_ENGINE_SAMPLING_HPP
