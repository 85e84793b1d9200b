#ifndef YARDSTICK_ENGINE_SCALING_HARNESS_HPP
#define YARDSTICK_ENGINE_SCALING_HARNESS_HPP
/**
 * @file ScalingHarness.hpp
 * @brief Fan a probe out across N worker threads and aggregate throughput.
 * @note Linux-only. Spawns threads.
 *
 * Protocol:
 *  1. N workers start; each performs one discarded warm-up invocation.
 *  2. Once every worker has warmed up, one shared deadline is published and
 *     all workers run the sampling loop against it.
 *  3. Aggregate throughput is the sum of per-worker averages, finalized only
 *     after every worker has reported.
 *
 * Workers share no mutable state beyond the completion barrier. The caller's
 * hard timeout bounds the whole run: when it expires the result is
 * TIMED_OUT with aggregate 0, and stalled workers are detached. They finish on
 * their own and never touch the returned result.
 *
 * @warning NOT RT-safe: Allocates, spawns threads, blocks.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace yardstick {

namespace engine {

/* ----------------------------- HarnessStatus ----------------------------- */

/**
 * @brief Outcome of a scaled run.
 */
enum class HarnessStatus : std::uint8_t {
  OK = 0,           ///< Every worker joined before the timeout
  INVALID_ARGUMENT, ///< Bad config or invalid probe
  SPAWN_FAILED,     ///< Thread creation failed
  TIMED_OUT,        ///< Hard timeout expired before every worker joined
};

/// Human-readable status.
[[nodiscard]] const char* toString(HarnessStatus status) noexcept;

/* ----------------------------- ScalingConfig ----------------------------- */

/**
 * @brief Worker count, budget and timeout for one scaled run.
 */
struct ScalingConfig {
  std::size_t workers{0};   ///< Worker threads (0 = logical CPU count)
  double budgetSec{2.0};    ///< Measurement budget shared by all workers
  bool warmup{true};        ///< Each worker invokes once before the deadline is set
  double timeoutSec{0.0};   ///< Hard timeout for the whole run (0 = derived)

  [[nodiscard]] bool isValid() const noexcept;

  /// workers, or the logical CPU count when 0.
  [[nodiscard]] std::size_t resolvedWorkers() const noexcept;

  /// timeoutSec, or 3 x budget + 10 s when 0.
  [[nodiscard]] double resolvedTimeoutSec() const noexcept;
};

/* ----------------------------- ScalingResult ----------------------------- */

/**
 * @brief Aggregate of a scaled run.
 */
struct ScalingResult {
  HarnessStatus status{HarnessStatus::INVALID_ARGUMENT};
  std::size_t workers{0};           ///< Workers spawned
  std::vector<double> perWorker{};  ///< Per-worker averages (empty unless OK)
  double aggregateThroughput{0.0};  ///< Sum of per-worker averages (0 unless OK)
  std::uint64_t elapsedNs{0};       ///< Wall-clock time including warm-up

  [[nodiscard]] bool timedOut() const noexcept { return status == HarnessStatus::TIMED_OUT; }

  /// Run completed and produced a positive aggregate.
  [[nodiscard]] bool success() const noexcept {
    return status == HarnessStatus::OK && aggregateThroughput > 0.0;
  }

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run a probe concurrently on N workers.
 * @param p Probe; copied into the run so detached workers never reference the caller.
 * @param cfg Run configuration.
 * @return Result; see HarnessStatus for failure modes.
 */
[[nodiscard]] ScalingResult runScaled(const probe::Probe& p, const ScalingConfig& cfg) noexcept;

} // namespace engine

} // namespace yardstick

#endif // YARDSTICK_ENGINE_SCALING_HARNESS_HPP
