#ifndef YARDSTICK_ENGINE_RUNNER_HPP
#define YARDSTICK_ENGINE_RUNNER_HPP
/**
 * @file Runner.hpp
 * @brief Drive selected categories through the sampling loop, scaling harness
 *        and thermal supervisor.
 *
 * For every selected category, in declared order:
 *  1. record "before_<category>",
 *  2. run each probe of the category's plan with its execution mode,
 *  3. record "after_<category>".
 * The run itself is bracketed by "start" and "end" snapshots. Throttling is
 * reported through the observer and never stops the run.
 *
 * @note NOT RT-safe: Runs benchmarks, allocates, may spawn threads.
 */

#include "src/engine/inc/Results.hpp"
#include "src/probe/inc/Probe.hpp"
#include "src/thermal/inc/ThermalSupervisor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace yardstick {

namespace engine {

/* ----------------------------- Constants ----------------------------- */

/// Default per-category budget (seconds).
inline constexpr double DEFAULT_CATEGORY_BUDGET_SEC = 10.0;

/// Quick-mode per-category budget (seconds).
inline constexpr double QUICK_CATEGORY_BUDGET_SEC = 3.0;

/// Stress-mode per-category budget (seconds).
inline constexpr double STRESS_CATEGORY_BUDGET_SEC = 60.0;

/// Smallest explicit per-category budget (seconds).
inline constexpr double MIN_CATEGORY_BUDGET_SEC = 1.0;

/* ----------------------------- ExecutionMode ----------------------------- */

/**
 * @brief How the probes of a category are driven.
 */
enum class ExecutionMode : std::uint8_t {
  SAMPLED = 0,      ///< Duration-bound sampling loop on the calling thread
  SCALED,           ///< Scaling harness across all workers
  FIXED_ITERATIONS, ///< Fixed invocation count (file-backed probes)
};

/// Human-readable mode.
[[nodiscard]] const char* toString(ExecutionMode mode) noexcept;

/* ----------------------------- CategoryPlan ----------------------------- */

/**
 * @brief Probes of one category and how to run them.
 */
struct CategoryPlan {
  Category category{Category::CPU_SINGLE};
  ExecutionMode mode{ExecutionMode::SAMPLED};
  std::vector<probe::Probe> probes{};
};

/* ----------------------------- RunConfig ----------------------------- */

/**
 * @brief Configuration of one benchmark run.
 */
struct RunConfig {
  double categoryBudgetSec{DEFAULT_CATEGORY_BUDGET_SEC}; ///< Split evenly across probes
  bool quickMode{false};              ///< Skip warm-ups, one fixed iteration
  std::size_t workers{0};             ///< Scaled workers (0 = logical CPUs)
  double harnessTimeoutSec{0.0};      ///< Hard timeout per scaled probe (0 = derived)
  CategorySelection selection{CategorySelection::all()};

  /// 3 s per category, quick mode.
  [[nodiscard]] static RunConfig quick() noexcept;

  /// 10 s per category.
  [[nodiscard]] static RunConfig standard() noexcept;

  /// 60 s per category for sustained-load runs.
  [[nodiscard]] static RunConfig stress() noexcept;

  [[nodiscard]] bool isValid() const noexcept;

  /// Budget of each probe in a category with `probeCount` probes.
  [[nodiscard]] double probeBudgetSec(std::size_t probeCount) const noexcept;

  /// Measured invocations for FIXED_ITERATIONS (1 quick, 3 otherwise).
  [[nodiscard]] std::size_t fixedIterations() const noexcept { return quickMode ? 1 : 3; }

  /// Discarded warm-up invocations (0 quick, 1 otherwise).
  [[nodiscard]] std::size_t warmupInvocations() const noexcept { return quickMode ? 0 : 1; }
};

/**
 * @brief Resolve the per-category budget from CLI-style inputs.
 *
 * Precedence: explicit duration (clamped to >= 1 s) > stress (60 s) >
 * quick (3 s) > default (10 s).
 */
[[nodiscard]] double resolveCategoryBudgetSec(std::optional<double> durationSec, bool stress,
                                              bool quick) noexcept;

/* ----------------------------- Observer ----------------------------- */

/**
 * @brief Progress notification.
 */
struct RunEvent {
  enum class Kind : std::uint8_t {
    RUN_STARTED = 0,   ///< After the "start" snapshot
    THROTTLING,        ///< Level is SERIOUS/CRITICAL at a category boundary
    CATEGORY_STARTED,  ///< After "before_<category>"
    CATEGORY_FINISHED, ///< After "after_<category>"; result is set
    RUN_FINISHED,      ///< After the "end" snapshot
  };

  Kind kind{Kind::RUN_STARTED};
  Category category{Category::CPU_SINGLE};
  thermal::ThermalLevel level{thermal::ThermalLevel::NOMINAL};
  const CategoryResult* result{nullptr};
};

/// Optional progress callback.
using RunObserver = std::function<void(const RunEvent&)>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run one probe according to its mode.
 * @return Metric with the averaged value (0 on failure).
 */
[[nodiscard]] MetricResult runProbe(const probe::Probe& p, ExecutionMode mode, double budgetSec,
                                    const RunConfig& cfg);

/**
 * @brief Run every probe of a plan (no thermal snapshots).
 */
[[nodiscard]] CategoryResult runCategory(const CategoryPlan& plan, const RunConfig& cfg);

/**
 * @brief Run all selected categories in declared order.
 * @param plans Available plans; a selected category without a plan yields an
 *              empty (all-failed) result.
 * @param cfg Run configuration.
 * @param supervisor Thermal supervisor receiving the run's snapshots.
 * @param observer Optional progress callback.
 */
[[nodiscard]] RunResults runBenchmarks(const std::vector<CategoryPlan>& plans,
                                       const RunConfig& cfg, thermal::ThermalSupervisor& supervisor,
                                       const RunObserver& observer = {});

} // namespace engine

} // namespace yardstick

#endif // YARDSTICK_ENGINE_RUNNER_HPP
