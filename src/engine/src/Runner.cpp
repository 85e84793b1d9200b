/**
 * @file Runner.cpp
 * @brief Category execution with thermal bracketing.
 */

#include "src/engine/inc/Runner.hpp"

#include "src/engine/inc/Sampling.hpp"
#include "src/engine/inc/ScalingHarness.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <unistd.h> // sysconf

#include <cmath>
#include <utility>

#include <fmt/core.h>

namespace yardstick {

namespace engine {

using yardstick::helpers::clock::getMonotonicNs;
using yardstick::helpers::clock::getWallClockMs;
using yardstick::helpers::clock::nsToSec;

namespace {

MetricResult describe(const probe::Probe& p) {
  MetricResult m{};
  m.key = p.key;
  m.label = p.label;
  m.unit = p.unit;
  m.direction = p.direction;
  return m;
}

const CategoryPlan* findPlan(const std::vector<CategoryPlan>& plans, Category c) noexcept {
  for (const CategoryPlan& P : plans) {
    if (P.category == c) {
      return &P;
    }
  }
  return nullptr;
}

void notify(const RunObserver& observer, RunEvent::Kind kind, Category c,
            thermal::ThermalLevel level, const CategoryResult* result = nullptr) {
  if (!observer) {
    return;
  }
  RunEvent ev{};
  ev.kind = kind;
  ev.category = c;
  ev.level = level;
  ev.result = result;
  observer(ev);
}

} // namespace

/* ----------------------------- ExecutionMode ----------------------------- */

const char* toString(ExecutionMode mode) noexcept {
  switch (mode) {
  case ExecutionMode::SAMPLED:
    return "sampled";
  case ExecutionMode::SCALED:
    return "scaled";
  case ExecutionMode::FIXED_ITERATIONS:
    return "fixed-iterations";
  }
  return "unknown";
}

/* ----------------------------- RunConfig ----------------------------- */

RunConfig RunConfig::quick() noexcept {
  RunConfig cfg{};
  cfg.categoryBudgetSec = QUICK_CATEGORY_BUDGET_SEC;
  cfg.quickMode = true;
  return cfg;
}

RunConfig RunConfig::standard() noexcept { return RunConfig{}; }

RunConfig RunConfig::stress() noexcept {
  RunConfig cfg{};
  cfg.categoryBudgetSec = STRESS_CATEGORY_BUDGET_SEC;
  return cfg;
}

bool RunConfig::isValid() const noexcept {
  return std::isfinite(categoryBudgetSec) && categoryBudgetSec > 0.0 &&
         std::isfinite(harnessTimeoutSec) && harnessTimeoutSec >= 0.0 && !selection.empty();
}

double RunConfig::probeBudgetSec(std::size_t probeCount) const noexcept {
  return (probeCount == 0) ? categoryBudgetSec
                           : categoryBudgetSec / static_cast<double>(probeCount);
}

double resolveCategoryBudgetSec(std::optional<double> durationSec, bool stress,
                                bool quick) noexcept {
  if (durationSec && std::isfinite(*durationSec)) {
    return (*durationSec < MIN_CATEGORY_BUDGET_SEC) ? MIN_CATEGORY_BUDGET_SEC : *durationSec;
  }
  if (stress) {
    return STRESS_CATEGORY_BUDGET_SEC;
  }
  if (quick) {
    return QUICK_CATEGORY_BUDGET_SEC;
  }
  return DEFAULT_CATEGORY_BUDGET_SEC;
}

/* ----------------------------- API ----------------------------- */

MetricResult runProbe(const probe::Probe& p, ExecutionMode mode, double budgetSec,
                      const RunConfig& cfg) {
  MetricResult m = describe(p);

  switch (mode) {
  case ExecutionMode::SAMPLED: {
    SamplingConfig sc{};
    sc.budgetSec = budgetSec;
    sc.warmup = !cfg.quickMode;
    const SampleAggregate AGG = sampleForDuration(p, sc);
    m.value = AGG.average();
    m.samples = AGG.count;
    break;
  }
  case ExecutionMode::SCALED: {
    ScalingConfig sc{};
    sc.workers = cfg.workers;
    sc.budgetSec = budgetSec;
    sc.warmup = !cfg.quickMode;
    sc.timeoutSec = cfg.harnessTimeoutSec;
    const ScalingResult R = runScaled(p, sc);
    m.value = R.success() ? R.aggregateThroughput : 0.0;
    m.samples = R.workers;
    break;
  }
  case ExecutionMode::FIXED_ITERATIONS: {
    const SampleAggregate AGG =
        sampleIterations(p, cfg.fixedIterations(), cfg.warmupInvocations());
    m.value = AGG.average();
    m.samples = AGG.count;
    break;
  }
  }
  return m;
}

CategoryResult runCategory(const CategoryPlan& plan, const RunConfig& cfg) {
  CategoryResult result{};
  result.category = plan.category;

  const std::uint64_t START = getMonotonicNs();
  const double BUDGET = cfg.probeBudgetSec(plan.probes.size());
  result.metrics.reserve(plan.probes.size());
  for (const probe::Probe& P : plan.probes) {
    result.metrics.push_back(runProbe(P, plan.mode, BUDGET, cfg));
  }
  result.durationSec = nsToSec(getMonotonicNs() - START);
  return result;
}

RunResults runBenchmarks(const std::vector<CategoryPlan>& plans, const RunConfig& cfg,
                         thermal::ThermalSupervisor& supervisor, const RunObserver& observer) {
  RunResults run{};
  run.timestampMs = getWallClockMs();
  run.quickMode = cfg.quickMode;
  run.categoryBudgetSec = cfg.categoryBudgetSec;
  const long CPUS = ::sysconf(_SC_NPROCESSORS_ONLN);
  run.logicalCpus = (CPUS > 0) ? static_cast<std::size_t>(CPUS) : 1;

  const thermal::ThermalLevel START_LEVEL = supervisor.record("start").level;
  notify(observer, RunEvent::Kind::RUN_STARTED, Category::CPU_SINGLE, START_LEVEL);
  if (thermal::isThrottlingLevel(START_LEVEL)) {
    notify(observer, RunEvent::Kind::THROTTLING, Category::CPU_SINGLE, START_LEVEL);
  }

  for (const Category C : cfg.selection.ordered()) {
    const thermal::ThermalLevel BEFORE =
        supervisor.record(fmt::format("before_{}", toString(C))).level;
    notify(observer, RunEvent::Kind::CATEGORY_STARTED, C, BEFORE);

    const CategoryPlan* plan = findPlan(plans, C);
    CategoryResult result{};
    if (plan != nullptr) {
      result = runCategory(*plan, cfg);
    } else {
      result.category = C;
    }

    const thermal::ThermalLevel AFTER =
        supervisor.record(fmt::format("after_{}", toString(C))).level;
    result.thermalStart = BEFORE;
    result.thermalEnd = AFTER;
    run.categories.push_back(std::move(result));

    notify(observer, RunEvent::Kind::CATEGORY_FINISHED, C, AFTER, &run.categories.back());
    if (thermal::isThrottlingLevel(AFTER)) {
      notify(observer, RunEvent::Kind::THROTTLING, C, AFTER);
    }
  }

  const thermal::ThermalLevel END_LEVEL = supervisor.record("end").level;
  run.snapshots = supervisor.snapshots();
  run.thermalSummary = supervisor.summary();
  notify(observer, RunEvent::Kind::RUN_FINISHED, Category::CPU_SINGLE, END_LEVEL);
  return run;
}

} // namespace engine

} // namespace yardstick
