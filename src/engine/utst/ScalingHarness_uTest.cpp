/**
 * @file ScalingHarness_uTest.cpp
 * @brief Unit tests for yardstick::engine::runScaled.
 *
 * Notes:
 *  - Spawns real threads; budgets are kept to tens of milliseconds.
 *  - The timeout tests leave detached workers sleeping briefly.
 */

#include "src/engine/inc/ScalingHarness.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using yardstick::engine::HarnessStatus;
using yardstick::engine::runScaled;
using yardstick::engine::ScalingConfig;
using yardstick::engine::ScalingResult;
using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::probe::Probe;

namespace {

ScalingConfig makeConfig(std::size_t workers, double budgetSec) {
  ScalingConfig cfg{};
  cfg.workers = workers;
  cfg.budgetSec = budgetSec;
  cfg.timeoutSec = 10.0;
  return cfg;
}

Probe constantProbe(double value) {
  return makeProbe("const", "Const", "u", Direction::HIGHER_IS_BETTER, [value] {
    std::this_thread::sleep_for(std::chrono::microseconds(100));
    return value;
  });
}

} // namespace

/* ----------------------------- ScalingConfig ----------------------------- */

/** @test Zero workers resolves to at least one logical CPU. */
TEST(ScalingConfigTest, ResolvedWorkers) {
  ScalingConfig cfg{};
  EXPECT_GE(cfg.resolvedWorkers(), 1U);
  cfg.workers = 3;
  EXPECT_EQ(cfg.resolvedWorkers(), 3U);
}

/** @test Derived timeout exceeds the budget. */
TEST(ScalingConfigTest, DerivedTimeout) {
  ScalingConfig cfg{};
  cfg.budgetSec = 2.0;
  EXPECT_GT(cfg.resolvedTimeoutSec(), cfg.budgetSec);
  cfg.timeoutSec = 0.5;
  EXPECT_DOUBLE_EQ(cfg.resolvedTimeoutSec(), 0.5);
}

/** @test Non-positive budget is invalid. */
TEST(ScalingConfigTest, Validation) {
  ScalingConfig cfg{};
  EXPECT_TRUE(cfg.isValid());
  cfg.budgetSec = 0.0;
  EXPECT_FALSE(cfg.isValid());
}

/* ----------------------------- runScaled ----------------------------- */

/** @test Four workers of a constant probe aggregate to 4x the value. */
TEST(RunScaledTest, FourWorkersConstant) {
  const ScalingResult R = runScaled(constantProbe(250.0), makeConfig(4, 0.03));
  ASSERT_EQ(R.status, HarnessStatus::OK);
  ASSERT_EQ(R.workers, 4U);
  ASSERT_EQ(R.perWorker.size(), 4U);
  for (const double V : R.perWorker) {
    EXPECT_DOUBLE_EQ(V, 250.0);
  }
  EXPECT_DOUBLE_EQ(R.aggregateThroughput, 1000.0);
  EXPECT_TRUE(R.success());
}

/** @test Warm-up results never reach the aggregate. */
TEST(RunScaledTest, WarmupDiscarded) {
  constexpr std::size_t N = 3;
  auto calls = std::make_shared<std::atomic<std::size_t>>(0);
  const Probe P = makeProbe("w", "W", "u", Direction::HIGHER_IS_BETTER, [calls] {
    const std::size_t IDX = calls->fetch_add(1);
    std::this_thread::sleep_for(std::chrono::microseconds(100));
    return (IDX < N) ? 1'000'000.0 : 2.0;
  });

  ScalingConfig cfg = makeConfig(N, 0.02);
  cfg.warmup = true;
  const ScalingResult R = runScaled(P, cfg);
  ASSERT_EQ(R.status, HarnessStatus::OK);
  EXPECT_DOUBLE_EQ(R.aggregateThroughput, 2.0 * N);
}

/** @test A stalled probe yields TIMED_OUT with zero aggregate. */
TEST(RunScaledTest, TimeoutFailsRun) {
  const Probe P = makeProbe("slow", "Slow", "u", Direction::HIGHER_IS_BETTER, [] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return 1.0;
  });

  ScalingConfig cfg = makeConfig(2, 0.01);
  cfg.warmup = false;
  cfg.timeoutSec = 0.05;
  const ScalingResult R = runScaled(P, cfg);
  EXPECT_TRUE(R.timedOut());
  EXPECT_EQ(R.aggregateThroughput, 0.0);
  EXPECT_TRUE(R.perWorker.empty());
  EXPECT_FALSE(R.success());

  // Let detached workers drain.
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
}

/** @test An out-of-range budget still yields a bounded, timed-out run. */
TEST(RunScaledTest, HugeBudgetTimesOut) {
  const Probe P = makeProbe("slow", "Slow", "u", Direction::HIGHER_IS_BETTER, [] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return 1.0;
  });

  ScalingConfig cfg = makeConfig(2, 1.0e11);
  cfg.warmup = true;
  cfg.timeoutSec = 0.05;
  ASSERT_TRUE(cfg.isValid());
  const ScalingResult R = runScaled(P, cfg);
  EXPECT_TRUE(R.timedOut());
  EXPECT_LT(R.elapsedNs, 250'000'000ULL);

  // Workers finish warm-up, see the run abandoned and exit.
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
}

/** @test All-failing probe completes with zero aggregate. */
TEST(RunScaledTest, FailingProbe) {
  const Probe P = makeProbe("f", "F", "u", Direction::HIGHER_IS_BETTER, [] { return 0.0; });
  const ScalingResult R = runScaled(P, makeConfig(2, 0.01));
  EXPECT_EQ(R.status, HarnessStatus::OK);
  EXPECT_EQ(R.aggregateThroughput, 0.0);
  EXPECT_FALSE(R.success());
}

/** @test Invalid probe is rejected without spawning. */
TEST(RunScaledTest, InvalidProbe) {
  const ScalingResult R = runScaled(Probe{}, makeConfig(2, 0.01));
  EXPECT_EQ(R.status, HarnessStatus::INVALID_ARGUMENT);
  EXPECT_EQ(R.workers, 0U);
}

/** @test Status strings. */
TEST(RunScaledTest, StatusStrings) {
  EXPECT_STREQ(yardstick::engine::toString(HarnessStatus::OK), "ok");
  EXPECT_STREQ(yardstick::engine::toString(HarnessStatus::TIMED_OUT), "timed out");
}
