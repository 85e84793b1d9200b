/**
 * @file ScalingSweep_uTest.cpp
 * @brief Unit tests for efficiency and scaling-cliff inference.
 *
 * Notes:
 *  - Inference tests use synthetic series.
 *  - The live sweep uses at most two workers with millisecond budgets.
 */

#include "src/profiler/inc/ScalingSweep.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::profiler::computeEfficiency;
using yardstick::profiler::detectScalingCliff;
using yardstick::profiler::sweepWorkers;
using yardstick::profiler::workerCounts;
using yardstick::profiler::WorkerSeries;

/* ----------------------------- workerCounts ----------------------------- */

/** @test Dense and sparse worker counts. */
TEST(WorkerCountsTest, DenseAndSparse) {
  EXPECT_EQ(workerCounts(4, true), (std::vector<std::size_t>{1, 2, 3, 4}));
  EXPECT_EQ(workerCounts(6, false), (std::vector<std::size_t>{1, 2, 4, 6}));
  EXPECT_EQ(workerCounts(8, false), (std::vector<std::size_t>{1, 2, 4, 8}));
  EXPECT_EQ(workerCounts(1, false), (std::vector<std::size_t>{1}));
  EXPECT_TRUE(workerCounts(0, true).empty());
}

/* ----------------------------- Efficiency ----------------------------- */

/** @test Efficiency is relative to k * throughput(1). */
TEST(EfficiencyTest, Values) {
  const auto P = computeEfficiency(WorkerSeries{{1, 100.0}, {2, 180.0}, {4, 200.0}});
  ASSERT_TRUE(P.has_value());
  ASSERT_EQ(P->size(), 3U);
  EXPECT_DOUBLE_EQ((*P)[0].efficiencyPercent, 100.0);
  EXPECT_DOUBLE_EQ((*P)[1].efficiencyPercent, 90.0);
  EXPECT_DOUBLE_EQ((*P)[2].efficiencyPercent, 50.0);
}

/** @test No valid single-worker point omits the finding. */
TEST(EfficiencyTest, NeedsSingleWorker) {
  EXPECT_FALSE(computeEfficiency(WorkerSeries{{1, std::nullopt}, {2, 180.0}, {4, 200.0}}));
  EXPECT_FALSE(computeEfficiency(WorkerSeries{{1, 100.0}}));
}

/* ----------------------------- Cliff ----------------------------- */

/** @test Sustained drop below 70% from k=4 onward is a cliff at 4. */
TEST(ScalingCliffTest, SustainedCliff) {
  const WorkerSeries S{{1, 100.0}, {2, 196.0}, {3, 285.0}, {4, 240.0}, {5, 275.0}, {6, 300.0}};
  const auto R = detectScalingCliff(S);
  ASSERT_TRUE(R.has_value());
  ASSERT_TRUE(R->cliffWorkers.has_value());
  EXPECT_EQ(*R->cliffWorkers, 4U);
  EXPECT_NE(R->toString().find("cliff at 4 workers"), std::string::npos);
}

/** @test A transient dip that recovers is not a cliff. */
TEST(ScalingCliffTest, TransientDip) {
  const WorkerSeries S{{1, 100.0}, {2, 196.0}, {3, 150.0}, {4, 390.0}, {5, 480.0}};
  const auto R = detectScalingCliff(S);
  ASSERT_TRUE(R.has_value());
  EXPECT_FALSE(R->cliffWorkers.has_value());
  EXPECT_EQ(R->toString(), "no cliff detected (threshold 70%)");
}

/** @test Only the last point below threshold still counts as a cliff. */
TEST(ScalingCliffTest, LastPointOnly) {
  const WorkerSeries S{{1, 100.0}, {2, 190.0}, {4, 200.0}};
  const auto R = detectScalingCliff(S);
  ASSERT_TRUE(R.has_value());
  EXPECT_EQ(R->cliffWorkers, std::optional<std::size_t>(4));
}

/** @test Gaps are skipped when judging sustain. */
TEST(ScalingCliffTest, GapsSkipped) {
  const WorkerSeries S{{1, 100.0}, {2, 120.0}, {3, std::nullopt}, {4, 150.0}};
  const auto R = detectScalingCliff(S);
  ASSERT_TRUE(R.has_value());
  EXPECT_EQ(R->cliffWorkers, std::optional<std::size_t>(2));
  EXPECT_EQ(R->points.size(), 3U);
}

/** @test Custom thresholds are honored. */
TEST(ScalingCliffTest, CustomThreshold) {
  const WorkerSeries S{{1, 100.0}, {2, 180.0}, {4, 320.0}};
  EXPECT_FALSE(detectScalingCliff(S, 70.0)->cliffWorkers.has_value());
  EXPECT_EQ(detectScalingCliff(S, 85.0)->cliffWorkers, std::optional<std::size_t>(4));
}

/* ----------------------------- Sweep ----------------------------- */

/** @test Constant per-worker probe scales linearly through the harness. */
TEST(WorkerSweepTest, LinearProbe) {
  const auto P = makeProbe("lin", "lin", "u", Direction::HIGHER_IS_BETTER, [] { return 5.0; });
  const WorkerSeries S = sweepWorkers(P, {1, 2}, 0.01, 5.0);
  ASSERT_EQ(S.size(), 2U);
  ASSERT_TRUE(S[0].valid());
  ASSERT_TRUE(S[1].valid());
  EXPECT_DOUBLE_EQ(*S[0].throughput, 5.0);
  EXPECT_DOUBLE_EQ(*S[1].throughput, 10.0);
}

/** @test Failing probes yield gaps. */
TEST(WorkerSweepTest, FailingProbe) {
  const auto P = makeProbe("bad", "bad", "u", Direction::HIGHER_IS_BETTER, [] { return 0.0; });
  const WorkerSeries S = sweepWorkers(P, {1}, 0.005, 5.0);
  ASSERT_EQ(S.size(), 1U);
  EXPECT_FALSE(S[0].valid());
}
