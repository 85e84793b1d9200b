/**
 * @file Scoring_uTest.cpp
 * @brief Unit tests for yardstick::scoring category and total scores.
 *
 * Notes:
 *  - Results are built by hand; nothing is measured.
 *  - Small private baseline tables keep expected values exact.
 */

#include "src/scoring/inc/Scoring.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using yardstick::engine::Category;
using yardstick::engine::CategoryResult;
using yardstick::engine::MetricResult;
using yardstick::engine::RunResults;
using yardstick::probe::Direction;
using yardstick::scoring::BaselineEntry;
using yardstick::scoring::BaselineTable;
using yardstick::scoring::CategoryOutcome;
using yardstick::scoring::clampRatio;
using yardstick::scoring::metricRatio;
using yardstick::scoring::NotSelected;
using yardstick::scoring::policyFor;
using yardstick::scoring::Ran;
using yardstick::scoring::RanAndFailed;
using yardstick::scoring::ScoreCard;
using yardstick::scoring::scoreCategory;
using yardstick::scoring::scoreOf;
using yardstick::scoring::scoreRun;
using yardstick::scoring::ScoringContext;

namespace {

MetricResult metric(const char* key, double value) {
  MetricResult m{};
  m.key = key;
  m.label = key;
  m.value = value;
  m.samples = 1;
  return m;
}

CategoryResult category(Category c, std::vector<MetricResult> metrics) {
  CategoryResult r{};
  r.category = c;
  r.metrics = std::move(metrics);
  return r;
}

BaselineTable testBaselines() {
  constexpr Direction HIGHER = Direction::HIGHER_IS_BETTER;
  return BaselineTable({{"c1", {100.0, HIGHER}},
                        {"c2", {200.0, HIGHER}},
                        {"m1", {10.0, HIGHER}},
                        {"m2", {20.0, HIGHER}},
                        {"m3", {30.0, HIGHER}},
                        {"m4", {40.0, HIGHER}},
                        {"m5", {50.0, HIGHER}},
                        {"lat", {80.0, Direction::LOWER_IS_BETTER}},
                        {"d1", {100.0, HIGHER}},
                        {"d2", {100.0, HIGHER}},
                        {"g1", {100.0, HIGHER}}},
                       8);
}

} // namespace

/* ----------------------------- Ratios ----------------------------- */

/** @test Higher-is-better is v/b; lower-is-better is b/v. */
TEST(MetricRatioTest, Direction) {
  EXPECT_DOUBLE_EQ(*metricRatio(200.0, {100.0, Direction::HIGHER_IS_BETTER}), 2.0);
  EXPECT_DOUBLE_EQ(*metricRatio(40.0, {80.0, Direction::LOWER_IS_BETTER}), 2.0);
}

/** @test Failed values produce no ratio. */
TEST(MetricRatioTest, FailedValue) {
  EXPECT_FALSE(metricRatio(0.0, {100.0, Direction::HIGHER_IS_BETTER}).has_value());
  EXPECT_FALSE(metricRatio(-1.0, {100.0, Direction::HIGHER_IS_BETTER}).has_value());
  EXPECT_FALSE(metricRatio(std::nan(""), {100.0, Direction::LOWER_IS_BETTER}).has_value());
}

/** @test Baseline scale multiplies the denominator. */
TEST(MetricRatioTest, BaselineScale) {
  EXPECT_DOUBLE_EQ(*metricRatio(100.0, {100.0, Direction::HIGHER_IS_BETTER}, 0.5), 2.0);
  EXPECT_FALSE(metricRatio(100.0, {100.0, Direction::HIGHER_IS_BETTER}, 0.0).has_value());
}

/** @test Clamp bounds. */
TEST(MetricRatioTest, Clamp) {
  EXPECT_DOUBLE_EQ(clampRatio(100.0), 4.0);
  EXPECT_DOUBLE_EQ(clampRatio(0.01), 0.25);
  EXPECT_DOUBLE_EQ(clampRatio(1.5), 1.5);
}

/* ----------------------------- Policy ----------------------------- */

/** @test Weights sum to one; disk clamps; CPU multi scales. */
TEST(PolicyTest, Weights) {
  double sum = 0.0;
  for (const Category C : yardstick::engine::ALL_CATEGORIES) {
    sum += policyFor(C).weight;
  }
  EXPECT_NEAR(sum, 1.0, 1e-12);
  EXPECT_TRUE(policyFor(Category::DISK).clampRatios);
  EXPECT_FALSE(policyFor(Category::MEMORY).clampRatios);
  EXPECT_TRUE(policyFor(Category::CPU_MULTI).scaleByCoreCount);
  EXPECT_FALSE(policyFor(Category::CPU_SINGLE).scaleByCoreCount);
}

/* ----------------------------- scoreCategory ----------------------------- */

/** @test Values equal to their baselines score exactly 1000. */
TEST(ScoreCategoryTest, ReferenceScoresThousand) {
  const CategoryOutcome O = scoreCategory(
      category(Category::MEMORY, {metric("m1", 10.0), metric("m2", 20.0), metric("lat", 80.0)}),
      testBaselines(), ScoringContext{});
  ASSERT_TRUE(std::holds_alternative<Ran>(O));
  EXPECT_NEAR(scoreOf(O), 1000.0, 1e-9);
  EXPECT_EQ(std::get<Ran>(O).scoredMetrics, 3U);
}

/** @test Score is the geometric mean of ratios times 1000. */
TEST(ScoreCategoryTest, GeometricMean) {
  const CategoryOutcome O =
      scoreCategory(category(Category::CPU_SINGLE, {metric("c1", 400.0), metric("c2", 200.0)}),
                    testBaselines(), ScoringContext{});
  EXPECT_NEAR(scoreOf(O), 2000.0, 1e-9);
}

/** @test Scaling every value by k scales the score by k. */
TEST(ScoreCategoryTest, ScalesWithValues) {
  const BaselineTable T = testBaselines();
  const CategoryResult BASE =
      category(Category::CPU_SINGLE, {metric("c1", 137.0), metric("c2", 91.0)});
  CategoryResult scaled = BASE;
  for (MetricResult& m : scaled.metrics) {
    m.value *= 3.0;
  }
  const double S1 = scoreOf(scoreCategory(BASE, T, ScoringContext{}));
  const double S3 = scoreOf(scoreCategory(scaled, T, ScoringContext{}));
  EXPECT_NEAR(S3, 3.0 * S1, 1e-9 * S3);
}

/** @test Doubling one metric's value and its baseline leaves the score unchanged. */
TEST(ScoreCategoryTest, ValueAndBaselineDoubled) {
  constexpr Direction HIGHER = Direction::HIGHER_IS_BETTER;
  constexpr Direction LOWER = Direction::LOWER_IS_BETTER;
  const BaselineTable ORIGINAL(
      {{"m1", {10.0, HIGHER}}, {"m2", {20.0, HIGHER}}, {"lat", {80.0, LOWER}}}, 8);
  const BaselineTable DOUBLED_M1(
      {{"m1", {20.0, HIGHER}}, {"m2", {20.0, HIGHER}}, {"lat", {80.0, LOWER}}}, 8);
  const BaselineTable DOUBLED_LAT(
      {{"m1", {10.0, HIGHER}}, {"m2", {20.0, HIGHER}}, {"lat", {160.0, LOWER}}}, 8);

  const double REF = scoreOf(scoreCategory(
      category(Category::MEMORY, {metric("m1", 15.0), metric("m2", 30.0), metric("lat", 60.0)}),
      ORIGINAL, ScoringContext{}));
  const double M1 = scoreOf(scoreCategory(
      category(Category::MEMORY, {metric("m1", 30.0), metric("m2", 30.0), metric("lat", 60.0)}),
      DOUBLED_M1, ScoringContext{}));
  const double LAT = scoreOf(scoreCategory(
      category(Category::MEMORY, {metric("m1", 15.0), metric("m2", 30.0), metric("lat", 120.0)}),
      DOUBLED_LAT, ScoringContext{}));

  ASSERT_GT(REF, 0.0);
  EXPECT_NEAR(M1, REF, 1e-9 * REF);
  EXPECT_NEAR(LAT, REF, 1e-9 * REF);
}

/** @test A failed metric is excluded, not counted as zero. */
TEST(ScoreCategoryTest, FailedMetricExcluded) {
  const CategoryOutcome O = scoreCategory(
      category(Category::MEMORY, {metric("m1", 10.0), metric("m2", 20.0), metric("m3", 0.0),
                                  metric("m4", 40.0), metric("m5", 50.0)}),
      testBaselines(), ScoringContext{});
  ASSERT_TRUE(std::holds_alternative<Ran>(O));
  EXPECT_NEAR(scoreOf(O), 1000.0, 1e-9);
  EXPECT_EQ(std::get<Ran>(O).scoredMetrics, 4U);
}

/** @test Metrics without a baseline are excluded. */
TEST(ScoreCategoryTest, MissingBaselineExcluded) {
  const CategoryOutcome O = scoreCategory(
      category(Category::MEMORY, {metric("m1", 20.0), metric("unknown", 1.0e9)}),
      testBaselines(), ScoringContext{});
  EXPECT_NEAR(scoreOf(O), 2000.0, 1e-9);
}

/** @test Every metric failing yields RanAndFailed. */
TEST(ScoreCategoryTest, AllFailed) {
  const CategoryOutcome O =
      scoreCategory(category(Category::GPU, {metric("g1", 0.0)}), testBaselines(), ScoringContext{});
  EXPECT_TRUE(std::holds_alternative<RanAndFailed>(O));
  EXPECT_DOUBLE_EQ(scoreOf(O), 0.0);

  const CategoryOutcome EMPTY =
      scoreCategory(category(Category::GPU, {}), testBaselines(), ScoringContext{});
  EXPECT_TRUE(std::holds_alternative<RanAndFailed>(EMPTY));
}

/** @test Disk ratios are clamped to [0.25, 4]. */
TEST(ScoreCategoryTest, DiskClamp) {
  const CategoryOutcome HIGH =
      scoreCategory(category(Category::DISK, {metric("d1", 10000.0)}), testBaselines(),
                    ScoringContext{});
  EXPECT_NEAR(scoreOf(HIGH), 4000.0, 1e-9);

  const CategoryOutcome LOW = scoreCategory(category(Category::DISK, {metric("d1", 1.0)}),
                                            testBaselines(), ScoringContext{});
  EXPECT_NEAR(scoreOf(LOW), 250.0, 1e-9);
}

/** @test Memory ratios are not clamped. */
TEST(ScoreCategoryTest, NonDiskNotClamped) {
  const CategoryOutcome O = scoreCategory(category(Category::MEMORY, {metric("m1", 1000.0)}),
                                          testBaselines(), ScoringContext{});
  EXPECT_NEAR(scoreOf(O), 100000.0, 1e-6);
}

/** @test CPU multi baselines scale by actual / reference cores. */
TEST(ScoreCategoryTest, CoreCountScaling) {
  // Reference has 8 cores; a 4-core host matching half the baseline scores 1000.
  const CategoryOutcome O = scoreCategory(category(Category::CPU_MULTI, {metric("c1", 50.0)}),
                                          testBaselines(), ScoringContext{4});
  EXPECT_NEAR(scoreOf(O), 1000.0, 1e-9);

  const CategoryOutcome UNSCALED = scoreCategory(
      category(Category::CPU_MULTI, {metric("c1", 50.0)}), testBaselines(), ScoringContext{0});
  EXPECT_NEAR(scoreOf(UNSCALED), 500.0, 1e-9);

  const CategoryOutcome SINGLE = scoreCategory(
      category(Category::CPU_SINGLE, {metric("c1", 50.0)}), testBaselines(), ScoringContext{4});
  EXPECT_NEAR(scoreOf(SINGLE), 500.0, 1e-9);
}

/* ----------------------------- Total ----------------------------- */

/** @test Partial runs renormalize weights over the selected categories. */
TEST(TotalScoreTest, PartialRenormalization) {
  RunResults run{};
  run.categories.push_back(category(Category::MEMORY, {metric("m1", 20.0)})); // 2000
  run.categories.push_back(category(Category::DISK, {metric("d1", 100.0)}));  // 1000
  const ScoreCard CARD = scoreRun(run, testBaselines(), ScoringContext{});
  EXPECT_NEAR(CARD.total, (0.15 * 2000.0 + 0.15 * 1000.0) / 0.30, 1e-9);
  EXPECT_TRUE(std::holds_alternative<NotSelected>(CARD.outcome(Category::CPU_SINGLE)));
  EXPECT_TRUE(std::holds_alternative<NotSelected>(CARD.outcome(Category::GPU)));
  EXPECT_TRUE(CARD.anyRan());
}

/** @test A failed category pulls the total down with its weight. */
TEST(TotalScoreTest, FailedCategoryCountsAsZero) {
  RunResults run{};
  run.categories.push_back(category(Category::CPU_SINGLE, {metric("c1", 100.0)})); // 1000
  run.categories.push_back(category(Category::GPU, {metric("g1", 0.0)}));          // failed
  const ScoreCard CARD = scoreRun(run, testBaselines(), ScoringContext{});
  EXPECT_NEAR(CARD.total, (0.25 * 1000.0) / (0.25 + 0.20), 1e-9);
  EXPECT_TRUE(std::holds_alternative<RanAndFailed>(CARD.outcome(Category::GPU)));
}

/** @test Nothing ran means a zero total. */
TEST(TotalScoreTest, NothingRan) {
  const ScoreCard CARD = scoreRun(RunResults{}, testBaselines(), ScoringContext{});
  EXPECT_DOUBLE_EQ(CARD.total, 0.0);
  EXPECT_FALSE(CARD.anyRan());
}

/** @test Outcome strings distinguish scores, failures and unselected categories. */
TEST(TotalScoreTest, OutcomeStrings) {
  EXPECT_EQ(yardstick::scoring::toString(CategoryOutcome{Ran{1234.4, 2}}), "1234");
  EXPECT_EQ(yardstick::scoring::toString(CategoryOutcome{RanAndFailed{}}), "Failed");
  EXPECT_EQ(yardstick::scoring::toString(CategoryOutcome{NotSelected{}}), "not run");
}

/** @test Score card text lists every category and the total. */
TEST(TotalScoreTest, CardText) {
  RunResults run{};
  run.categories.push_back(category(Category::MEMORY, {metric("m1", 10.0)}));
  const std::string TEXT = scoreRun(run, testBaselines(), ScoringContext{}).toString();
  EXPECT_NE(TEXT.find("Memory"), std::string::npos);
  EXPECT_NE(TEXT.find("not run"), std::string::npos);
  EXPECT_NE(TEXT.find("TOTAL"), std::string::npos);
}
