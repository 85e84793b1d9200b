/**
 * @file Results_uTest.cpp
 * @brief Unit tests for yardstick::engine categories, selection and result helpers.
 */

#include "src/engine/inc/Results.hpp"

#include <gtest/gtest.h>

#include <string>

using yardstick::engine::ALL_CATEGORIES;
using yardstick::engine::Category;
using yardstick::engine::CategoryResult;
using yardstick::engine::CategorySelection;
using yardstick::engine::MetricResult;
using yardstick::engine::parseCategory;
using yardstick::engine::parseSelection;
using yardstick::engine::RunResults;
using yardstick::thermal::ThermalLevel;

namespace {

MetricResult metric(const char* key, double value) {
  MetricResult m{};
  m.key = key;
  m.unit = "u";
  m.value = value;
  return m;
}

} // namespace

/* ----------------------------- Category ----------------------------- */

/** @test Canonical names and aliases parse, case-insensitively. */
TEST(CategoryTest, ParseAliases) {
  EXPECT_EQ(parseCategory("cpu-single"), Category::CPU_SINGLE);
  EXPECT_EQ(parseCategory("CPUSingle"), Category::CPU_SINGLE);
  EXPECT_EQ(parseCategory("cpumulti"), Category::CPU_MULTI);
  EXPECT_EQ(parseCategory("RAM"), Category::MEMORY);
  EXPECT_EQ(parseCategory("storage"), Category::DISK);
  EXPECT_EQ(parseCategory("compute"), Category::GPU);
  EXPECT_FALSE(parseCategory("network").has_value());
}

/** @test Identifiers round-trip through parseCategory. */
TEST(CategoryTest, IdentifiersParse) {
  for (const Category C : ALL_CATEGORIES) {
    EXPECT_EQ(parseCategory(yardstick::engine::toString(C)), C);
  }
}

/* ----------------------------- Selection ----------------------------- */

/** @test Selection is reported in run order regardless of input order. */
TEST(SelectionTest, RunOrder) {
  const CategorySelection SEL = parseSelection("gpu, disk,cpu-single");
  EXPECT_EQ(SEL.size(), 3U);
  EXPECT_EQ(SEL.toString(), "cpu-single,disk,gpu");
}

/** @test Unknown names are ignored. */
TEST(SelectionTest, UnknownIgnored) {
  const CategorySelection SEL = parseSelection("memory,bogus");
  EXPECT_EQ(SEL.size(), 1U);
  EXPECT_TRUE(SEL.contains(Category::MEMORY));
}

/** @test Empty or all-unknown selection means every category. */
TEST(SelectionTest, EmptyMeansAll) {
  EXPECT_EQ(parseSelection("").size(), yardstick::engine::CATEGORY_COUNT);
  EXPECT_EQ(parseSelection("bogus,,").size(), yardstick::engine::CATEGORY_COUNT);
}

/* ----------------------------- MetricResult ----------------------------- */

/** @test Compact value formatting. */
TEST(MetricResultTest, FormattedValue) {
  EXPECT_EQ(metric("a", 2'500'000.0).formattedValue(), "2.50 M");
  EXPECT_EQ(metric("a", 1'500.0).formattedValue(), "1.50 K");
  EXPECT_EQ(metric("a", 0.5).formattedValue(), "0.5000");
  EXPECT_EQ(metric("a", 12.5).formattedValue(), "12.50");
  EXPECT_EQ(metric("a", 0.0).formattedValue(), "Failed");
}

/* ----------------------------- CategoryResult ----------------------------- */

/** @test Throttling flag follows start/end levels. */
TEST(CategoryResultTest, HadThrottling) {
  CategoryResult r{};
  EXPECT_FALSE(r.hadThrottling());
  r.thermalEnd = ThermalLevel::FAIR;
  EXPECT_FALSE(r.hadThrottling());
  r.thermalStart = ThermalLevel::SERIOUS;
  EXPECT_TRUE(r.hadThrottling());
}

/** @test allFailed is true for empty and all-zero categories only. */
TEST(CategoryResultTest, AllFailed) {
  CategoryResult r{};
  EXPECT_TRUE(r.allFailed());
  r.metrics = {metric("a", 0.0), metric("b", 0.0)};
  EXPECT_TRUE(r.allFailed());
  r.metrics.push_back(metric("c", 1.0));
  EXPECT_FALSE(r.allFailed());
  ASSERT_NE(r.find("c"), nullptr);
  EXPECT_EQ(r.find("z"), nullptr);
}

/* ----------------------------- RunResults ----------------------------- */

/** @test Run throttling considers categories and snapshots. */
TEST(RunResultsTest, HadAnyThrottling) {
  RunResults run{};
  EXPECT_FALSE(run.hadAnyThrottling());

  yardstick::thermal::ThermalSnapshot snap{};
  snap.level = ThermalLevel::CRITICAL;
  run.snapshots.push_back(snap);
  EXPECT_TRUE(run.hadAnyThrottling());
  EXPECT_EQ(run.find(Category::DISK), nullptr);
}
