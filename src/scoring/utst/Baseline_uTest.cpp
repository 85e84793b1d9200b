/**
 * @file Baseline_uTest.cpp
 * @brief Unit tests for yardstick::scoring::BaselineTable.
 *
 * Notes:
 *  - Reference values are checked only for presence and direction.
 */

#include "src/scoring/inc/Baseline.hpp"

#include <gtest/gtest.h>

#include <limits>

using yardstick::probe::Direction;
using yardstick::scoring::BaselineEntry;
using yardstick::scoring::BaselineTable;
using yardstick::scoring::referenceBaselines;

/* ----------------------------- BaselineTable ----------------------------- */

/** @test Lookup returns the stored entry; unknown keys are absent. */
TEST(BaselineTableTest, Lookup) {
  const BaselineTable T({{"a", {10.0, Direction::HIGHER_IS_BETTER}},
                         {"b", {5.0, Direction::LOWER_IS_BETTER}}},
                        4);
  ASSERT_TRUE(T.lookup("a").has_value());
  EXPECT_DOUBLE_EQ(T.lookup("a")->value, 10.0);
  EXPECT_EQ(T.lookup("b")->direction, Direction::LOWER_IS_BETTER);
  EXPECT_FALSE(T.lookup("c").has_value());
  EXPECT_EQ(T.size(), 2U);
  EXPECT_EQ(T.referenceCores(), 4U);
}

/** @test Non-positive and non-finite baselines are dropped. */
TEST(BaselineTableTest, DropsUnusableEntries) {
  const BaselineTable T({{"zero", {0.0, Direction::HIGHER_IS_BETTER}},
                         {"neg", {-3.0, Direction::HIGHER_IS_BETTER}},
                         {"nan", {std::numeric_limits<double>::quiet_NaN(),
                                  Direction::HIGHER_IS_BETTER}},
                         {"ok", {1.0, Direction::HIGHER_IS_BETTER}}},
                        8);
  EXPECT_EQ(T.size(), 1U);
  EXPECT_TRUE(T.lookup("ok").has_value());
  EXPECT_FALSE(T.lookup("zero").has_value());
}

/** @test Zero reference cores becomes one. */
TEST(BaselineTableTest, ReferenceCoresFloor) {
  const BaselineTable T({}, 0);
  EXPECT_EQ(T.referenceCores(), 1U);
}

/* ----------------------------- Reference Table ----------------------------- */

/** @test Every shipped metric key has a baseline. */
TEST(ReferenceBaselinesTest, CoversShippedKeys) {
  const BaselineTable T = referenceBaselines();
  for (const char* key :
       {"integer", "float", "simd", "hash", "compression", "integer_multi", "float_multi",
        "simd_multi", "hash_multi", "compression_multi", "mem_read", "mem_write", "mem_copy",
        "mem_latency", "disk_seq_write", "disk_seq_read", "disk_rand_write", "disk_rand_read",
        "gpu_compute", "gpu_particles", "gpu_blur", "gpu_edge"}) {
    EXPECT_TRUE(T.lookup(key).has_value()) << key;
  }
  EXPECT_EQ(T.referenceCores(), 8U);
}

/** @test Memory latency is the only lower-is-better metric. */
TEST(ReferenceBaselinesTest, LatencyDirection) {
  const BaselineTable T = referenceBaselines();
  EXPECT_EQ(T.lookup("mem_latency")->direction, Direction::LOWER_IS_BETTER);
  EXPECT_EQ(T.lookup("mem_read")->direction, Direction::HIGHER_IS_BETTER);
}
