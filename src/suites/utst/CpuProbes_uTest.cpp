/**
 * @file CpuProbes_uTest.cpp
 * @brief Unit tests for yardstick::suites CPU payloads.
 *
 * Notes:
 *  - Payload rates are machine dependent; tests only check they are positive.
 *  - Helpers (FNV-1a, RLE) are checked against known outputs.
 */

#include "src/suites/inc/CpuProbes.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using yardstick::probe::Direction;
using yardstick::suites::compressionMbps;
using yardstick::suites::cpuMultiProbes;
using yardstick::suites::cpuSingleProbes;
using yardstick::suites::floatMathMops;
using yardstick::suites::fnv1a;
using yardstick::suites::hashMbps;
using yardstick::suites::integerMathMops;
using yardstick::suites::rleEncode;
using yardstick::suites::simdFmaGflops;

/* ----------------------------- Payloads ----------------------------- */

/** @test Small invocations report positive rates. */
TEST(CpuPayloadTest, PositiveRates) {
  EXPECT_GT(integerMathMops(100'000), 0.0);
  EXPECT_GT(floatMathMops(100'000), 0.0);
  EXPECT_GT(simdFmaGflops(1024, 16), 0.0);
  EXPECT_GT(hashMbps(256 * 1024), 0.0);
  EXPECT_GT(compressionMbps(256 * 1024), 0.0);
}

/** @test Zero work is a failed measurement. */
TEST(CpuPayloadTest, ZeroWorkFails) {
  EXPECT_EQ(integerMathMops(0), 0.0);
  EXPECT_EQ(floatMathMops(0), 0.0);
  EXPECT_EQ(simdFmaGflops(0, 16), 0.0);
  EXPECT_EQ(hashMbps(0), 0.0);
  EXPECT_EQ(compressionMbps(0), 0.0);
}

/* ----------------------------- Helpers ----------------------------- */

/** @test FNV-1a matches published 64-bit vectors. */
TEST(CpuHelperTest, Fnv1aVectors) {
  EXPECT_EQ(fnv1a(nullptr, 0), 0xcbf29ce484222325ULL);
  const auto* A = reinterpret_cast<const std::uint8_t*>("a");
  EXPECT_EQ(fnv1a(A, 1), 0xaf63dc4c8601ec8cULL);
}

/** @test RLE emits (count, byte) pairs and splits runs at 255. */
TEST(CpuHelperTest, RleRuns) {
  std::vector<std::uint8_t> out;
  const std::uint8_t IN[] = {7, 7, 7, 1, 2, 2};
  EXPECT_EQ(rleEncode(IN, sizeof(IN), out), 6U);
  const std::vector<std::uint8_t> EXPECTED{3, 7, 1, 1, 2, 2};
  EXPECT_EQ(out, EXPECTED);

  std::vector<std::uint8_t> longRun(300, 9);
  EXPECT_EQ(rleEncode(longRun.data(), longRun.size(), out), 4U);
  EXPECT_EQ(out[0], 255);
  EXPECT_EQ(out[2], 45);

  EXPECT_EQ(rleEncode(nullptr, 10, out), 0U);
  EXPECT_TRUE(out.empty());
}

/* ----------------------------- Probe Sets ----------------------------- */

/** @test Single-core keys match the baseline table in display order. */
TEST(CpuProbeSetTest, SingleKeys) {
  const auto PROBES = cpuSingleProbes();
  ASSERT_EQ(PROBES.size(), 5U);
  EXPECT_EQ(PROBES[0].key, "integer");
  EXPECT_EQ(PROBES[1].key, "float");
  EXPECT_EQ(PROBES[2].key, "simd");
  EXPECT_EQ(PROBES[3].key, "hash");
  EXPECT_EQ(PROBES[4].key, "compression");
  for (const auto& P : PROBES) {
    EXPECT_TRUE(P.isValid());
    EXPECT_EQ(P.direction, Direction::HIGHER_IS_BETTER);
  }
}

/** @test Multi-core probes reuse the payloads under suffixed keys. */
TEST(CpuProbeSetTest, MultiKeys) {
  const auto SINGLE = cpuSingleProbes();
  const auto MULTI = cpuMultiProbes();
  ASSERT_EQ(MULTI.size(), SINGLE.size());
  for (std::size_t i = 0; i < MULTI.size(); ++i) {
    EXPECT_EQ(MULTI[i].key, SINGLE[i].key + "_multi");
    EXPECT_EQ(MULTI[i].unit, SINGLE[i].unit);
    EXPECT_NE(MULTI[i].label.find("(multi)"), std::string::npos);
  }
}

/** @test The integer probe invokes successfully. */
TEST(CpuProbeSetTest, InvokeInteger) {
  const auto OUTCOME = cpuSingleProbes().front().invoke();
  EXPECT_TRUE(OUTCOME.ok());
  EXPECT_GT(OUTCOME.value, 0.0);
}
