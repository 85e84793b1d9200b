/**
 * @file ThermalSupervisor_uTest.cpp
 * @brief Unit tests for yardstick::thermal::ThermalSupervisor.
 *
 * Notes:
 *  - Uses a scripted source so levels are deterministic.
 */

#include "src/thermal/inc/ThermalSupervisor.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

using yardstick::thermal::SensorReading;
using yardstick::thermal::ThermalLevel;
using yardstick::thermal::ThermalReading;
using yardstick::thermal::ThermalSnapshot;
using yardstick::thermal::ThermalSupervisor;

namespace {

ThermalReading readingAt(double tempC) {
  ThermalReading r{};
  SensorReading s{};
  s.tempCelsius = tempC;
  r.sensors.push_back(s);
  return r;
}

/// Source that returns the scripted temperatures in order, repeating the last.
class ScriptedSource {
public:
  explicit ScriptedSource(std::vector<double> temps)
      : temps_(std::make_shared<std::vector<double>>(std::move(temps))),
        pos_(std::make_shared<std::size_t>(0)) {}

  ThermalReading operator()() const {
    const std::size_t IDX = (*pos_ < temps_->size()) ? (*pos_)++ : temps_->size() - 1;
    return readingAt((*temps_)[IDX]);
  }

private:
  std::shared_ptr<std::vector<double>> temps_;
  std::shared_ptr<std::size_t> pos_;
};

} // namespace

/* ----------------------------- Snapshots ----------------------------- */

/** @test Snapshots are kept in recording order with their labels. */
TEST(ThermalSupervisorTest, SnapshotOrder) {
  // First reading is consumed by the constructor baseline.
  ThermalSupervisor sup(ScriptedSource({40.0, 40.0, 85.0, 92.0, 50.0}));
  sup.record("start");
  sup.record("before_memory");
  sup.record("after_memory");
  sup.record("end");

  const auto& SNAPS = sup.snapshots();
  ASSERT_EQ(SNAPS.size(), 4U);
  EXPECT_STREQ(SNAPS[0].phase.data(), "start");
  EXPECT_STREQ(SNAPS[1].phase.data(), "before_memory");
  EXPECT_STREQ(SNAPS[2].phase.data(), "after_memory");
  EXPECT_STREQ(SNAPS[3].phase.data(), "end");
  EXPECT_EQ(SNAPS[0].level, ThermalLevel::NOMINAL);
  EXPECT_EQ(SNAPS[1].level, ThermalLevel::FAIR);
  EXPECT_EQ(SNAPS[2].level, ThermalLevel::SERIOUS);
  EXPECT_EQ(SNAPS[3].level, ThermalLevel::NOMINAL);
  for (std::size_t i = 1; i < SNAPS.size(); ++i) {
    EXPECT_GE(SNAPS[i].timestampMs, SNAPS[i - 1].timestampMs);
  }
}

/** @test Start, end and worst levels. */
TEST(ThermalSupervisorTest, StartEndWorst) {
  ThermalSupervisor sup(ScriptedSource({40.0, 40.0, 101.0, 82.0}));
  sup.record("start");
  sup.record("mid");
  sup.record("end");
  EXPECT_EQ(sup.startLevel(), ThermalLevel::NOMINAL);
  EXPECT_EQ(sup.endLevel(), ThermalLevel::FAIR);
  EXPECT_EQ(sup.worstLevel(), ThermalLevel::CRITICAL);
  EXPECT_TRUE(sup.hadThrottling());
  EXPECT_EQ(sup.summary(), "nominal -> fair (throttling detected)");
}

/** @test Summary without throttling. */
TEST(ThermalSupervisorTest, SummaryNoThrottling) {
  ThermalSupervisor sup(ScriptedSource({40.0, 40.0, 85.0}));
  sup.record("start");
  sup.record("end");
  EXPECT_FALSE(sup.hadThrottling());
  EXPECT_EQ(sup.summary(), "nominal -> fair");
}

/** @test Empty log reports no data. */
TEST(ThermalSupervisorTest, EmptyLog) {
  ThermalSupervisor sup(ScriptedSource({40.0}));
  EXPECT_TRUE(sup.snapshots().empty());
  EXPECT_EQ(sup.worstLevel(), ThermalLevel::NOMINAL);
  EXPECT_EQ(sup.summary(), "no thermal data");
}

/** @test Long phase labels are truncated and terminated. */
TEST(ThermalSupervisorTest, LongPhaseTruncated) {
  ThermalSupervisor sup(ScriptedSource({40.0}));
  const std::string LONG(200, 'x');
  const ThermalSnapshot& S = sup.record(LONG);
  EXPECT_EQ(std::string(S.phase.data()).size(), yardstick::thermal::PHASE_LABEL_SIZE - 1);
}

/* ----------------------------- Fail-open ----------------------------- */

/** @test A throwing source reads as nominal. */
TEST(ThermalSupervisorTest, ThrowingSourceIsNominal) {
  ThermalSupervisor sup([]() -> ThermalReading { throw std::runtime_error("no sysfs"); });
  EXPECT_EQ(sup.currentLevel(), ThermalLevel::NOMINAL);
  EXPECT_FALSE(sup.isThrottling());
  EXPECT_EQ(sup.record("start").level, ThermalLevel::NOMINAL);
}

/** @test A source throwing a non-standard type reads as nominal. */
TEST(ThermalSupervisorTest, NonStandardThrowIsNominal) {
  ThermalSupervisor sup([]() -> ThermalReading { throw 7; });
  EXPECT_EQ(sup.currentLevel(), ThermalLevel::NOMINAL);
  EXPECT_FALSE(sup.isThrottling());
  EXPECT_EQ(sup.record("start").level, ThermalLevel::NOMINAL);
  EXPECT_EQ(sup.worstLevel(), ThermalLevel::NOMINAL);
}

/** @test An empty source function reads as nominal. */
TEST(ThermalSupervisorTest, EmptySourceIsNominal) {
  ThermalSupervisor sup(yardstick::thermal::ThermalSource{});
  EXPECT_EQ(sup.currentLevel(), ThermalLevel::NOMINAL);
}

/* ----------------------------- Throttle Baseline ----------------------------- */

/** @test Counters present at construction are not throttling; increases are. */
TEST(ThermalSupervisorTest, ThrottleBaseline) {
  auto events = std::make_shared<std::uint64_t>(100);
  ThermalSupervisor sup([events] {
    ThermalReading r = readingAt(50.0);
    r.hasThrottleCounters = true;
    r.throttleEvents = *events;
    return r;
  });
  EXPECT_FALSE(sup.isThrottling());
  *events = 101;
  EXPECT_TRUE(sup.isThrottling());
  EXPECT_EQ(sup.currentLevel(), ThermalLevel::SERIOUS);
}

/** @test Live supervisor never fails to produce a level. */
TEST(ThermalSupervisorTest, LiveSystem) {
  ThermalSupervisor sup;
  const ThermalSnapshot& S = sup.record("start");
  EXPECT_LE(static_cast<int>(S.level), static_cast<int>(ThermalLevel::CRITICAL));
  EXPECT_FALSE(sup.summary().empty());
}
