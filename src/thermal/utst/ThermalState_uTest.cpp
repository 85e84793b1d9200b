/**
 * @file ThermalState_uTest.cpp
 * @brief Unit tests for yardstick::thermal reading and classification.
 *
 * Notes:
 *  - Classification is tested on synthetic readings.
 *  - readThermal() is tested against a fake sysfs tree under the temp directory.
 *  - The live-system test only checks structural invariants.
 */

#include "src/thermal/inc/ThermalState.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // getpid

#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/core.h>

namespace fs = std::filesystem;

using yardstick::thermal::classify;
using yardstick::thermal::classifySensor;
using yardstick::thermal::isThrottlingLevel;
using yardstick::thermal::readThermal;
using yardstick::thermal::SensorReading;
using yardstick::thermal::ThermalLevel;
using yardstick::thermal::ThermalReading;
using yardstick::thermal::worse;

namespace {

SensorReading sensor(double temp, double passive = 0.0, double critical = 0.0) {
  SensorReading s{};
  s.tempCelsius = temp;
  s.passiveTripCelsius = passive;
  s.criticalTripCelsius = critical;
  return s;
}

void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content << '\n';
}

/// Fake sysfs root removed on teardown.
class FakeSysfsTest : public ::testing::Test {
protected:
  fs::path root_{};

  void SetUp() override {
    std::error_code ec;
    const fs::path TMP = fs::temp_directory_path(ec);
    if (ec) {
      GTEST_SKIP() << "No temp directory";
    }
    root_ = TMP / fmt::format("yardstick_thermal_{}", static_cast<int>(::getpid()));
    fs::remove_all(root_, ec);
    fs::create_directories(root_, ec);
    if (ec) {
      GTEST_SKIP() << "Cannot create fake sysfs root";
    }
  }

  void TearDown() override {
    std::error_code ec;
    if (!root_.empty()) {
      fs::remove_all(root_, ec);
    }
  }
};

} // namespace

/* ----------------------------- Level Helpers ----------------------------- */

/** @test Throttling levels are SERIOUS and CRITICAL only. */
TEST(ThermalLevelTest, ThrottlingLevels) {
  EXPECT_FALSE(isThrottlingLevel(ThermalLevel::NOMINAL));
  EXPECT_FALSE(isThrottlingLevel(ThermalLevel::FAIR));
  EXPECT_TRUE(isThrottlingLevel(ThermalLevel::SERIOUS));
  EXPECT_TRUE(isThrottlingLevel(ThermalLevel::CRITICAL));
}

/** @test worse() picks the later level. */
TEST(ThermalLevelTest, Worse) {
  EXPECT_EQ(worse(ThermalLevel::FAIR, ThermalLevel::SERIOUS), ThermalLevel::SERIOUS);
  EXPECT_EQ(worse(ThermalLevel::CRITICAL, ThermalLevel::NOMINAL), ThermalLevel::CRITICAL);
}

/** @test Level names. */
TEST(ThermalLevelTest, Names) {
  EXPECT_STREQ(yardstick::thermal::toString(ThermalLevel::NOMINAL), "nominal");
  EXPECT_STREQ(yardstick::thermal::toString(ThermalLevel::CRITICAL), "critical");
}

/* ----------------------------- classifySensor ----------------------------- */

/** @test Fallback thresholds apply without trip data. */
TEST(ClassifySensorTest, FallbackThresholds) {
  EXPECT_EQ(classifySensor(sensor(45.0)), ThermalLevel::NOMINAL);
  EXPECT_EQ(classifySensor(sensor(80.0)), ThermalLevel::FAIR);
  EXPECT_EQ(classifySensor(sensor(90.0)), ThermalLevel::SERIOUS);
  EXPECT_EQ(classifySensor(sensor(100.0)), ThermalLevel::CRITICAL);
}

/** @test Trip points override fallbacks. */
TEST(ClassifySensorTest, TripPoints) {
  EXPECT_EQ(classifySensor(sensor(60.0, 75.0, 95.0)), ThermalLevel::NOMINAL);
  EXPECT_EQ(classifySensor(sensor(66.0, 75.0, 95.0)), ThermalLevel::FAIR);
  EXPECT_EQ(classifySensor(sensor(75.0, 75.0, 95.0)), ThermalLevel::SERIOUS);
  EXPECT_EQ(classifySensor(sensor(95.0, 75.0, 95.0)), ThermalLevel::CRITICAL);
}

/** @test A high passive trip keeps 92 C below SERIOUS. */
TEST(ClassifySensorTest, HighPassiveTrip) {
  EXPECT_EQ(classifySensor(sensor(92.0, 105.0, 110.0)), ThermalLevel::NOMINAL);
  EXPECT_EQ(classifySensor(sensor(96.0, 105.0, 110.0)), ThermalLevel::FAIR);
}

/* ----------------------------- classify ----------------------------- */

/** @test No readable sensor is nominal (fail-open). */
TEST(ClassifyTest, NoSensorIsNominal) {
  ThermalReading r{};
  r.hasThrottleCounters = true;
  r.throttleEvents = 50;
  EXPECT_EQ(classify(r, 0), ThermalLevel::NOMINAL);
}

/** @test Worst sensor wins. */
TEST(ClassifyTest, WorstSensor) {
  ThermalReading r{};
  r.sensors = {sensor(40.0), sensor(85.0), sensor(50.0)};
  EXPECT_EQ(classify(r, 0), ThermalLevel::FAIR);
}

/** @test Throttle counter increase raises to SERIOUS. */
TEST(ClassifyTest, ThrottleCounterIncrease) {
  ThermalReading r{};
  r.sensors = {sensor(50.0)};
  r.hasThrottleCounters = true;
  r.throttleEvents = 12;
  EXPECT_EQ(classify(r, 12), ThermalLevel::NOMINAL);
  EXPECT_EQ(classify(r, 10), ThermalLevel::SERIOUS);
}

/** @test Counter increase does not lower a CRITICAL reading. */
TEST(ClassifyTest, CounterDoesNotLower) {
  ThermalReading r{};
  r.sensors = {sensor(101.0)};
  r.hasThrottleCounters = true;
  r.throttleEvents = 5;
  EXPECT_EQ(classify(r, 0), ThermalLevel::CRITICAL);
}

/* ----------------------------- readThermal ----------------------------- */

/** @test Thermal zone temperature and trip points are parsed. */
TEST_F(FakeSysfsTest, ReadsThermalZone) {
  const fs::path ZONE = root_ / "sys/class/thermal/thermal_zone0";
  writeFile(ZONE / "temp", "71000");
  writeFile(ZONE / "trip_point_0_type", "passive");
  writeFile(ZONE / "trip_point_0_temp", "80000");
  writeFile(ZONE / "trip_point_1_type", "critical");
  writeFile(ZONE / "trip_point_1_temp", "105000");

  const ThermalReading R = readThermal(root_.string());
  ASSERT_EQ(R.sensors.size(), 1U);
  EXPECT_DOUBLE_EQ(R.sensors[0].tempCelsius, 71.0);
  EXPECT_DOUBLE_EQ(R.sensors[0].passiveTripCelsius, 80.0);
  EXPECT_DOUBLE_EQ(R.sensors[0].criticalTripCelsius, 105.0);
  EXPECT_EQ(classify(R, 0), ThermalLevel::FAIR);
}

/** @test hwmon inputs and throttle counters are read. */
TEST_F(FakeSysfsTest, ReadsHwmonAndCounters) {
  const fs::path HW = root_ / "sys/class/hwmon/hwmon0";
  writeFile(HW / "temp1_input", "45000");
  writeFile(HW / "temp1_crit", "100000");
  const fs::path CPU0 = root_ / "sys/devices/system/cpu/cpu0/thermal_throttle";
  writeFile(CPU0 / "package_throttle_count", "3");
  writeFile(CPU0 / "core_throttle_count", "4");

  const ThermalReading R = readThermal(root_.string());
  ASSERT_EQ(R.sensors.size(), 1U);
  EXPECT_DOUBLE_EQ(R.sensors[0].criticalTripCelsius, 100.0);
  EXPECT_TRUE(R.hasThrottleCounters);
  EXPECT_EQ(R.throttleEvents, 7U);
}

/** @test An empty tree yields an invalid reading. */
TEST_F(FakeSysfsTest, EmptyTree) {
  const ThermalReading R = readThermal(root_.string());
  EXPECT_FALSE(R.valid());
  EXPECT_EQ(classify(R, 0), ThermalLevel::NOMINAL);
}

/** @test Live system reading never reports negative temperatures. */
TEST(ReadThermalLiveTest, StructuralInvariants) {
  const ThermalReading R = readThermal();
  for (const SensorReading& S : R.sensors) {
    EXPECT_GT(S.tempCelsius, 0.0);
  }
  EXPECT_FALSE(R.toString().empty());
}
