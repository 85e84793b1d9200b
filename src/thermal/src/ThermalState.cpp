/**
 * @file ThermalState.cpp
 * @brief sysfs thermal collection and level classification.
 * @note Reads thermal zones with trip points, hwmon temp inputs with max/crit,
 *       and Intel thermal_throttle counters when present.
 */

#include "src/thermal/inc/ThermalState.hpp"

#include <filesystem> // std::filesystem
#include <fstream>    // std::ifstream

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace yardstick {

namespace thermal {

namespace {

/// Read first line of a text file; empty on failure.
inline std::string readLine(const fs::path& path) noexcept {
  std::ifstream file(path);
  if (!file) {
    return {};
  }
  std::string line;
  std::getline(file, line);
  return line;
}

/// Read millidegrees Celsius; convert to degrees. 0 on failure.
inline double readMilliCelsius(const fs::path& path) noexcept {
  std::ifstream file(path);
  if (!file) {
    return 0.0;
  }
  long value = 0;
  file >> value;
  return file ? static_cast<double>(value) / 1000.0 : 0.0;
}

/// Read a non-negative counter. 0 on failure.
inline std::uint64_t readCounter(const fs::path& path, bool& found) noexcept {
  std::ifstream file(path);
  if (!file) {
    return 0;
  }
  unsigned long long count = 0;
  file >> count;
  if (!file) {
    return 0;
  }
  found = true;
  return static_cast<std::uint64_t>(count);
}

inline bool pathExists(const fs::path& path) noexcept {
  std::error_code ec;
  return fs::exists(path, ec);
}

/// Keep the lowest positive trip.
inline void lowerTrip(double& current, double candidate) noexcept {
  if (candidate > 0.0 && (current <= 0.0 || candidate < current)) {
    current = candidate;
  }
}

void readThermalZones(const fs::path& root, ThermalReading& out) noexcept {
  std::error_code ec;
  for (const auto& ENTRY : fs::directory_iterator(root, ec)) {
    if (out.sensors.size() >= static_cast<std::size_t>(MAX_ZONES)) {
      break;
    }
    const std::string BASE = ENTRY.path().filename().string();
    if (BASE.rfind("thermal_zone", 0) != 0) {
      continue;
    }

    SensorReading sensor{};
    sensor.tempCelsius = readMilliCelsius(ENTRY.path() / "temp");
    if (sensor.tempCelsius <= 0.0) {
      continue;
    }

    for (int trip = 0; trip < 16; ++trip) {
      const fs::path TYPE_PATH = ENTRY.path() / fmt::format("trip_point_{}_type", trip);
      if (!pathExists(TYPE_PATH)) {
        break;
      }
      const std::string TYPE = readLine(TYPE_PATH);
      const double TEMP =
          readMilliCelsius(ENTRY.path() / fmt::format("trip_point_{}_temp", trip));
      if (TYPE == "critical") {
        lowerTrip(sensor.criticalTripCelsius, TEMP);
      } else if (TYPE == "passive" || TYPE == "hot") {
        lowerTrip(sensor.passiveTripCelsius, TEMP);
      }
    }
    out.sensors.push_back(sensor);
  }
}

void readHwmon(const fs::path& root, ThermalReading& out) noexcept {
  std::error_code ec;
  for (const auto& ENTRY : fs::directory_iterator(root, ec)) {
    const fs::path DEV = ENTRY.path();
    for (int idx = 1; idx <= 32; ++idx) {
      if (out.sensors.size() >= static_cast<std::size_t>(MAX_ZONES)) {
        return;
      }
      const fs::path INPUT = DEV / fmt::format("temp{}_input", idx);
      if (!pathExists(INPUT)) {
        continue;
      }
      SensorReading sensor{};
      sensor.tempCelsius = readMilliCelsius(INPUT);
      if (sensor.tempCelsius <= 0.0) {
        continue;
      }
      sensor.passiveTripCelsius = readMilliCelsius(DEV / fmt::format("temp{}_max", idx));
      sensor.criticalTripCelsius = readMilliCelsius(DEV / fmt::format("temp{}_crit", idx));
      out.sensors.push_back(sensor);
    }
  }
}

void readThrottleCounters(const fs::path& root, ThermalReading& out) noexcept {
  std::error_code ec;
  for (const auto& ENTRY : fs::directory_iterator(root, ec)) {
    const std::string NAME = ENTRY.path().filename().string();
    if (NAME.rfind("cpu", 0) != 0 || NAME == "cpufreq" || NAME == "cpuidle") {
      continue;
    }
    const fs::path DIR = ENTRY.path() / "thermal_throttle";
    out.throttleEvents += readCounter(DIR / "package_throttle_count", out.hasThrottleCounters);
    out.throttleEvents += readCounter(DIR / "core_throttle_count", out.hasThrottleCounters);
  }
}

} // namespace

/* ----------------------------- ThermalLevel ----------------------------- */

const char* toString(ThermalLevel level) noexcept {
  switch (level) {
  case ThermalLevel::NOMINAL:
    return "nominal";
  case ThermalLevel::FAIR:
    return "fair";
  case ThermalLevel::SERIOUS:
    return "serious";
  case ThermalLevel::CRITICAL:
    return "critical";
  }
  return "unknown";
}

const char* describe(ThermalLevel level) noexcept {
  switch (level) {
  case ThermalLevel::NOMINAL:
    return "Normal - no throttling";
  case ThermalLevel::FAIR:
    return "Warm - minor throttling possible";
  case ThermalLevel::SERIOUS:
    return "Hot - significant throttling";
  case ThermalLevel::CRITICAL:
    return "Critical - severe throttling";
  }
  return "Unknown";
}

/* ----------------------------- ThermalReading ----------------------------- */

double ThermalReading::maxTempCelsius() const noexcept {
  double hottest = 0.0;
  for (const SensorReading& S : sensors) {
    if (S.tempCelsius > hottest) {
      hottest = S.tempCelsius;
    }
  }
  return hottest;
}

std::string ThermalReading::toString() const {
  if (!valid()) {
    return "no thermal sensors";
  }
  return fmt::format("{} sensor(s), max {:.1f} C, throttle events {}", sensors.size(),
                     maxTempCelsius(), hasThrottleCounters ? fmt::format("{}", throttleEvents)
                                                           : std::string("n/a"));
}

/* ----------------------------- API ----------------------------- */

ThermalReading readThermal(const std::string& sysRoot) noexcept {
  ThermalReading reading{};
  const fs::path ROOT{sysRoot.empty() ? std::string("/") : sysRoot};
  readThermalZones(ROOT / "sys/class/thermal", reading);
  readHwmon(ROOT / "sys/class/hwmon", reading);
  readThrottleCounters(ROOT / "sys/devices/system/cpu", reading);
  return reading;
}

ThermalLevel classifySensor(const SensorReading& sensor) noexcept {
  const double T = sensor.tempCelsius;
  if (T <= 0.0) {
    return ThermalLevel::NOMINAL;
  }

  const double CRITICAL =
      (sensor.criticalTripCelsius > 0.0) ? sensor.criticalTripCelsius : FALLBACK_CRITICAL_C;
  if (T >= CRITICAL) {
    return ThermalLevel::CRITICAL;
  }

  if (sensor.passiveTripCelsius > 0.0) {
    if (T >= sensor.passiveTripCelsius) {
      return ThermalLevel::SERIOUS;
    }
    if (T >= sensor.passiveTripCelsius - FAIR_MARGIN_C) {
      return ThermalLevel::FAIR;
    }
    return ThermalLevel::NOMINAL;
  }

  if (T >= FALLBACK_SERIOUS_C) {
    return ThermalLevel::SERIOUS;
  }
  if (T >= FALLBACK_FAIR_C) {
    return ThermalLevel::FAIR;
  }
  return ThermalLevel::NOMINAL;
}

ThermalLevel classify(const ThermalReading& reading,
                      std::uint64_t baselineThrottleEvents) noexcept {
  ThermalLevel level = ThermalLevel::NOMINAL;
  if (!reading.valid()) {
    return level;
  }
  for (const SensorReading& S : reading.sensors) {
    level = worse(level, classifySensor(S));
  }
  if (reading.hasThrottleCounters && reading.throttleEvents > baselineThrottleEvents) {
    level = worse(level, ThermalLevel::SERIOUS);
  }
  return level;
}

} // namespace thermal

} // namespace yardstick
