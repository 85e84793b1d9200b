#ifndef YARDSTICK_THERMAL_THERMAL_STATE_HPP
#define YARDSTICK_THERMAL_THERMAL_STATE_HPP
/**
 * @file ThermalState.hpp
 * @brief Coarse thermal level derived from sysfs sensors and throttle counters.
 * @note Linux-only. Reads /sys/class/thermal, /sys/class/hwmon and
 *       /sys/devices/system/cpu/cpu{N}/thermal_throttle.
 *
 * Reading and classification are separate so the level table can be tested
 * against synthetic readings or a fake sysfs tree.
 *
 * Classification (worst over all sensors):
 *  - no readable sensor                                         -> NOMINAL
 *  - temp >= critical trip (>= 100 C without trip data)         -> CRITICAL
 *  - throttle counters increased since baseline, or
 *    temp >= passive/hot trip (>= 90 C without trip data)       -> SERIOUS
 *  - temp within 10 C of the passive trip (>= 80 C without)     -> FAIR
 *  - otherwise                                                  -> NOMINAL
 */

#include <cstdint>
#include <string>
#include <vector>

namespace yardstick {

namespace thermal {

/* ----------------------------- Constants ----------------------------- */

/// Fallback thresholds when a sensor exposes no trip points (Celsius).
inline constexpr double FALLBACK_CRITICAL_C = 100.0;
inline constexpr double FALLBACK_SERIOUS_C = 90.0;
inline constexpr double FALLBACK_FAIR_C = 80.0;

/// FAIR band below the passive trip (Celsius).
inline constexpr double FAIR_MARGIN_C = 10.0;

/// Maximum thermal zones / hwmon inputs scanned.
inline constexpr int MAX_ZONES = 64;

/* ----------------------------- ThermalLevel ----------------------------- */

/**
 * @brief Ordered thermal level; later values are worse.
 */
enum class ThermalLevel : std::uint8_t {
  NOMINAL = 0,
  FAIR,
  SERIOUS,
  CRITICAL,
};

/// Short name ("nominal", "fair", "serious", "critical").
[[nodiscard]] const char* toString(ThermalLevel level) noexcept;

/// Longer description ("Warm - minor throttling possible").
[[nodiscard]] const char* describe(ThermalLevel level) noexcept;

/// SERIOUS or CRITICAL.
[[nodiscard]] constexpr bool isThrottlingLevel(ThermalLevel level) noexcept {
  return level == ThermalLevel::SERIOUS || level == ThermalLevel::CRITICAL;
}

/// Worse of two levels.
[[nodiscard]] constexpr ThermalLevel worse(ThermalLevel a, ThermalLevel b) noexcept {
  return (static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b)) ? a : b;
}

/* ----------------------------- SensorReading ----------------------------- */

/**
 * @brief One temperature input with its trip points (0 = not exposed).
 */
struct SensorReading {
  double tempCelsius{0.0};
  double passiveTripCelsius{0.0}; ///< Lowest passive/hot trip, or hwmon max
  double criticalTripCelsius{0.0}; ///< Lowest critical trip, or hwmon crit
};

/* ----------------------------- ThermalReading ----------------------------- */

/**
 * @brief Raw thermal inputs at one instant.
 */
struct ThermalReading {
  std::vector<SensorReading> sensors{};
  std::uint64_t throttleEvents{0}; ///< Sum of package+core throttle counters
  bool hasThrottleCounters{false};

  /// At least one sensor was readable.
  [[nodiscard]] bool valid() const noexcept { return !sensors.empty(); }

  /// Hottest sensor (0 when none).
  [[nodiscard]] double maxTempCelsius() const noexcept;

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Read all thermal inputs.
 * @param sysRoot Prefix prepended to every sysfs path ("" for the live system).
 * @return Reading; sensors is empty when nothing is readable.
 * @note NOT RT-safe: Directory iteration and file I/O.
 */
[[nodiscard]] ThermalReading readThermal(const std::string& sysRoot = "") noexcept;

/// Level of one sensor from its temperature and trip points.
[[nodiscard]] ThermalLevel classifySensor(const SensorReading& sensor) noexcept;

/**
 * @brief Classify a reading.
 * @param reading Current reading.
 * @param baselineThrottleEvents Counter total captured when supervision started.
 */
[[nodiscard]] ThermalLevel classify(const ThermalReading& reading,
                                    std::uint64_t baselineThrottleEvents) noexcept;

} // namespace thermal

} // namespace yardstick

#endif // YARDSTICK_THERMAL_THERMAL_STATE_HPP
