#ifndef YARDSTICK_THERMAL_THERMAL_SUPERVISOR_HPP
#define YARDSTICK_THERMAL_THERMAL_SUPERVISOR_HPP
/**
 * @file ThermalSupervisor.hpp
 * @brief Append-only thermal snapshot log bracketing benchmark phases.
 *
 * The runner records "start", "before_<category>", "after_<category>" and
 * "end". Throttling never stops a run; it is surfaced through hadThrottling()
 * and the summary line. A source that cannot be read, or that throws, reads
 * as NOMINAL.
 *
 * @note Not thread-safe: owned and driven by the runner thread.
 */

#include "src/thermal/inc/ThermalState.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace yardstick {

namespace thermal {

/* ----------------------------- Constants ----------------------------- */

/// Maximum phase label length (including terminator).
inline constexpr std::size_t PHASE_LABEL_SIZE = 48;

/* ----------------------------- ThermalSnapshot ----------------------------- */

/**
 * @brief Thermal level at one labelled point of the run.
 */
struct ThermalSnapshot {
  std::uint64_t timestampMs{0};                ///< Wall clock, ms since epoch
  ThermalLevel level{ThermalLevel::NOMINAL};   ///< Level at that instant
  std::array<char, PHASE_LABEL_SIZE> phase{};  ///< "start", "before_memory", ...

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ThermalSupervisor ----------------------------- */

/// Produces a fresh reading on demand.
using ThermalSource = std::function<ThermalReading()>;

/**
 * @brief Reads the thermal level and keeps the run's snapshot log.
 */
class ThermalSupervisor {
public:
  /// Supervise the live system (sysfs).
  ThermalSupervisor();

  /// Supervise an injected source; throttle baseline is taken immediately.
  explicit ThermalSupervisor(ThermalSource source);

  /// Classified level now. Fail-open: NOMINAL when unreadable.
  [[nodiscard]] ThermalLevel currentLevel() const noexcept;

  /// currentLevel() is SERIOUS or CRITICAL.
  [[nodiscard]] bool isThrottling() const noexcept;

  /// Append a snapshot for `phase` and return it.
  const ThermalSnapshot& record(std::string_view phase);

  /// All snapshots in recording order.
  [[nodiscard]] const std::vector<ThermalSnapshot>& snapshots() const noexcept {
    return snapshots_;
  }

  /// Level of the first snapshot (NOMINAL when empty).
  [[nodiscard]] ThermalLevel startLevel() const noexcept;

  /// Level of the last snapshot (NOMINAL when empty).
  [[nodiscard]] ThermalLevel endLevel() const noexcept;

  /// Worst level over all snapshots.
  [[nodiscard]] ThermalLevel worstLevel() const noexcept;

  /// Any snapshot at SERIOUS or CRITICAL.
  [[nodiscard]] bool hadThrottling() const noexcept;

  /// "nominal -> fair", with " (throttling detected)" when applicable.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string summary() const;

private:
  ThermalSource source_;
  std::uint64_t baselineThrottleEvents_{0};
  std::vector<ThermalSnapshot> snapshots_;

  [[nodiscard]] bool readSource(ThermalReading& out) const noexcept;
};

} // namespace thermal

} // namespace yardstick

#endif // YARDSTICK_THERMAL_THERMAL_SUPERVISOR_HPP
