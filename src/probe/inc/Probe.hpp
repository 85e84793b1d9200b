#ifndef YARDSTICK_PROBE_PROBE_HPP
#define YARDSTICK_PROBE_PROBE_HPP
/**
 * @file Probe.hpp
 * @brief Named, stateless unit of benchmark work returning one measurement.
 *
 * A probe wraps a synchronous callable that performs one unit of work and
 * returns a single value in the probe's unit. A value that is not a positive
 * finite number is a failure. Exceptions thrown by the callable are caught
 * at the probe boundary and reported as failures.
 *
 * @note Thread-safe: invoke() is const; the callable must be safe to run
 *       concurrently when the probe is used by the scaling harness.
 */

#include <cstdint>
#include <functional>
#include <string>

namespace yardstick {

namespace probe {

/* ----------------------------- Direction ----------------------------- */

/**
 * @brief Whether larger measurements are better (throughput) or worse (latency).
 */
enum class Direction : std::uint8_t {
  HIGHER_IS_BETTER = 0,
  LOWER_IS_BETTER,
};

/// Human-readable direction ("higher", "lower").
[[nodiscard]] const char* toString(Direction dir) noexcept;

/// Indicator glyph used in result tables.
[[nodiscard]] const char* indicator(Direction dir) noexcept;

/* ----------------------------- ProbeStatus ----------------------------- */

/**
 * @brief Outcome of one probe invocation.
 */
enum class ProbeStatus : std::uint8_t {
  OK = 0,      ///< Positive finite value returned
  FAILED,      ///< Callable returned 0, a negative value or a non-finite value
  THREW,       ///< Callable threw
  NO_CALLABLE, ///< Probe has no callable bound
};

/// Human-readable status.
[[nodiscard]] const char* toString(ProbeStatus status) noexcept;

/* ----------------------------- ProbeOutcome ----------------------------- */

/**
 * @brief Value and timing of one invocation.
 */
struct ProbeOutcome {
  double value{0.0};                     ///< Measurement (0 unless status is OK)
  ProbeStatus status{ProbeStatus::FAILED}; ///< Invocation status
  std::uint64_t elapsedNs{0};            ///< Wall-clock duration of the call

  [[nodiscard]] bool ok() const noexcept { return status == ProbeStatus::OK; }
};

/* ----------------------------- Probe ----------------------------- */

/// Callable that performs one unit of work.
using ProbeFn = std::function<double()>;

/**
 * @brief Probe descriptor plus its callable.
 */
struct Probe {
  std::string key{};   ///< Baseline key ("integer", "mem_latency", ...)
  std::string label{}; ///< Display name ("Integer Math")
  std::string unit{};  ///< Unit of the value ("Mops/s", "ns")
  Direction direction{Direction::HIGHER_IS_BETTER};
  ProbeFn fn{};

  /**
   * @brief Invoke once, timing the call and classifying the value.
   * @note Never throws.
   */
  [[nodiscard]] ProbeOutcome invoke() const noexcept;

  /// Key, unit and callable are all set.
  [[nodiscard]] bool isValid() const noexcept;

  /// "key [unit, higher is better]".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/// True when a value counts as a failed measurement (not a positive finite number).
[[nodiscard]] bool isFailedValue(double value) noexcept;

/**
 * @brief Build a probe from its parts.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] Probe makeProbe(std::string key, std::string label, std::string unit,
                              Direction direction, ProbeFn fn);

} // namespace probe

} // namespace yardstick

#endif // YARDSTICK_PROBE_PROBE_HPP
