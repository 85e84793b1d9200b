#ifndef YARDSTICK_HELPERS_CLOCK_HPP
#define YARDSTICK_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic and wall-clock timestamps used by the measurement loops.
 *
 * Sampling deadlines and elapsed times use CLOCK_MONOTONIC. Wall-clock time is
 * only used to stamp thermal snapshots and run results.
 *
 * @note Syscall (clock_gettime), typically vDSO-accelerated.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC, CLOCK_REALTIME

namespace yardstick {
namespace helpers {
namespace clock {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t NS_PER_SEC = 1'000'000'000ULL;
inline constexpr std::uint64_t NS_PER_MS = 1'000'000ULL;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Monotonic timestamp in nanoseconds.
 * @return Current CLOCK_MONOTONIC time; 0 if the clock cannot be read.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SEC +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// Wall-clock milliseconds since the Unix epoch (0 on failure).
[[nodiscard]] inline std::uint64_t getWallClockMs() noexcept {
  struct timespec ts{};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec) * 1000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec) / NS_PER_MS;
}

/// Nanoseconds to seconds.
[[nodiscard]] inline double nsToSec(std::uint64_t ns) noexcept {
  return static_cast<double>(ns) / static_cast<double>(NS_PER_SEC);
}

/**
 * @brief Seconds to nanoseconds, saturating.
 * @return 0 for NaN or non-positive input; UINT64_MAX past the representable range.
 */
[[nodiscard]] inline std::uint64_t secToNs(double sec) noexcept {
  if (!(sec > 0.0)) {
    return 0;
  }
  const double NS = sec * static_cast<double>(NS_PER_SEC);
  if (NS >= static_cast<double>(UINT64_MAX)) {
    return UINT64_MAX;
  }
  return static_cast<std::uint64_t>(NS);
}

/// nowNs + budgetNs, saturating at UINT64_MAX.
[[nodiscard]] inline std::uint64_t deadlineAfter(std::uint64_t nowNs,
                                                 std::uint64_t budgetNs) noexcept {
  return (budgetNs > UINT64_MAX - nowNs) ? UINT64_MAX : nowNs + budgetNs;
}

} // namespace clock
} // namespace helpers
} // namespace yardstick

#endif // YARDSTICK_HELPERS_CLOCK_HPP
