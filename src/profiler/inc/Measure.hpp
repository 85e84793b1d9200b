#ifndef YARDSTICK_PROFILER_MEASURE_HPP
#define YARDSTICK_PROFILER_MEASURE_HPP
/**
 * @file Measure.hpp
 * @brief Single sweep-point measurement shared by every sweep.
 */

#include "src/probe/inc/Probe.hpp"

#include <optional>

namespace yardstick {

namespace profiler {

/**
 * @brief Sample a probe for budgetSec (with warm-up) and return its average.
 * @return Average, or nullopt when the probe is invalid or no invocation succeeded.
 */
[[nodiscard]] std::optional<double> measurePoint(const probe::Probe& p, double budgetSec) noexcept;

} // namespace profiler

} // namespace yardstick

#endif // YARDSTICK_PROFILER_MEASURE_HPP
