#ifndef YARDSTICK_SUITES_GPU_PROBES_HPP
#define YARDSTICK_SUITES_GPU_PROBES_HPP
/**
 * @file GpuProbes.hpp
 * @brief GPU category probe set.
 *
 * The build carries no compute backend, so every GPU probe reports failure
 * and the category scores 0 while still counting as run.
 */

#include "src/probe/inc/Probe.hpp"

#include <vector>

namespace yardstick {

namespace suites {

/// True when a GPU compute backend is compiled in.
[[nodiscard]] bool gpuBackendAvailable() noexcept;

/// gpu_compute (GFLOPS), gpu_particles (Mparts/s), gpu_blur and gpu_edge (MP/s).
[[nodiscard]] std::vector<probe::Probe> gpuProbes();

} // namespace suites

} // namespace yardstick

#endif // YARDSTICK_SUITES_GPU_PROBES_HPP
