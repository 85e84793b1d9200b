/**
 * @file GpuProbes.cpp
 * @brief GPU probes without a compute backend.
 */

#include "src/suites/inc/GpuProbes.hpp"

namespace yardstick {

namespace suites {

using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::probe::Probe;

namespace {

struct GpuProbeInfo {
  const char* key;
  const char* label;
  const char* unit;
};

constexpr GpuProbeInfo GPU_PROBES[] = {
    {"gpu_compute", "GPU Compute", "GFLOPS"},
    {"gpu_particles", "GPU Particles", "Mparts/s"},
    {"gpu_blur", "GPU Blur", "MP/s"},
    {"gpu_edge", "GPU Edge Detect", "MP/s"},
};

double unavailable() noexcept { return 0.0; }

} // namespace

bool gpuBackendAvailable() noexcept { return false; }

std::vector<Probe> gpuProbes() {
  std::vector<Probe> out;
  out.reserve(sizeof(GPU_PROBES) / sizeof(GPU_PROBES[0]));
  for (const GpuProbeInfo& S : GPU_PROBES) {
    out.push_back(makeProbe(S.key, S.label, S.unit, Direction::HIGHER_IS_BETTER, unavailable));
  }
  return out;
}

} // namespace suites

} // namespace yardstick
