/**
 * @file Suites.cpp
 * @brief Plan and profiler source assembly.
 */

#include "src/suites/inc/Suites.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/suites/inc/CpuProbes.hpp"
#include "src/suites/inc/GpuProbes.hpp"

#include <memory>
#include <utility>

#include <fmt/core.h>

namespace yardstick {

namespace suites {

using yardstick::engine::Category;
using yardstick::engine::CategoryPlan;
using yardstick::engine::ExecutionMode;
using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::probe::Probe;

/* ----------------------------- SuiteOptions ----------------------------- */

SuiteOptions SuiteOptions::forHost(const host::HostInfo& info, bool quick) {
  SuiteOptions opts{};
  opts.host = info;
  opts.quick = quick;
  return opts;
}

void SuiteOptions::setDiskDirectory(const char* path) noexcept {
  helpers::strings::copyToFixedArray(diskDirectory, path);
}

const char* SuiteOptions::resolvedDiskDirectory() const noexcept {
  return (diskDirectory[0] != '\0') ? diskDirectory.data() : DEFAULT_DISK_DIRECTORY;
}

/* ----------------------------- API ----------------------------- */

MemoryProbeConfig memoryConfigFor(const SuiteOptions& opts) noexcept {
  MemoryProbeConfig cfg{};
  cfg.physicalRamBytes = opts.host.physicalMemoryBytes;
  if (opts.quick) {
    cfg.bufferBytes = QUICK_MEMORY_BUFFER_BYTES;
  }
  return cfg;
}

DiskProbeConfig diskConfigFor(const SuiteOptions& opts) noexcept {
  const char* dir = opts.resolvedDiskDirectory();
  return opts.quick ? DiskProbeConfig::quick(dir) : DiskProbeConfig::standard(dir);
}

std::vector<CategoryPlan> buildPlans(const engine::RunConfig& cfg, const SuiteOptions& opts) {
  std::vector<CategoryPlan> plans;
  for (const Category C : cfg.selection.ordered()) {
    CategoryPlan plan{};
    plan.category = C;
    switch (C) {
    case Category::CPU_SINGLE:
      plan.mode = ExecutionMode::SAMPLED;
      plan.probes = cpuSingleProbes();
      break;
    case Category::CPU_MULTI:
      plan.mode = ExecutionMode::SCALED;
      plan.probes = cpuMultiProbes();
      break;
    case Category::MEMORY:
      plan.mode = ExecutionMode::SAMPLED;
      plan.probes = memoryProbes(memoryConfigFor(opts));
      break;
    case Category::DISK:
      plan.mode = ExecutionMode::FIXED_ITERATIONS;
      plan.probes = diskProbes(diskConfigFor(opts));
      break;
    case Category::GPU:
      plan.mode = ExecutionMode::SAMPLED;
      plan.probes = gpuProbes();
      break;
    }
    plans.push_back(std::move(plan));
  }
  return plans;
}

profiler::ProfileProbes buildProfileProbes(const profiler::ProfileConfig& cfg,
                                           const SuiteOptions& opts) {
  profiler::ProfileProbes out{};
  const std::uint64_t RAM = opts.host.physicalMemoryBytes;

  out.sizeProbe = [RAM](std::uint64_t sizeBytes) {
    return makeProbe(fmt::format("working_set_{}", sizeBytes), "Working-Set Read", "GB/s",
                     Direction::HIGHER_IS_BETTER,
                     [sizeBytes, RAM] { return workingSetReadGbps(sizeBytes, RAM); });
  };

  const std::uint64_t SET = cfg.strideSetBytes;
  out.strideProbe = [SET, RAM](std::uint64_t strideBytes) {
    return makeProbe(fmt::format("stride_{}", strideBytes), "Strided Read", "GB/s",
                     Direction::HIGHER_IS_BETTER,
                     [SET, strideBytes, RAM] { return strideReadGbps(SET, strideBytes, RAM); });
  };

  const std::uint64_t FILE_BYTES = opts.quick ? QUICK_DEPTH_FILE_BYTES : DEPTH_FILE_BYTES;
  std::shared_ptr<ScratchFile> file;
  if (!opts.skipDisk) {
    file = ScratchFile::create(opts.resolvedDiskDirectory(), FILE_BYTES);
  }
  if (file) {
    out.readDepthProbe = [file](std::size_t depth) {
      return makeProbe(fmt::format("rand_read_qd{}", depth), "Random Read 4K", "IOPS",
                       Direction::HIGHER_IS_BETTER, [file, depth] {
                         return runRandomAtDepth(*file, depth, DEPTH_SWEEP_OPS, false, false)
                             .iops();
                       });
    };
    out.writeDepthProbe = [file](std::size_t depth) {
      return makeProbe(fmt::format("rand_write_qd{}", depth), "Random Write 4K", "IOPS",
                       Direction::HIGHER_IS_BETTER, [file, depth] {
                         return runRandomAtDepth(*file, depth, DEPTH_SWEEP_OPS, true, true)
                             .iops();
                       });
    };
  }

  std::vector<Probe> cpu = cpuSingleProbes();
  if (!cpu.empty()) {
    out.scalingProbe = std::move(cpu.front());
  }
  return out;
}

} // namespace suites

} // namespace yardstick
