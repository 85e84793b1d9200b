#ifndef YARDSTICK_SUITES_SUITES_HPP
#define YARDSTICK_SUITES_SUITES_HPP
/**
 * @file Suites.hpp
 * @brief Assemble the reference probe set into runner plans and profiler
 *        probe sources.
 * @note NOT RT-safe: Allocates; buildProfileProbes creates a scratch file.
 */

#include "src/engine/inc/Runner.hpp"
#include "src/host/inc/HostInfo.hpp"
#include "src/profiler/inc/Profiler.hpp"
#include "src/suites/inc/DiskProbes.hpp"
#include "src/suites/inc/MemoryProbes.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace yardstick {

namespace suites {

/* ----------------------------- Constants ----------------------------- */

/// Memory bandwidth buffer in quick runs.
inline constexpr std::uint64_t QUICK_MEMORY_BUFFER_BYTES = 64ULL * 1024 * 1024;

/// Scratch file of the queue-depth sweep (standard / quick).
inline constexpr std::uint64_t DEPTH_FILE_BYTES = 256ULL * 1024 * 1024;
inline constexpr std::uint64_t QUICK_DEPTH_FILE_BYTES = 64ULL * 1024 * 1024;

/// Random operations per queue-depth invocation, split across streams.
inline constexpr std::size_t DEPTH_SWEEP_OPS = 2048;

/// Default scratch directory.
inline constexpr const char* DEFAULT_DISK_DIRECTORY = "/tmp";

/* ----------------------------- SuiteOptions ----------------------------- */

/**
 * @brief Host facts and paths the probe set is sized from.
 */
struct SuiteOptions {
  std::array<char, DISK_PATH_SIZE> diskDirectory{}; ///< Scratch directory (empty = /tmp)
  host::HostInfo host{};                            ///< RAM limit and cache sizes
  bool quick{false};                                ///< Smaller buffers and files
  bool skipDisk{false};                             ///< No scratch file, no depth sources

  /// Options for the current host with the default directory.
  [[nodiscard]] static SuiteOptions forHost(const host::HostInfo& info, bool quick);

  void setDiskDirectory(const char* path) noexcept;

  /// diskDirectory, or DEFAULT_DISK_DIRECTORY when empty.
  [[nodiscard]] const char* resolvedDiskDirectory() const noexcept;
};

/* ----------------------------- API ----------------------------- */

/// Memory probe configuration for the options.
[[nodiscard]] MemoryProbeConfig memoryConfigFor(const SuiteOptions& opts) noexcept;

/// Disk probe configuration for the options.
[[nodiscard]] DiskProbeConfig diskConfigFor(const SuiteOptions& opts) noexcept;

/**
 * @brief Plans for every category selected in `cfg`, in declared order.
 *
 * Modes: CPU single, memory and GPU are sampled; CPU multi runs through the
 * scaling harness; disk runs a fixed number of invocations.
 */
[[nodiscard]] std::vector<engine::CategoryPlan> buildPlans(const engine::RunConfig& cfg,
                                                           const SuiteOptions& opts);

/**
 * @brief Probe sources for the profiler.
 *
 * The two queue-depth sources share one scratch file created here; when it
 * cannot be created, or opts.skipDisk is set, both are left empty and their
 * sweeps are skipped.
 */
[[nodiscard]] profiler::ProfileProbes buildProfileProbes(const profiler::ProfileConfig& cfg,
                                                         const SuiteOptions& opts);

} // namespace suites

} // namespace yardstick

#endif // YARDSTICK_SUITES_SUITES_HPP
