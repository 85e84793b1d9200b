#ifndef YARDSTICK_SUITES_MEMORY_PROBES_HPP
#define YARDSTICK_SUITES_MEMORY_PROBES_HPP
/**
 * @file MemoryProbes.hpp
 * @brief Memory bandwidth and latency payloads, plus working-set and stride
 *        probes for the cache profiler.
 * @note NOT RT-safe: Allocates large buffers per invocation.
 *
 * Every payload refuses (returns 0) before allocating when its buffer would
 * exceed a quarter of physical RAM. Buffers are pre-faulted before timing.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstdint>
#include <vector>

namespace yardstick {

namespace suites {

/* ----------------------------- Constants ----------------------------- */

/// Bandwidth buffer size.
inline constexpr std::uint64_t DEFAULT_MEMORY_BUFFER_BYTES = 256ULL * 1024 * 1024;

/// Pointer-chase working set (well past the last-level cache).
inline constexpr std::uint64_t DEFAULT_LATENCY_BYTES = 32ULL * 1024 * 1024;

/// Dependent loads per latency invocation.
inline constexpr std::uint64_t DEFAULT_LATENCY_STEPS = 2'000'000;

/// Minimum bytes touched by one working-set invocation.
inline constexpr std::uint64_t MIN_SWEEP_TOUCH_BYTES = 64ULL * 1024 * 1024;

/// Minimum loads of one stride invocation.
inline constexpr std::uint64_t MIN_STRIDE_LOADS = 4'000'000;

/* ----------------------------- MemoryProbeConfig ----------------------------- */

/**
 * @brief Buffer sizes and the RAM limit they are checked against.
 */
struct MemoryProbeConfig {
  std::uint64_t bufferBytes{DEFAULT_MEMORY_BUFFER_BYTES};
  std::uint64_t latencyBytes{DEFAULT_LATENCY_BYTES};
  std::uint64_t latencySteps{DEFAULT_LATENCY_STEPS};
  std::uint64_t physicalRamBytes{0}; ///< 0 = unknown (1 GiB fallback cap)

  [[nodiscard]] bool isValid() const noexcept;
};

/* ----------------------------- Payloads ----------------------------- */

/// Sequential 64-bit read bandwidth in GB/s; 0 when refused or allocation fails.
[[nodiscard]] double memReadGbps(const MemoryProbeConfig& cfg) noexcept;

/// Sequential write (memset) bandwidth in GB/s.
[[nodiscard]] double memWriteGbps(const MemoryProbeConfig& cfg) noexcept;

/// memcpy bandwidth in GB/s (bytes copied); source and destination split the buffer.
[[nodiscard]] double memCopyGbps(const MemoryProbeConfig& cfg) noexcept;

/// Average dependent-load latency in nanoseconds over a random cyclic chain.
[[nodiscard]] double memLatencyNs(const MemoryProbeConfig& cfg) noexcept;

/**
 * @brief Read bandwidth (GB/s) over a working set of `sizeBytes`.
 *
 * Repeats passes until at least MIN_SWEEP_TOUCH_BYTES are read.
 */
[[nodiscard]] double workingSetReadGbps(std::uint64_t sizeBytes,
                                        std::uint64_t physicalRamBytes) noexcept;

/**
 * @brief Effective load bandwidth (GB/s, 8 bytes per load) reading one word
 *        every `strideBytes` over a `setBytes` working set.
 */
[[nodiscard]] double strideReadGbps(std::uint64_t setBytes, std::uint64_t strideBytes,
                                    std::uint64_t physicalRamBytes) noexcept;

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Fill next[0..n) with a single random cycle (Sattolo), fixed seed.
 *
 * Following next[] from any slot visits all n slots before returning.
 */
void buildCyclicChain(std::uint64_t* next, std::uint64_t n, std::uint64_t seed = 42) noexcept;

/* ----------------------------- Probe Set ----------------------------- */

/// mem_read, mem_write, mem_copy, mem_latency.
[[nodiscard]] std::vector<probe::Probe> memoryProbes(const MemoryProbeConfig& cfg);

} // namespace suites

} // namespace yardstick

#endif // YARDSTICK_SUITES_MEMORY_PROBES_HPP
