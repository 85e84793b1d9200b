#ifndef YARDSTICK_SUITES_CPU_PROBES_HPP
#define YARDSTICK_SUITES_CPU_PROBES_HPP
/**
 * @file CpuProbes.hpp
 * @brief CPU payloads: integer, float, SIMD FMA, hashing, compression.
 * @note Thread-safe: Every payload owns its working data; safe to run from
 *       many harness workers at once.
 *
 * Each payload performs a fixed chunk of work per invocation and returns its
 * rate over that chunk. Multi-core probes reuse the same payloads under the
 * scaling harness with keys suffixed "_multi".
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace yardstick {

namespace suites {

/* ----------------------------- Constants ----------------------------- */

/// Loop iterations of one integer or float invocation.
inline constexpr std::size_t CPU_LOOP_ITERATIONS = 2'000'000;

/// Elements of the FMA working arrays.
inline constexpr std::size_t SIMD_ELEMENTS = 4096;

/// Passes over the FMA arrays per invocation.
inline constexpr std::size_t SIMD_PASSES = 256;

/// Bytes hashed or compressed per invocation.
inline constexpr std::size_t CPU_STREAM_BYTES = 4ULL * 1024 * 1024;

/// Suffix of multi-core probe keys.
inline constexpr const char* MULTI_SUFFIX = "_multi";

/* ----------------------------- Payloads ----------------------------- */

/// Integer arithmetic rate in Mops/s; 0 on a zero-length run.
[[nodiscard]] double integerMathMops(std::size_t iterations = CPU_LOOP_ITERATIONS) noexcept;

/// Floating-point arithmetic rate in Mops/s.
[[nodiscard]] double floatMathMops(std::size_t iterations = CPU_LOOP_ITERATIONS) noexcept;

/// Fused multiply-add rate in GFLOPS.
[[nodiscard]] double simdFmaGflops(std::size_t elements = SIMD_ELEMENTS,
                                   std::size_t passes = SIMD_PASSES);

/// FNV-1a hashing throughput in MB/s.
[[nodiscard]] double hashMbps(std::size_t bytes = CPU_STREAM_BYTES);

/// Run-length encoding throughput in MB/s.
[[nodiscard]] double compressionMbps(std::size_t bytes = CPU_STREAM_BYTES);

/* ----------------------------- Helpers ----------------------------- */

/// 64-bit FNV-1a.
[[nodiscard]] std::uint64_t fnv1a(const std::uint8_t* data, std::size_t len) noexcept;

/**
 * @brief Byte-oriented run-length encoding ((count, byte) pairs, runs <= 255).
 * @return Encoded size in bytes.
 */
std::size_t rleEncode(const std::uint8_t* in, std::size_t len, std::vector<std::uint8_t>& out);

/* ----------------------------- Probe Sets ----------------------------- */

/// Single-core probes in display order.
[[nodiscard]] std::vector<probe::Probe> cpuSingleProbes();

/// Multi-core probes (same payloads, "_multi" keys) for the scaling harness.
[[nodiscard]] std::vector<probe::Probe> cpuMultiProbes();

} // namespace suites

} // namespace yardstick

#endif // YARDSTICK_SUITES_CPU_PROBES_HPP
