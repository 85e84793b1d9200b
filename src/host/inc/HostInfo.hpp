#ifndef YARDSTICK_HOST_HOSTINFO_HPP
#define YARDSTICK_HOST_HOSTINFO_HPP
/**
 * @file HostInfo.hpp
 * @brief Host facts used for scoring, probe sizing and cache-level matching.
 * @note Linux-only. Reads /proc/meminfo and /sys/devices/system/cpu/cpu0/cache/.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include <array>   // std::array
#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace yardstick {

namespace host {

/* ----------------------------- Constants ----------------------------- */

/// Maximum cache type string length.
inline constexpr std::size_t CACHE_TYPE_SIZE = 16;

/// Share of physical RAM a single probe buffer may occupy.
inline constexpr double MAX_BUFFER_RAM_FRACTION = 0.25;

/// Probe buffer cap used when physical RAM cannot be read.
inline constexpr std::uint64_t FALLBACK_MAX_BUFFER_BYTES = 1ULL << 30;

/* ----------------------------- CacheLevel ----------------------------- */

/**
 * @brief One data or unified cache visible to cpu0.
 */
struct CacheLevel {
  int level{0};                               ///< 1=L1, 2=L2, 3=L3
  std::array<char, CACHE_TYPE_SIZE> type{};   ///< "Data" or "Unified"
  std::uint64_t sizeBytes{0};

  /// "L2 Unified 1 MiB".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- HostInfo ----------------------------- */

/**
 * @brief Snapshot of host facts.
 */
struct HostInfo {
  std::size_t logicalCpus{1};           ///< Online logical CPUs (>= 1)
  std::uint64_t physicalMemoryBytes{0}; ///< MemTotal; 0 if unknown
  std::vector<CacheLevel> caches{};     ///< Data/unified caches, ordered by level

  /// Largest buffer a memory probe may allocate; the fallback cap when RAM is unknown.
  [[nodiscard]] std::uint64_t maxProbeBufferBytes() const noexcept;

  /// Cache sizes in level order.
  [[nodiscard]] std::vector<std::uint64_t> cacheSizes() const;

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/// Online logical CPU count (sysconf), at least 1.
[[nodiscard]] std::size_t logicalCpuCount() noexcept;

/**
 * @brief Physical RAM in bytes from <sysRoot>/proc/meminfo.
 *
 * Falls back to sysconf page counts when sysRoot is empty and meminfo is
 * unreadable. Returns 0 if unknown.
 */
[[nodiscard]] std::uint64_t physicalMemoryBytes(const std::string& sysRoot = "") noexcept;

/**
 * @brief Data and unified caches of cpu0, deduplicated by level.
 * @param sysRoot Prefix for /sys (tests point this at a fake tree).
 */
[[nodiscard]] std::vector<CacheLevel> readDataCaches(const std::string& sysRoot = "");

/// True when `bytes` fits within the RAM share allowed for one probe buffer.
/// Unknown RAM (0) falls back to FALLBACK_MAX_BUFFER_BYTES.
[[nodiscard]] bool bufferAllowed(std::uint64_t bytes, std::uint64_t physicalRamBytes) noexcept;

/**
 * @brief Available bytes on the filesystem holding `path` (statvfs).
 * @return Bytes available to unprivileged users, 0 on error.
 */
[[nodiscard]] std::uint64_t availableDiskBytes(const char* path) noexcept;

/// Collect a full snapshot from the live system.
[[nodiscard]] HostInfo getHostInfo();

} // namespace host

} // namespace yardstick

#endif // YARDSTICK_HOST_HOSTINFO_HPP
