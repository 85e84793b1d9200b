#ifndef YARDSTICK_SUITES_DISK_PROBES_HPP
#define YARDSTICK_SUITES_DISK_PROBES_HPP
/**
 * @file DiskProbes.hpp
 * @brief File-backed sequential and random I/O payloads.
 * @note Linux-only. Performs actual I/O in the configured directory.
 *
 * Sequential probes stream a file in large chunks (MB/s). Random probes issue
 * 4 KiB pread/pwrite at uniformly distributed offsets of a prepared file
 * (IOPS); a fixed seed keeps the offset sequence reproducible. Every probe
 * refuses before creating its file when the filesystem lacks the space.
 *
 * @warning NOT RT-safe: Performs active I/O with unbounded latency.
 */

#include "src/probe/inc/Probe.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace yardstick {

namespace suites {

/* ----------------------------- Constants ----------------------------- */

/// Maximum path length for the probe directory.
inline constexpr std::size_t DISK_PATH_SIZE = 512;

/// Random I/O block size.
inline constexpr std::size_t RANDOM_BLOCK_BYTES = 4096;

/// Sequential I/O chunk size.
inline constexpr std::size_t DEFAULT_CHUNK_BYTES = 4ULL * 1024 * 1024;

/// Sequential file size (standard / quick).
inline constexpr std::uint64_t DEFAULT_SEQ_BYTES = 512ULL * 1024 * 1024;
inline constexpr std::uint64_t QUICK_SEQ_BYTES = 128ULL * 1024 * 1024;

/// Random-I/O file size.
inline constexpr std::uint64_t DEFAULT_RANDOM_FILE_BYTES = 256ULL * 1024 * 1024;

/// Random operations per invocation.
inline constexpr std::size_t DEFAULT_RANDOM_OPS = 4096;

/// Time cap of one invocation (seconds).
inline constexpr double MAX_DISK_PROBE_SEC = 30.0;

/* ----------------------------- DiskProbeConfig ----------------------------- */

/**
 * @brief Directory, sizes and limits for disk payloads.
 */
struct DiskProbeConfig {
  std::array<char, DISK_PATH_SIZE> directory{}; ///< Directory for scratch files
  std::uint64_t seqBytes{DEFAULT_SEQ_BYTES};
  std::size_t chunkBytes{DEFAULT_CHUNK_BYTES};
  std::uint64_t randomFileBytes{DEFAULT_RANDOM_FILE_BYTES};
  std::size_t randomOps{DEFAULT_RANDOM_OPS};
  double timeBudgetSec{MAX_DISK_PROBE_SEC};
  bool useFsync{true}; ///< fsync after sequential writes, fdatasync after random writes

  /// Defaults with the given directory.
  [[nodiscard]] static DiskProbeConfig standard(const char* dir) noexcept;

  /// Smaller sequential file for quick runs.
  [[nodiscard]] static DiskProbeConfig quick(const char* dir) noexcept;

  void setDirectory(const char* path) noexcept;

  /// Directory exists and sizes are consistent.
  [[nodiscard]] bool isValid() const noexcept;
};

/* ----------------------------- DiskResult ----------------------------- */

/**
 * @brief Outcome of one disk invocation.
 */
struct DiskResult {
  bool success{false};
  double elapsedSec{0.0};
  std::size_t operations{0};
  std::uint64_t bytesTransferred{0};

  /// Decimal MB/s; 0 unless successful.
  [[nodiscard]] double mbPerSec() const noexcept;

  /// Operations per second; 0 unless successful.
  [[nodiscard]] double iops() const noexcept;

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ScratchFile ----------------------------- */

/**
 * @brief Pre-filled file for random I/O, unlinked on destruction.
 */
class ScratchFile {
public:
  /**
   * @brief Create and fill a scratch file.
   * @return nullptr when space is short or any step fails.
   */
  [[nodiscard]] static std::shared_ptr<ScratchFile> create(const char* dir,
                                                           std::uint64_t bytes) noexcept;

  ~ScratchFile();
  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] std::uint64_t blocks() const noexcept { return blocks_; }

private:
  ScratchFile() = default;

  int fd_{-1};
  std::uint64_t blocks_{0};
  std::array<char, DISK_PATH_SIZE> path_{};
};

/* ----------------------------- API ----------------------------- */

/// True when `dir` has room for `bytes` plus a 10% margin.
[[nodiscard]] bool hasSpaceFor(const char* dir, std::uint64_t bytes) noexcept;

/// Sequential write of seqBytes in chunkBytes chunks (timed through fsync).
[[nodiscard]] DiskResult runSeqWrite(const DiskProbeConfig& cfg) noexcept;

/// Sequential read of a freshly written seqBytes file (write phase untimed).
[[nodiscard]] DiskResult runSeqRead(const DiskProbeConfig& cfg) noexcept;

/// Random 4 KiB reads against an existing scratch file.
[[nodiscard]] DiskResult randomReads(const ScratchFile& file, std::size_t ops, double budgetSec,
                                     std::uint64_t seed = 42) noexcept;

/// Random 4 KiB writes (fdatasync each when sync) against an existing scratch file.
[[nodiscard]] DiskResult randomWrites(const ScratchFile& file, std::size_t ops, double budgetSec,
                                      bool sync, std::uint64_t seed = 42) noexcept;

/// Random reads on a per-invocation scratch file.
[[nodiscard]] DiskResult runRandRead(const DiskProbeConfig& cfg) noexcept;

/// Random writes on a per-invocation scratch file.
[[nodiscard]] DiskResult runRandWrite(const DiskProbeConfig& cfg) noexcept;

/**
 * @brief Random I/O with `depth` concurrent streams on a shared scratch file.
 * @param ops Total operations split across streams.
 * @return Combined result; failure if any stream cannot start.
 */
[[nodiscard]] DiskResult runRandomAtDepth(const ScratchFile& file, std::size_t depth,
                                          std::size_t ops, bool write, bool sync) noexcept;

/* ----------------------------- Probe Set ----------------------------- */

/// disk_seq_write, disk_seq_read (MB/s), disk_rand_write, disk_rand_read (IOPS).
[[nodiscard]] std::vector<probe::Probe> diskProbes(const DiskProbeConfig& cfg);

} // namespace suites

} // namespace yardstick

#endif // YARDSTICK_SUITES_DISK_PROBES_HPP
