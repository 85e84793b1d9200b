/**
 * @file DiskProbes.cpp
 * @brief Implementation of file-backed disk payloads.
 */

#include "src/suites/inc/DiskProbes.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/host/inc/HostInfo.hpp"
#include "src/suites/inc/AlignedBuffer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <new>
#include <vector>
#include <random>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace yardstick {

namespace suites {

using yardstick::helpers::clock::deadlineAfter;
using yardstick::helpers::clock::getMonotonicNs;
using yardstick::helpers::clock::nsToSec;
using yardstick::helpers::clock::secToNs;
using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::probe::Probe;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t FILL_CHUNK_BYTES = 1024 * 1024;
constexpr double SPACE_MARGIN = 1.10;

std::atomic<std::uint32_t> g_fileCounter{0};

/* ----------------------------- Helpers ----------------------------- */

inline std::uint64_t deadlineFrom(std::uint64_t startNs, double budgetSec) noexcept {
  return deadlineAfter(startNs, secToNs(budgetSec));
}

/// Unique scratch path in dir.
inline void makeTempPath(std::array<char, DISK_PATH_SIZE>& out, const char* dir) noexcept {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-truncation"
  std::snprintf(out.data(), out.size(), "%s/yardstick_%d_%u.tmp", dir,
                static_cast<int>(::getpid()), g_fileCounter.fetch_add(1));
#pragma GCC diagnostic pop
}

inline int openFile(const char* path, int flags) noexcept {
  return ::open(path, flags | O_CLOEXEC, 0644);
}

/// Write `bytes` of `buf` repeatedly; returns bytes written.
std::uint64_t fillFile(int fd, const AlignedBuffer& buf, std::uint64_t bytes,
                       std::uint64_t deadlineNs) noexcept {
  std::uint64_t written = 0;
  while (written < bytes) {
    if (deadlineNs != 0 && getMonotonicNs() > deadlineNs) {
      break;
    }
    const std::size_t WANT =
        static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), bytes - written));
    const ssize_t W = ::write(fd, buf.data(), WANT);
    if (W <= 0) {
      break;
    }
    written += static_cast<std::uint64_t>(W);
  }
  return written;
}

/// Flush and drop the file's pages so reads reach the device where possible.
inline void flushAndDrop(int fd) noexcept {
  (void)::fsync(fd);
  (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_DONTNEED);
}

} // namespace

/* ----------------------------- DiskProbeConfig ----------------------------- */

DiskProbeConfig DiskProbeConfig::standard(const char* dir) noexcept {
  DiskProbeConfig cfg{};
  cfg.setDirectory(dir);
  return cfg;
}

DiskProbeConfig DiskProbeConfig::quick(const char* dir) noexcept {
  DiskProbeConfig cfg = standard(dir);
  cfg.seqBytes = QUICK_SEQ_BYTES;
  return cfg;
}

void DiskProbeConfig::setDirectory(const char* path) noexcept {
  helpers::strings::copyToFixedArray(directory, path);
}

bool DiskProbeConfig::isValid() const noexcept {
  if (directory[0] == '\0' || !helpers::files::isDirectory(directory.data())) {
    return false;
  }
  if (chunkBytes < RANDOM_BLOCK_BYTES || chunkBytes > 64ULL * 1024 * 1024) {
    return false;
  }
  return seqBytes >= chunkBytes && randomFileBytes >= 2 * RANDOM_BLOCK_BYTES && randomOps > 0 &&
         std::isfinite(timeBudgetSec) && timeBudgetSec > 0.0;
}

/* ----------------------------- DiskResult ----------------------------- */

double DiskResult::mbPerSec() const noexcept {
  if (!success || elapsedSec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytesTransferred) / 1.0e6 / elapsedSec;
}

double DiskResult::iops() const noexcept {
  if (!success || elapsedSec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(operations) / elapsedSec;
}

std::string DiskResult::toString() const {
  if (!success) {
    return "FAILED";
  }
  return fmt::format("{} ops in {:.3f}s ({:.1f} MB, {:.1f} MB/s, {:.0f} IOPS)", operations,
                     elapsedSec, static_cast<double>(bytesTransferred) / 1.0e6, mbPerSec(),
                     iops());
}

/* ----------------------------- ScratchFile ----------------------------- */

std::shared_ptr<ScratchFile> ScratchFile::create(const char* dir, std::uint64_t bytes) noexcept {
  if (dir == nullptr || bytes < 2 * RANDOM_BLOCK_BYTES || !hasSpaceFor(dir, bytes)) {
    return nullptr;
  }
  std::shared_ptr<ScratchFile> file;
  try {
    file.reset(new ScratchFile());
  } catch (const std::bad_alloc&) {
    return nullptr;
  }

  makeTempPath(file->path_, dir);
  file->fd_ = openFile(file->path_.data(), O_RDWR | O_CREAT | O_TRUNC);
  if (file->fd_ < 0) {
    file->path_[0] = '\0';
    return nullptr;
  }

  AlignedBuffer buf(FILL_CHUNK_BYTES);
  if (!buf.valid()) {
    return nullptr;
  }
  std::memset(buf.data(), 0x77, buf.size());
  const std::uint64_t WRITTEN = fillFile(file->fd_, buf, bytes, 0);
  flushAndDrop(file->fd_);

  file->blocks_ = WRITTEN / RANDOM_BLOCK_BYTES;
  if (file->blocks_ < 2) {
    return nullptr;
  }
  return file;
}

ScratchFile::~ScratchFile() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  if (path_[0] != '\0') {
    ::unlink(path_.data());
  }
}

/* ----------------------------- API ----------------------------- */

bool hasSpaceFor(const char* dir, std::uint64_t bytes) noexcept {
  const std::uint64_t AVAILABLE = host::availableDiskBytes(dir);
  return static_cast<double>(AVAILABLE) >= static_cast<double>(bytes) * SPACE_MARGIN;
}

DiskResult runSeqWrite(const DiskProbeConfig& cfg) noexcept {
  DiskResult result{};
  if (!cfg.isValid() || !hasSpaceFor(cfg.directory.data(), cfg.seqBytes)) {
    return result;
  }

  AlignedBuffer buf(cfg.chunkBytes);
  if (!buf.valid()) {
    return result;
  }
  std::memset(buf.data(), 0xAA, buf.size());

  std::array<char, DISK_PATH_SIZE> path{};
  makeTempPath(path, cfg.directory.data());
  const int FD = openFile(path.data(), O_WRONLY | O_CREAT | O_TRUNC);
  if (FD < 0) {
    return result;
  }

  const std::uint64_t START = getMonotonicNs();
  const std::uint64_t WRITTEN =
      fillFile(FD, buf, cfg.seqBytes, deadlineFrom(START, cfg.timeBudgetSec));
  if (cfg.useFsync) {
    (void)::fsync(FD);
  }
  const std::uint64_t END = getMonotonicNs();

  ::close(FD);
  ::unlink(path.data());

  result.success = (WRITTEN > 0);
  result.elapsedSec = nsToSec(END - START);
  result.operations = static_cast<std::size_t>((WRITTEN + buf.size() - 1) / buf.size());
  result.bytesTransferred = WRITTEN;
  return result;
}

DiskResult runSeqRead(const DiskProbeConfig& cfg) noexcept {
  DiskResult result{};
  if (!cfg.isValid() || !hasSpaceFor(cfg.directory.data(), cfg.seqBytes)) {
    return result;
  }

  AlignedBuffer buf(cfg.chunkBytes);
  if (!buf.valid()) {
    return result;
  }
  std::memset(buf.data(), 0x55, buf.size());

  std::array<char, DISK_PATH_SIZE> path{};
  makeTempPath(path, cfg.directory.data());

  // Write phase (not timed)
  int fd = openFile(path.data(), O_WRONLY | O_CREAT | O_TRUNC);
  if (fd < 0) {
    return result;
  }
  const std::uint64_t WRITTEN = fillFile(fd, buf, cfg.seqBytes, 0);
  flushAndDrop(fd);
  ::close(fd);

  fd = openFile(path.data(), O_RDONLY);
  if (fd < 0) {
    ::unlink(path.data());
    return result;
  }
  (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);

  const std::uint64_t START = getMonotonicNs();
  const std::uint64_t DEADLINE = deadlineFrom(START, cfg.timeBudgetSec);
  std::uint64_t bytesRead = 0;
  std::size_t ops = 0;
  while (bytesRead < WRITTEN) {
    if (getMonotonicNs() > DEADLINE) {
      break;
    }
    const ssize_t R = ::read(fd, buf.data(), buf.size());
    if (R <= 0) {
      break;
    }
    bytesRead += static_cast<std::uint64_t>(R);
    ++ops;
  }
  const std::uint64_t END = getMonotonicNs();

  ::close(fd);
  ::unlink(path.data());

  result.success = (bytesRead > 0);
  result.elapsedSec = nsToSec(END - START);
  result.operations = ops;
  result.bytesTransferred = bytesRead;
  return result;
}

DiskResult randomReads(const ScratchFile& file, std::size_t ops, double budgetSec,
                       std::uint64_t seed) noexcept {
  DiskResult result{};
  AlignedBuffer buf(RANDOM_BLOCK_BYTES);
  if (!buf.valid() || file.blocks() < 2 || ops == 0) {
    return result;
  }

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<std::uint64_t> dist(0, file.blocks() - 1);

  const std::uint64_t START = getMonotonicNs();
  const std::uint64_t DEADLINE = deadlineFrom(START, budgetSec);
  std::size_t done = 0;
  for (; done < ops; ++done) {
    if (getMonotonicNs() > DEADLINE) {
      break;
    }
    const off_t OFFSET = static_cast<off_t>(dist(rng) * RANDOM_BLOCK_BYTES);
    if (::pread(file.fd(), buf.data(), RANDOM_BLOCK_BYTES, OFFSET) <= 0) {
      break;
    }
  }
  const std::uint64_t END = getMonotonicNs();

  result.success = (done > 0);
  result.elapsedSec = nsToSec(END - START);
  result.operations = done;
  result.bytesTransferred = static_cast<std::uint64_t>(done) * RANDOM_BLOCK_BYTES;
  return result;
}

DiskResult randomWrites(const ScratchFile& file, std::size_t ops, double budgetSec, bool sync,
                        std::uint64_t seed) noexcept {
  DiskResult result{};
  AlignedBuffer buf(RANDOM_BLOCK_BYTES);
  if (!buf.valid() || file.blocks() < 2 || ops == 0) {
    return result;
  }
  std::memset(buf.data(), 0x88, buf.size());

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<std::uint64_t> dist(0, file.blocks() - 1);

  const std::uint64_t START = getMonotonicNs();
  const std::uint64_t DEADLINE = deadlineFrom(START, budgetSec);
  std::size_t done = 0;
  for (; done < ops; ++done) {
    if (getMonotonicNs() > DEADLINE) {
      break;
    }
    const off_t OFFSET = static_cast<off_t>(dist(rng) * RANDOM_BLOCK_BYTES);
    if (::pwrite(file.fd(), buf.data(), RANDOM_BLOCK_BYTES, OFFSET) <= 0) {
      break;
    }
    if (sync && ::fdatasync(file.fd()) != 0) {
      break;
    }
  }
  const std::uint64_t END = getMonotonicNs();

  result.success = (done > 0);
  result.elapsedSec = nsToSec(END - START);
  result.operations = done;
  result.bytesTransferred = static_cast<std::uint64_t>(done) * RANDOM_BLOCK_BYTES;
  return result;
}

DiskResult runRandRead(const DiskProbeConfig& cfg) noexcept {
  if (!cfg.isValid()) {
    return DiskResult{};
  }
  const auto FILE = ScratchFile::create(cfg.directory.data(), cfg.randomFileBytes);
  if (!FILE) {
    return DiskResult{};
  }
  return randomReads(*FILE, cfg.randomOps, cfg.timeBudgetSec);
}

DiskResult runRandWrite(const DiskProbeConfig& cfg) noexcept {
  if (!cfg.isValid()) {
    return DiskResult{};
  }
  const auto FILE = ScratchFile::create(cfg.directory.data(), cfg.randomFileBytes);
  if (!FILE) {
    return DiskResult{};
  }
  return randomWrites(*FILE, cfg.randomOps, cfg.timeBudgetSec, cfg.useFsync);
}

DiskResult runRandomAtDepth(const ScratchFile& file, std::size_t depth, std::size_t ops,
                            bool write, bool sync) noexcept {
  DiskResult result{};
  if (depth == 0 || ops < depth) {
    return result;
  }

  std::vector<DiskResult> streams;
  std::vector<std::thread> threads;
  bool spawnFailed = false;

  const std::uint64_t START = getMonotonicNs();
  try {
    streams.resize(depth);
    threads.reserve(depth);
    for (std::size_t i = 0; i < depth; ++i) {
      const std::size_t SHARE = ops / depth + ((i < ops % depth) ? 1 : 0);
      threads.emplace_back([&file, &streams, i, SHARE, write, sync] {
        streams[i] = write ? randomWrites(file, SHARE, MAX_DISK_PROBE_SEC, sync, 42 + i)
                           : randomReads(file, SHARE, MAX_DISK_PROBE_SEC, 42 + i);
      });
    }
  } catch (const std::system_error&) {
    spawnFailed = true;
  } catch (const std::bad_alloc&) {
    spawnFailed = true;
  }
  for (std::thread& t : threads) {
    t.join();
  }
  const std::uint64_t END = getMonotonicNs();

  if (spawnFailed) {
    return result;
  }
  std::size_t total = 0;
  for (const DiskResult& S : streams) {
    if (!S.success) {
      return result;
    }
    total += S.operations;
  }

  result.success = (total > 0);
  result.elapsedSec = nsToSec(END - START);
  result.operations = total;
  result.bytesTransferred = static_cast<std::uint64_t>(total) * RANDOM_BLOCK_BYTES;
  return result;
}

/* ----------------------------- Probe Set ----------------------------- */

std::vector<Probe> diskProbes(const DiskProbeConfig& cfg) {
  std::vector<Probe> out;
  out.push_back(makeProbe("disk_seq_write", "Sequential Write", "MB/s",
                          Direction::HIGHER_IS_BETTER,
                          [cfg] { return runSeqWrite(cfg).mbPerSec(); }));
  out.push_back(makeProbe("disk_seq_read", "Sequential Read", "MB/s", Direction::HIGHER_IS_BETTER,
                          [cfg] { return runSeqRead(cfg).mbPerSec(); }));
  out.push_back(makeProbe("disk_rand_write", "Random Write 4K", "IOPS",
                          Direction::HIGHER_IS_BETTER,
                          [cfg] { return runRandWrite(cfg).iops(); }));
  out.push_back(makeProbe("disk_rand_read", "Random Read 4K", "IOPS", Direction::HIGHER_IS_BETTER,
                          [cfg] { return runRandRead(cfg).iops(); }));
  return out;
}

} // namespace suites

} // namespace yardstick
