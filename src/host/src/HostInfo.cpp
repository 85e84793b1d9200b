/**
 * @file HostInfo.cpp
 * @brief Host fact collection from procfs, sysfs and sysconf.
 */

#include "src/host/inc/HostInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <sys/statvfs.h> // statvfs
#include <unistd.h>      // sysconf

#include <algorithm>  // std::sort
#include <cstdlib>    // std::strtoull
#include <filesystem> // std::filesystem
#include <fstream>    // std::ifstream

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace yardstick {

namespace host {

namespace {

using yardstick::helpers::files::readSizeString;
using yardstick::helpers::format::bytesBinary;
using yardstick::helpers::strings::copyToFixedArray;
using yardstick::helpers::strings::startsWith;

/// Read first line of a text file; empty on failure.
inline std::string readLine(const fs::path& path) noexcept {
  std::ifstream file(path);
  if (!file) {
    return {};
  }
  std::string line;
  std::getline(file, line);
  return line;
}

inline int readInt(const fs::path& path, int defaultVal) noexcept {
  std::ifstream file(path);
  if (!file) {
    return defaultVal;
  }
  long value = defaultVal;
  file >> value;
  return file ? static_cast<int>(value) : defaultVal;
}

inline std::uint64_t bufferLimit(std::uint64_t physicalRamBytes) noexcept {
  if (physicalRamBytes == 0) {
    return FALLBACK_MAX_BUFFER_BYTES;
  }
  return static_cast<std::uint64_t>(static_cast<double>(physicalRamBytes) *
                                    MAX_BUFFER_RAM_FRACTION);
}

} // namespace

/* ----------------------------- CacheLevel ----------------------------- */

std::string CacheLevel::toString() const {
  return fmt::format("L{} {} {}", level, type.data(), bytesBinary(sizeBytes));
}

/* ----------------------------- HostInfo ----------------------------- */

std::uint64_t HostInfo::maxProbeBufferBytes() const noexcept {
  return bufferLimit(physicalMemoryBytes);
}

std::vector<std::uint64_t> HostInfo::cacheSizes() const {
  std::vector<std::uint64_t> out;
  out.reserve(caches.size());
  for (const CacheLevel& C : caches) {
    out.push_back(C.sizeBytes);
  }
  return out;
}

std::string HostInfo::toString() const {
  std::string out = fmt::format("cpus={} ram={}", logicalCpus,
                                (physicalMemoryBytes > 0) ? bytesBinary(physicalMemoryBytes)
                                                          : std::string("unknown"));
  for (const CacheLevel& C : caches) {
    out += fmt::format(" [{}]", C.toString());
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

std::size_t logicalCpuCount() noexcept {
  const long N = ::sysconf(_SC_NPROCESSORS_ONLN);
  return (N > 0) ? static_cast<std::size_t>(N) : 1U;
}

std::uint64_t physicalMemoryBytes(const std::string& sysRoot) noexcept {
  std::ifstream file(fs::path(sysRoot + "/proc/meminfo"));
  if (file) {
    std::string line;
    while (std::getline(file, line)) {
      if (!startsWith(line, "MemTotal:")) {
        continue;
      }
      const char* ptr = line.c_str() + 9;
      while (*ptr == ' ' || *ptr == '\t') {
        ++ptr;
      }
      char* end = nullptr;
      const unsigned long long KB = std::strtoull(ptr, &end, 10);
      if (end != ptr) {
        return static_cast<std::uint64_t>(KB) * 1024ULL;
      }
    }
  }

  if (!sysRoot.empty()) {
    return 0;
  }
  const long PAGES = ::sysconf(_SC_PHYS_PAGES);
  const long PAGE_SIZE = ::sysconf(_SC_PAGESIZE);
  if (PAGES <= 0 || PAGE_SIZE <= 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(PAGES) * static_cast<std::uint64_t>(PAGE_SIZE);
}

std::vector<CacheLevel> readDataCaches(const std::string& sysRoot) {
  std::vector<CacheLevel> out;
  const fs::path DIR = fs::path(sysRoot + "/sys/devices/system/cpu/cpu0/cache");

  std::error_code ec;
  for (const auto& ENTRY : fs::directory_iterator(DIR, ec)) {
    if (!startsWith(ENTRY.path().filename().string(), "index")) {
      continue;
    }
    const std::string TYPE = readLine(ENTRY.path() / "type");
    if (TYPE != "Data" && TYPE != "Unified") {
      continue;
    }
    CacheLevel c{};
    c.level = readInt(ENTRY.path() / "level", 0);
    c.sizeBytes = readSizeString((ENTRY.path() / "size").c_str());
    if (c.level <= 0 || c.sizeBytes == 0) {
      continue;
    }
    copyToFixedArray(c.type, TYPE);

    bool duplicate = false;
    for (const CacheLevel& EXISTING : out) {
      if (EXISTING.level == c.level) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) {
      out.push_back(c);
    }
  }

  std::sort(out.begin(), out.end(),
            [](const CacheLevel& a, const CacheLevel& b) { return a.level < b.level; });
  return out;
}

bool bufferAllowed(std::uint64_t bytes, std::uint64_t physicalRamBytes) noexcept {
  return bytes <= bufferLimit(physicalRamBytes);
}

std::uint64_t availableDiskBytes(const char* path) noexcept {
  if (path == nullptr) {
    return 0;
  }
  struct statvfs st{};
  if (::statvfs(path, &st) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(st.f_bavail) * static_cast<std::uint64_t>(st.f_frsize);
}

HostInfo getHostInfo() {
  HostInfo info{};
  info.logicalCpus = logicalCpuCount();
  info.physicalMemoryBytes = physicalMemoryBytes();
  info.caches = readDataCaches();
  return info;
}

} // namespace host

} // namespace yardstick
