#ifndef YARDSTICK_HELPERS_FILES_HPP
#define YARDSTICK_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief sysfs/procfs readers used by the thermal and host-info modules.
 *
 * C-style I/O (open/read/close) into fixed buffers. Every reader returns a
 * caller-supplied default when the file is missing or unparsable, so callers
 * can fail open.
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR
#include <unistd.h>   // read, close

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtoll, strtoull

namespace yardstick {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size for single-value sysfs reads.
inline constexpr std::size_t SMALL_READ_SIZE = 64;

/* ----------------------------- Reading ----------------------------- */

/**
 * @brief Read a file into a buffer, stripping trailing whitespace.
 * @param path File path.
 * @param buf Output buffer (always null-terminated when bufSize > 0).
 * @param bufSize Buffer capacity.
 * @return Bytes kept after stripping, 0 on error or empty file.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (buf == nullptr || bufSize == 0) {
    return 0;
  }
  buf[0] = '\0';
  if (path == nullptr) {
    return 0;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }
  ::close(FD);

  while (total > 0 && std::isspace(static_cast<unsigned char>(buf[total - 1])) != 0) {
    --total;
  }
  buf[total] = '\0';
  return total;
}

/**
 * @brief Read a sysfs size string ("32K", "1024K", "8M", "65536").
 * @return Size in bytes, 0 on error.
 */
[[nodiscard]] inline std::uint64_t readSizeString(const char* path) noexcept {
  std::array<char, SMALL_READ_SIZE> buf{};
  if (readFileToBuffer(path, buf.data(), buf.size()) == 0) {
    return 0;
  }
  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(buf.data(), &end, 10);
  if (end == buf.data()) {
    return 0;
  }
  switch (*end) {
  case 'K':
  case 'k':
    return static_cast<std::uint64_t>(VAL) * 1024ULL;
  case 'M':
  case 'm':
    return static_cast<std::uint64_t>(VAL) * 1024ULL * 1024ULL;
  case 'G':
  case 'g':
    return static_cast<std::uint64_t>(VAL) * 1024ULL * 1024ULL * 1024ULL;
  default:
    return static_cast<std::uint64_t>(VAL);
  }
}

/* ----------------------------- Paths ----------------------------- */

/// True if path exists and is a directory.
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace yardstick

#endif // YARDSTICK_HELPERS_FILES_HPP
