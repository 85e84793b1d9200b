#ifndef YARDSTICK_HELPERS_FORMAT_HPP
#define YARDSTICK_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for byte sizes and measured values.
 *
 * @note NOT RT-SAFE: All functions return std::string (heap allocation).
 */

#include <cmath>
#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace yardstick {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB).
 * @param bytes Byte count.
 * @return Formatted string, whole numbers without a decimal ("256 KiB", "1.5 MiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;

  const auto SCALED = [bytes](std::uint64_t unit, const char* suffix) {
    if (bytes % unit == 0) {
      return fmt::format("{} {}", bytes / unit, suffix);
    }
    return fmt::format("{:.1f} {}", static_cast<double>(bytes) / static_cast<double>(unit),
                       suffix);
  };

  if (bytes >= GIB) {
    return SCALED(GIB, "GiB");
  }
  if (bytes >= MIB) {
    return SCALED(MIB, "MiB");
  }
  if (bytes >= KIB) {
    return SCALED(KIB, "KiB");
  }
  return fmt::format("{} B", bytes);
}

/**
 * @brief Compact measurement formatting.
 *
 * >= 1e6 -> "1.23 M", >= 1e3 -> "4.56 K", < 1 -> four decimals,
 * otherwise two decimals.
 */
[[nodiscard]] inline std::string compactValue(double value) {
  if (!std::isfinite(value)) {
    return "n/a";
  }
  if (value >= 1'000'000.0) {
    return fmt::format("{:.2f} M", value / 1'000'000.0);
  }
  if (value >= 1'000.0) {
    return fmt::format("{:.2f} K", value / 1'000.0);
  }
  if (value < 1.0) {
    return fmt::format("{:.4f}", value);
  }
  return fmt::format("{:.2f}", value);
}

} // namespace format
} // namespace helpers
} // namespace yardstick

#endif // YARDSTICK_HELPERS_FORMAT_HPP
