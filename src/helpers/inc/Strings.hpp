#ifndef YARDSTICK_HELPERS_STRINGS_HPP
#define YARDSTICK_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Small string helpers shared by the engine and the CLI tools.
 *
 * Fixed-array copies are used for labels stored inside value types (thermal
 * phases, directories). The view helpers back the comma-list flag parsing.
 *
 * @note Fixed-array helpers do not allocate. toLower() returns std::string.
 */

#include <array>
#include <cctype> // std::tolower, std::isspace
#include <cstddef>
#include <cstring> // std::memcpy
#include <string>
#include <string_view>
#include <vector>

namespace yardstick {
namespace helpers {
namespace strings {

/* ----------------------------- Fixed Arrays ----------------------------- */

/**
 * @brief Copy a view into a fixed-size array, truncating and null-terminating.
 * @tparam N Array size.
 * @param dest Destination array.
 * @param src Source characters (need not be null-terminated).
 */
template <std::size_t N>
inline void copyToFixedArray(std::array<char, N>& dest, std::string_view src) noexcept {
  static_assert(N > 0, "destination must hold the terminator");
  const std::size_t COPY_LEN = (src.size() < N - 1) ? src.size() : (N - 1);
  if (COPY_LEN > 0) {
    std::memcpy(dest.data(), src.data(), COPY_LEN);
  }
  dest[COPY_LEN] = '\0';
}

/// Null-safe overload for C strings.
template <std::size_t N>
inline void copyToFixedArray(std::array<char, N>& dest, const char* src) noexcept {
  copyToFixedArray(dest, (src == nullptr) ? std::string_view{} : std::string_view{src});
}

/* ----------------------------- Views ----------------------------- */

/// Strip leading and trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  std::size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

/// ASCII lower-case copy.
[[nodiscard]] inline std::string toLower(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/**
 * @brief Split on a separator; empty (after trim) items are dropped.
 * @return Views into text; text must outlive them.
 */
[[nodiscard]] inline std::vector<std::string_view> splitList(std::string_view text,
                                                             char sep = ',') {
  std::vector<std::string_view> items;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      pos = text.size();
    }
    const std::string_view ITEM = trim(text.substr(start, pos - start));
    if (!ITEM.empty()) {
      items.push_back(ITEM);
    }
    start = pos + 1;
  }
  return items;
}

/// Check if text starts with prefix.
[[nodiscard]] inline bool startsWith(std::string_view text, std::string_view prefix) noexcept {
  return text.substr(0, prefix.size()) == prefix;
}

} // namespace strings
} // namespace helpers
} // namespace yardstick

#endif // YARDSTICK_HELPERS_STRINGS_HPP
