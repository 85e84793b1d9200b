#ifndef YARDSTICK_HELPERS_ARGS_HPP
#define YARDSTICK_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI argument parsing for the command-line tools.
 *
 * Each flag declares how many values follow it. Tokens that look like flags
 * ("--x") but are not declared are rejected; bare tokens are ignored.
 *
 * @note Cold-path: Allocates.
 */

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib> // strtod, strtoull
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace yardstick {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--duration"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments against a flag map.
 * @param args  Arguments excluding the program name (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output; a repeated flag keeps its last values.
 * @param error Set on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];
    const auto IT = byFlag.find(TOK);
    if (IT == byFlag.end()) {
      if (TOK.size() > 2 && TOK.substr(0, 2) == "--") {
        error = fmt::format("Unknown option '{}'", TOK);
        return false;
      }
      continue;
    }

    const ArgDef& DEF = map.at(IT->second);
    if (i + DEF.nargs >= args.size()) {
      error = fmt::format("Option '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    std::vector<std::string_view>& out = pargs[IT->second];
    out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
               args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && pargs.find(KEY) == pargs.end()) {
      error = fmt::format("Missing required option '{}'", DEF.flag);
      return false;
    }
  }
  return true;
}

/// True if the flag with this key was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.find(key) != pargs.end();
}

/// First value of a flag, if present.
[[nodiscard]] inline std::optional<std::string_view> value(const ParsedArgs& pargs,
                                                           std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/// Parse an unsigned integer token; nullopt when malformed or out of range.
[[nodiscard]] inline std::optional<std::uint64_t> parseUint(std::string_view tok) {
  if (tok.empty() || tok.front() == '-') {
    return std::nullopt;
  }
  const std::string COPY(tok);
  char* end = nullptr;
  errno = 0;
  const unsigned long long VAL = std::strtoull(COPY.c_str(), &end, 10);
  if (errno != 0 || end == COPY.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VAL);
}

/// Parse a floating-point token; nullopt when malformed.
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view tok) {
  if (tok.empty()) {
    return std::nullopt;
  }
  const std::string COPY(tok);
  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(COPY.c_str(), &end);
  if (errno != 0 || end == COPY.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return VAL;
}

/**
 * @brief Print usage generated from the flag table.
 * @param progName    Program name (argv[0]).
 * @param description One-line tool description.
 * @param map         Flags to document, sorted by flag name.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    const std::string LHS = (def->nargs > 0) ? fmt::format("{} <value>", def->flag)
                                             : std::string(def->flag);
    fmt::print("  {:<22}  {}{}\n", LHS, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace yardstick

#endif // YARDSTICK_HELPERS_ARGS_HPP
