#ifndef YARDSTICK_SCORING_BASELINE_HPP
#define YARDSTICK_SCORING_BASELINE_HPP
/**
 * @file Baseline.hpp
 * @brief Immutable reference-machine baseline table.
 *
 * Built once per run and passed explicitly to the scorer. Entries whose
 * baseline value is not a positive finite number are dropped at construction,
 * so every lookup that succeeds yields a usable denominator.
 */

#include "src/probe/inc/Probe.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace yardstick {

namespace scoring {

/* ----------------------------- BaselineEntry ----------------------------- */

/**
 * @brief Reference value and direction of one metric key.
 */
struct BaselineEntry {
  double value{0.0};
  probe::Direction direction{probe::Direction::HIGHER_IS_BETTER};
};

/* ----------------------------- BaselineTable ----------------------------- */

/**
 * @brief Read-only metric-key -> baseline map plus the reference core count.
 */
class BaselineTable {
public:
  using Item = std::pair<std::string, BaselineEntry>;

  /**
   * @param items Key/entry pairs; later duplicates are ignored.
   * @param referenceCores Logical cores of the reference machine (>= 1).
   */
  BaselineTable(std::initializer_list<Item> items, std::size_t referenceCores);

  /// Entry for key, or nullopt when absent.
  [[nodiscard]] std::optional<BaselineEntry> lookup(std::string_view key) const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] std::size_t referenceCores() const noexcept { return referenceCores_; }

private:
  std::unordered_map<std::string, BaselineEntry> entries_;
  std::size_t referenceCores_{1};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Baselines for the shipped probe set (reference: 8 logical cores).
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] BaselineTable referenceBaselines();

} // namespace scoring

} // namespace yardstick

#endif // YARDSTICK_SCORING_BASELINE_HPP
