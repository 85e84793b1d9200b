#ifndef YARDSTICK_ENGINE_RESULTS_HPP
#define YARDSTICK_ENGINE_RESULTS_HPP
/**
 * @file Results.hpp
 * @brief Benchmark categories, selection and raw run results.
 *
 * Categories run in the fixed declared order CPU single, CPU multi, memory,
 * disk, GPU. A category that was not selected never appears in RunResults.
 */

#include "src/probe/inc/Probe.hpp"
#include "src/thermal/inc/ThermalSupervisor.hpp"

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yardstick {

namespace engine {

/* ----------------------------- Category ----------------------------- */

/**
 * @brief Benchmark category, in run order.
 */
enum class Category : std::uint8_t {
  CPU_SINGLE = 0,
  CPU_MULTI,
  MEMORY,
  DISK,
  GPU,
};

/// Number of categories.
inline constexpr std::size_t CATEGORY_COUNT = 5;

/// All categories in run order.
inline constexpr std::array<Category, CATEGORY_COUNT> ALL_CATEGORIES{
    Category::CPU_SINGLE, Category::CPU_MULTI, Category::MEMORY, Category::DISK, Category::GPU};

/// Index of a category into per-category arrays.
[[nodiscard]] constexpr std::size_t indexOf(Category c) noexcept {
  return static_cast<std::size_t>(c);
}

/// Canonical identifier ("cpu-single", "memory", ...); used in phase labels.
[[nodiscard]] const char* toString(Category c) noexcept;

/// Display name ("CPU Single-Core").
[[nodiscard]] const char* displayName(Category c) noexcept;

/**
 * @brief Parse a category name or alias (case-insensitive).
 *
 * Accepts cpu-single|cpusingle, cpu-multi|cpumulti, memory|ram,
 * disk|storage, gpu|compute.
 */
[[nodiscard]] std::optional<Category> parseCategory(std::string_view name);

/* ----------------------------- CategorySelection ----------------------------- */

/**
 * @brief Set of selected categories.
 */
struct CategorySelection {
  std::bitset<CATEGORY_COUNT> bits{};

  /// Every category.
  [[nodiscard]] static CategorySelection all() noexcept;

  void add(Category c) noexcept { bits.set(indexOf(c)); }
  [[nodiscard]] bool contains(Category c) const noexcept { return bits.test(indexOf(c)); }
  [[nodiscard]] bool empty() const noexcept { return bits.none(); }
  [[nodiscard]] std::size_t size() const noexcept { return bits.count(); }

  /// Selected categories in run order.
  [[nodiscard]] std::vector<Category> ordered() const;

  /// Comma-separated identifiers.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse a comma list of category names.
 *
 * Unknown names are ignored. An empty result selects every category.
 */
[[nodiscard]] CategorySelection parseSelection(std::string_view list);

/* ----------------------------- MetricResult ----------------------------- */

/**
 * @brief Averaged measurement of one probe.
 */
struct MetricResult {
  std::string key{};   ///< Baseline key
  std::string label{}; ///< Display name
  std::string unit{};
  probe::Direction direction{probe::Direction::HIGHER_IS_BETTER};
  double value{0.0};          ///< Average; 0 when failed
  std::uint64_t samples{0};   ///< Successful invocations (or workers for scaled runs)

  [[nodiscard]] bool failed() const noexcept { return probe::isFailedValue(value); }

  /// Compact value, or "Failed".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string formattedValue() const;

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- CategoryResult ----------------------------- */

/**
 * @brief Metrics and thermal bracket of one executed category.
 */
struct CategoryResult {
  Category category{Category::CPU_SINGLE};
  std::vector<MetricResult> metrics{};
  double durationSec{0.0};
  thermal::ThermalLevel thermalStart{thermal::ThermalLevel::NOMINAL};
  thermal::ThermalLevel thermalEnd{thermal::ThermalLevel::NOMINAL};

  /// Start or end level was SERIOUS or CRITICAL.
  [[nodiscard]] bool hadThrottling() const noexcept;

  /// No metrics, or every metric failed.
  [[nodiscard]] bool allFailed() const noexcept;

  /// Metric by key.
  [[nodiscard]] const MetricResult* find(std::string_view key) const noexcept;

  /// "key: value unit, ...".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string summary() const;
};

/* ----------------------------- RunResults ----------------------------- */

/**
 * @brief Everything a run produced, before scoring.
 */
struct RunResults {
  std::uint64_t timestampMs{0};                    ///< Wall clock at run start
  std::vector<CategoryResult> categories{};        ///< Executed categories, run order
  std::vector<thermal::ThermalSnapshot> snapshots{}; ///< Full thermal log
  std::string thermalSummary{};                    ///< "nominal -> fair"
  bool quickMode{false};
  double categoryBudgetSec{0.0};
  std::size_t logicalCpus{0};

  /// Result for a category, or nullptr when it did not run.
  [[nodiscard]] const CategoryResult* find(Category c) const noexcept;

  /// Any category or snapshot at SERIOUS or CRITICAL.
  [[nodiscard]] bool hadAnyThrottling() const noexcept;
};

} // namespace engine

} // namespace yardstick

#endif // YARDSTICK_ENGINE_RESULTS_HPP
