#ifndef YARDSTICK_SCORING_SCORING_HPP
#define YARDSTICK_SCORING_SCORING_HPP
/**
 * @file Scoring.hpp
 * @brief Geometric-mean category scores and the renormalized weighted total.
 *
 * Per metric:    ratio = v / b (higher is better) or b / v (lower is better)
 * Per category:  score = 1000 * exp(mean(ln ratio)) over unfailed metrics
 * Total:         sum(w * score) / sum(w) over categories that ran
 *
 * Failed metrics and metrics without a baseline are excluded. Disk ratios are
 * clamped to [0.25, 4]. CPU multi-core baselines are scaled by
 * actualCores / referenceCores.
 */

#include "src/engine/inc/Results.hpp"
#include "src/scoring/inc/Baseline.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace yardstick {

namespace scoring {

/* ----------------------------- Constants ----------------------------- */

/// Score of the reference machine in every category.
inline constexpr double REFERENCE_SCORE = 1000.0;

/// Disk ratio clamp bounds.
inline constexpr double DISK_RATIO_MIN = 0.25;
inline constexpr double DISK_RATIO_MAX = 4.0;

/* ----------------------------- CategoryPolicy ----------------------------- */

/**
 * @brief Per-category scoring rules.
 */
struct CategoryPolicy {
  double weight{0.0};          ///< Share of the total when every category runs
  bool clampRatios{false};     ///< Clamp ratios to [DISK_RATIO_MIN, DISK_RATIO_MAX]
  bool scaleByCoreCount{false}; ///< Scale baselines by actual/reference cores
};

/// Policy of a category (weights 0.25, 0.25, 0.15, 0.15, 0.20).
[[nodiscard]] CategoryPolicy policyFor(engine::Category c) noexcept;

/* ----------------------------- CategoryOutcome ----------------------------- */

/// Category was not selected; contributes nothing.
struct NotSelected {};

/// Category ran and produced a score from `scoredMetrics` metrics.
struct Ran {
  double score{0.0};
  std::size_t scoredMetrics{0};
};

/// Category ran but no metric could be scored; counts as 0 with its weight.
struct RanAndFailed {};

/// Outcome of one category.
using CategoryOutcome = std::variant<NotSelected, Ran, RanAndFailed>;

/// Ran or RanAndFailed.
[[nodiscard]] bool ran(const CategoryOutcome& outcome) noexcept;

/// Score of a Ran outcome, 0 otherwise.
[[nodiscard]] double scoreOf(const CategoryOutcome& outcome) noexcept;

/// "1234", "Failed" or "not run".
/// @note NOT RT-safe: Allocates std::string.
[[nodiscard]] std::string toString(const CategoryOutcome& outcome);

/* ----------------------------- ScoringContext ----------------------------- */

/**
 * @brief Host facts the scorer needs.
 */
struct ScoringContext {
  std::size_t actualCores{0}; ///< Logical cores of the measured host (0 = no scaling)
};

/* ----------------------------- ScoreCard ----------------------------- */

/**
 * @brief Outcomes of every category and the total.
 */
struct ScoreCard {
  std::array<CategoryOutcome, engine::CATEGORY_COUNT> outcomes{};
  double total{0.0};

  [[nodiscard]] const CategoryOutcome& outcome(engine::Category c) const noexcept {
    return outcomes[engine::indexOf(c)];
  }

  /// At least one category ran.
  [[nodiscard]] bool anyRan() const noexcept;

  /// Multi-line score table.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Ratio of one measurement to its baseline.
 * @param value Observed value.
 * @param entry Baseline entry.
 * @param baselineScale Multiplier applied to the baseline value (core scaling).
 * @return Ratio, or nullopt for a failed measurement or invalid scale.
 */
[[nodiscard]] std::optional<double> metricRatio(double value, const BaselineEntry& entry,
                                                double baselineScale = 1.0) noexcept;

/// Clamp a ratio into [lo, hi].
[[nodiscard]] double clampRatio(double ratio, double lo = DISK_RATIO_MIN,
                                double hi = DISK_RATIO_MAX) noexcept;

/// 1000 * geometric mean of ratios; 0 when empty.
[[nodiscard]] double geometricScore(const double* ratios, std::size_t count) noexcept;

/**
 * @brief Score one executed category.
 * @return Ran with the geometric-mean score, or RanAndFailed when no metric
 *         could be scored.
 */
[[nodiscard]] CategoryOutcome scoreCategory(const engine::CategoryResult& result,
                                            const BaselineTable& baselines,
                                            const ScoringContext& ctx);

/// Weighted total over categories that ran, weights renormalized.
[[nodiscard]] double totalScore(
    const std::array<CategoryOutcome, engine::CATEGORY_COUNT>& outcomes) noexcept;

/**
 * @brief Score a whole run. Categories absent from `run` are NotSelected.
 */
[[nodiscard]] ScoreCard scoreRun(const engine::RunResults& run, const BaselineTable& baselines,
                                 const ScoringContext& ctx);

} // namespace scoring

} // namespace yardstick

#endif // YARDSTICK_SCORING_SCORING_HPP
