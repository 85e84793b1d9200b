/**
 * @file Scoring.cpp
 * @brief Ratio normalization, geometric-mean category scores, weighted total.
 */

#include "src/scoring/inc/Scoring.hpp"

#include <cmath>
#include <vector>

#include <fmt/core.h>

namespace yardstick {

namespace scoring {

using engine::Category;

/* ----------------------------- Policy ----------------------------- */

CategoryPolicy policyFor(Category c) noexcept {
  CategoryPolicy p{};
  switch (c) {
  case Category::CPU_SINGLE:
    p.weight = 0.25;
    break;
  case Category::CPU_MULTI:
    p.weight = 0.25;
    p.scaleByCoreCount = true;
    break;
  case Category::MEMORY:
    p.weight = 0.15;
    break;
  case Category::DISK:
    p.weight = 0.15;
    p.clampRatios = true;
    break;
  case Category::GPU:
    p.weight = 0.20;
    break;
  }
  return p;
}

/* ----------------------------- CategoryOutcome ----------------------------- */

bool ran(const CategoryOutcome& outcome) noexcept {
  return !std::holds_alternative<NotSelected>(outcome);
}

double scoreOf(const CategoryOutcome& outcome) noexcept {
  const Ran* r = std::get_if<Ran>(&outcome);
  return (r != nullptr) ? r->score : 0.0;
}

std::string toString(const CategoryOutcome& outcome) {
  if (const Ran* r = std::get_if<Ran>(&outcome)) {
    return fmt::format("{:.0f}", r->score);
  }
  if (std::holds_alternative<RanAndFailed>(outcome)) {
    return "Failed";
  }
  return "not run";
}

/* ----------------------------- ScoreCard ----------------------------- */

bool ScoreCard::anyRan() const noexcept {
  for (const CategoryOutcome& O : outcomes) {
    if (ran(O)) {
      return true;
    }
  }
  return false;
}

std::string ScoreCard::toString() const {
  std::string out;
  for (const Category C : engine::ALL_CATEGORIES) {
    out += fmt::format("  {:<18} {:>8}\n", engine::displayName(C),
                       scoring::toString(outcome(C)));
  }
  out += fmt::format("  {:<18} {:>8.0f}", "TOTAL", total);
  return out;
}

/* ----------------------------- API ----------------------------- */

std::optional<double> metricRatio(double value, const BaselineEntry& entry,
                                  double baselineScale) noexcept {
  if (probe::isFailedValue(value) || !std::isfinite(baselineScale) || !(baselineScale > 0.0)) {
    return std::nullopt;
  }
  const double BASE = entry.value * baselineScale;
  if (!(BASE > 0.0) || !std::isfinite(BASE)) {
    return std::nullopt;
  }
  return (entry.direction == probe::Direction::LOWER_IS_BETTER) ? BASE / value : value / BASE;
}

double clampRatio(double ratio, double lo, double hi) noexcept {
  if (ratio < lo) {
    return lo;
  }
  if (ratio > hi) {
    return hi;
  }
  return ratio;
}

double geometricScore(const double* ratios, std::size_t count) noexcept {
  if (ratios == nullptr || count == 0) {
    return 0.0;
  }
  double logSum = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    logSum += std::log(ratios[i]);
  }
  return REFERENCE_SCORE * std::exp(logSum / static_cast<double>(count));
}

CategoryOutcome scoreCategory(const engine::CategoryResult& result, const BaselineTable& baselines,
                              const ScoringContext& ctx) {
  const CategoryPolicy POLICY = policyFor(result.category);

  double scale = 1.0;
  if (POLICY.scaleByCoreCount && ctx.actualCores > 0) {
    scale = static_cast<double>(ctx.actualCores) / static_cast<double>(baselines.referenceCores());
  }

  std::vector<double> ratios;
  ratios.reserve(result.metrics.size());
  for (const engine::MetricResult& M : result.metrics) {
    const auto ENTRY = baselines.lookup(M.key);
    if (!ENTRY) {
      continue;
    }
    const auto RATIO = metricRatio(M.value, *ENTRY, scale);
    if (!RATIO) {
      continue;
    }
    ratios.push_back(POLICY.clampRatios ? clampRatio(*RATIO) : *RATIO);
  }

  if (ratios.empty()) {
    return RanAndFailed{};
  }
  return Ran{geometricScore(ratios.data(), ratios.size()), ratios.size()};
}

double totalScore(const std::array<CategoryOutcome, engine::CATEGORY_COUNT>& outcomes) noexcept {
  double weighted = 0.0;
  double weightSum = 0.0;
  for (const Category C : engine::ALL_CATEGORIES) {
    const CategoryOutcome& O = outcomes[engine::indexOf(C)];
    if (!ran(O)) {
      continue;
    }
    const double W = policyFor(C).weight;
    weighted += W * scoreOf(O);
    weightSum += W;
  }
  return (weightSum > 0.0) ? weighted / weightSum : 0.0;
}

ScoreCard scoreRun(const engine::RunResults& run, const BaselineTable& baselines,
                   const ScoringContext& ctx) {
  ScoreCard card{};
  for (const engine::CategoryResult& R : run.categories) {
    card.outcomes[engine::indexOf(R.category)] = scoreCategory(R, baselines, ctx);
  }
  card.total = totalScore(card.outcomes);
  return card;
}

} // namespace scoring

} // namespace yardstick
