/**
 * @file Results.cpp
 * @brief Category naming, selection parsing and result helpers.
 */

#include "src/engine/inc/Results.hpp"

#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace yardstick {

namespace engine {

using yardstick::helpers::format::compactValue;
using yardstick::helpers::strings::splitList;
using yardstick::helpers::strings::toLower;

/* ----------------------------- Category ----------------------------- */

const char* toString(Category c) noexcept {
  switch (c) {
  case Category::CPU_SINGLE:
    return "cpu-single";
  case Category::CPU_MULTI:
    return "cpu-multi";
  case Category::MEMORY:
    return "memory";
  case Category::DISK:
    return "disk";
  case Category::GPU:
    return "gpu";
  }
  return "unknown";
}

const char* displayName(Category c) noexcept {
  switch (c) {
  case Category::CPU_SINGLE:
    return "CPU Single-Core";
  case Category::CPU_MULTI:
    return "CPU Multi-Core";
  case Category::MEMORY:
    return "Memory";
  case Category::DISK:
    return "Disk";
  case Category::GPU:
    return "GPU";
  }
  return "Unknown";
}

std::optional<Category> parseCategory(std::string_view name) {
  const std::string N = toLower(name);
  if (N == "cpu-single" || N == "cpusingle") {
    return Category::CPU_SINGLE;
  }
  if (N == "cpu-multi" || N == "cpumulti") {
    return Category::CPU_MULTI;
  }
  if (N == "memory" || N == "ram") {
    return Category::MEMORY;
  }
  if (N == "disk" || N == "storage") {
    return Category::DISK;
  }
  if (N == "gpu" || N == "compute") {
    return Category::GPU;
  }
  return std::nullopt;
}

/* ----------------------------- CategorySelection ----------------------------- */

CategorySelection CategorySelection::all() noexcept {
  CategorySelection sel{};
  sel.bits.set();
  return sel;
}

std::vector<Category> CategorySelection::ordered() const {
  std::vector<Category> out;
  for (const Category C : ALL_CATEGORIES) {
    if (contains(C)) {
      out.push_back(C);
    }
  }
  return out;
}

std::string CategorySelection::toString() const {
  std::string out;
  for (const Category C : ordered()) {
    if (!out.empty()) {
      out += ',';
    }
    out += engine::toString(C);
  }
  return out;
}

CategorySelection parseSelection(std::string_view list) {
  CategorySelection sel{};
  for (const std::string_view ITEM : splitList(list, ',')) {
    if (const auto CAT = parseCategory(ITEM)) {
      sel.add(*CAT);
    }
  }
  return sel.empty() ? CategorySelection::all() : sel;
}

/* ----------------------------- MetricResult ----------------------------- */

std::string MetricResult::formattedValue() const {
  return failed() ? std::string("Failed") : compactValue(value);
}

std::string MetricResult::toString() const {
  return fmt::format("{}: {} {} {}", label.empty() ? key : label, formattedValue(), unit,
                     probe::indicator(direction));
}

/* ----------------------------- CategoryResult ----------------------------- */

bool CategoryResult::hadThrottling() const noexcept {
  return thermal::isThrottlingLevel(thermalStart) || thermal::isThrottlingLevel(thermalEnd);
}

bool CategoryResult::allFailed() const noexcept {
  for (const MetricResult& M : metrics) {
    if (!M.failed()) {
      return false;
    }
  }
  return true;
}

const MetricResult* CategoryResult::find(std::string_view key) const noexcept {
  for (const MetricResult& M : metrics) {
    if (M.key == key) {
      return &M;
    }
  }
  return nullptr;
}

std::string CategoryResult::summary() const {
  std::string out;
  for (const MetricResult& M : metrics) {
    if (!out.empty()) {
      out += ", ";
    }
    out += fmt::format("{}: {} {}", M.key, M.formattedValue(), M.unit);
  }
  return out;
}

/* ----------------------------- RunResults ----------------------------- */

const CategoryResult* RunResults::find(Category c) const noexcept {
  for (const CategoryResult& R : categories) {
    if (R.category == c) {
      return &R;
    }
  }
  return nullptr;
}

bool RunResults::hadAnyThrottling() const noexcept {
  for (const CategoryResult& R : categories) {
    if (R.hadThrottling()) {
      return true;
    }
  }
  for (const thermal::ThermalSnapshot& S : snapshots) {
    if (thermal::isThrottlingLevel(S.level)) {
      return true;
    }
  }
  return false;
}

} // namespace engine

} // namespace yardstick
