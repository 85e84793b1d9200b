/**
 * @file ThermalSupervisor.cpp
 * @brief Thermal snapshot log and derived queries.
 */

#include "src/thermal/inc/ThermalSupervisor.hpp"

#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <exception>
#include <utility>

#include <fmt/core.h>

namespace yardstick {

namespace thermal {

using yardstick::helpers::clock::getWallClockMs;
using yardstick::helpers::strings::copyToFixedArray;

/* ----------------------------- ThermalSnapshot ----------------------------- */

std::string ThermalSnapshot::toString() const {
  return fmt::format("{:<24} {}", phase.data(), thermal::toString(level));
}

/* ----------------------------- ThermalSupervisor ----------------------------- */

ThermalSupervisor::ThermalSupervisor()
    : ThermalSupervisor([] { return readThermal(); }) {}

ThermalSupervisor::ThermalSupervisor(ThermalSource source) : source_(std::move(source)) {
  ThermalReading reading{};
  if (readSource(reading)) {
    baselineThrottleEvents_ = reading.throttleEvents;
  }
}

bool ThermalSupervisor::readSource(ThermalReading& out) const noexcept {
  if (!source_) {
    return false;
  }
  try {
    out = source_();
  } catch (const std::exception&) {
    return false;
  } catch (...) {
    return false;
  }
  return true;
}

ThermalLevel ThermalSupervisor::currentLevel() const noexcept {
  ThermalReading reading{};
  if (!readSource(reading)) {
    return ThermalLevel::NOMINAL;
  }
  return classify(reading, baselineThrottleEvents_);
}

bool ThermalSupervisor::isThrottling() const noexcept {
  return isThrottlingLevel(currentLevel());
}

const ThermalSnapshot& ThermalSupervisor::record(std::string_view phase) {
  ThermalSnapshot snap{};
  snap.timestampMs = getWallClockMs();
  snap.level = currentLevel();
  copyToFixedArray(snap.phase, phase);
  snapshots_.push_back(snap);
  return snapshots_.back();
}

ThermalLevel ThermalSupervisor::startLevel() const noexcept {
  return snapshots_.empty() ? ThermalLevel::NOMINAL : snapshots_.front().level;
}

ThermalLevel ThermalSupervisor::endLevel() const noexcept {
  return snapshots_.empty() ? ThermalLevel::NOMINAL : snapshots_.back().level;
}

ThermalLevel ThermalSupervisor::worstLevel() const noexcept {
  ThermalLevel level = ThermalLevel::NOMINAL;
  for (const ThermalSnapshot& S : snapshots_) {
    level = worse(level, S.level);
  }
  return level;
}

bool ThermalSupervisor::hadThrottling() const noexcept {
  return isThrottlingLevel(worstLevel());
}

std::string ThermalSupervisor::summary() const {
  if (snapshots_.empty()) {
    return "no thermal data";
  }
  return fmt::format("{} -> {}{}", thermal::toString(startLevel()),
                     thermal::toString(endLevel()),
                     hadThrottling() ? " (throttling detected)" : "");
}

} // namespace thermal

} // namespace yardstick
