/**
 * @file Probe.cpp
 * @brief Probe invocation and classification.
 */

#include "src/probe/inc/Probe.hpp"

#include "src/helpers/inc/Clock.hpp"

#include <cmath>
#include <exception>
#include <utility>

#include <fmt/core.h>

namespace yardstick {

namespace probe {

using yardstick::helpers::clock::getMonotonicNs;

/* ----------------------------- Enums ----------------------------- */

const char* toString(Direction dir) noexcept {
  switch (dir) {
  case Direction::HIGHER_IS_BETTER:
    return "higher is better";
  case Direction::LOWER_IS_BETTER:
    return "lower is better";
  }
  return "unknown";
}

const char* indicator(Direction dir) noexcept {
  return (dir == Direction::LOWER_IS_BETTER) ? "v" : "^";
}

const char* toString(ProbeStatus status) noexcept {
  switch (status) {
  case ProbeStatus::OK:
    return "ok";
  case ProbeStatus::FAILED:
    return "failed";
  case ProbeStatus::THREW:
    return "threw";
  case ProbeStatus::NO_CALLABLE:
    return "no callable";
  }
  return "unknown";
}

/* ----------------------------- Probe ----------------------------- */

bool isFailedValue(double value) noexcept { return !std::isfinite(value) || !(value > 0.0); }

ProbeOutcome Probe::invoke() const noexcept {
  ProbeOutcome out{};
  if (!fn) {
    out.status = ProbeStatus::NO_CALLABLE;
    return out;
  }

  const std::uint64_t START = getMonotonicNs();
  double raw = 0.0;
  try {
    raw = fn();
    out.status = isFailedValue(raw) ? ProbeStatus::FAILED : ProbeStatus::OK;
  } catch (const std::exception&) {
    out.status = ProbeStatus::THREW;
  } catch (...) {
    out.status = ProbeStatus::THREW;
  }
  out.elapsedNs = getMonotonicNs() - START;
  out.value = out.ok() ? raw : 0.0;
  return out;
}

bool Probe::isValid() const noexcept { return !key.empty() && !unit.empty() && fn != nullptr; }

std::string Probe::toString() const {
  return fmt::format("{} [{}, {}]", key, unit, probe::toString(direction));
}

Probe makeProbe(std::string key, std::string label, std::string unit, Direction direction,
                ProbeFn fn) {
  Probe p{};
  p.key = std::move(key);
  p.label = std::move(label);
  p.unit = std::move(unit);
  p.direction = direction;
  p.fn = std::move(fn);
  return p;
}

} // namespace probe

} // namespace yardstick
