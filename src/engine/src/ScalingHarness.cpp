/**
 * @file ScalingHarness.cpp
 * @brief Fixed-size worker fan-out with completion barrier and hard timeout.
 */

#include "src/engine/inc/ScalingHarness.hpp"

#include "src/engine/inc/Sampling.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <unistd.h> // sysconf

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace yardstick {

namespace engine {

using yardstick::helpers::clock::deadlineAfter;
using yardstick::helpers::clock::getMonotonicNs;
using yardstick::helpers::clock::nsToSec;
using yardstick::helpers::clock::secToNs;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr double TIMEOUT_BUDGET_FACTOR = 3.0;
constexpr double TIMEOUT_SLACK_SEC = 10.0;

/// Upper bound on the caller's wait, keeps the steady_clock deadline representable.
constexpr double MAX_TIMEOUT_SEC = 1.0e9;

/* ----------------------------- Run State ----------------------------- */

/**
 * State shared between the caller and the workers of one run. Held by
 * shared_ptr so detached workers keep it alive after the caller returns.
 */
struct RunState {
  std::mutex mtx;
  std::condition_variable cv;

  probe::Probe probe;
  bool warmup{true};
  std::uint64_t budgetNs{0};

  std::size_t warmedUp{0};
  std::size_t finished{0};
  bool released{false};  ///< Deadline published (or run abandoned)
  bool abandoned{false}; ///< Caller gave up; workers must not report
  std::uint64_t deadlineNs{0};
  std::vector<double> perWorker;
};

void workerMain(const std::shared_ptr<RunState>& state, std::size_t index) noexcept {
  if (state->warmup) {
    (void)state->probe.invoke();
  }

  std::uint64_t deadline = 0;
  {
    std::unique_lock<std::mutex> lock(state->mtx);
    ++state->warmedUp;
    state->cv.notify_all();
    state->cv.wait(lock, [&state] { return state->released; });
    if (state->abandoned) {
      return;
    }
    deadline = state->deadlineNs;
  }

  const SampleAggregate AGG = sampleUntil(state->probe, deadline);

  std::lock_guard<std::mutex> lock(state->mtx);
  if (state->abandoned) {
    return;
  }
  state->perWorker[index] = AGG.average();
  ++state->finished;
  state->cv.notify_all();
}

inline std::size_t logicalCpuCount() noexcept {
  const long N = ::sysconf(_SC_NPROCESSORS_ONLN);
  return (N > 0) ? static_cast<std::size_t>(N) : 1;
}

/// Mark the run abandoned and wake every waiting worker.
void abandon(RunState& state) noexcept {
  std::lock_guard<std::mutex> lock(state.mtx);
  state.abandoned = true;
  state.released = true;
  state.cv.notify_all();
}

} // namespace

/* ----------------------------- HarnessStatus ----------------------------- */

const char* toString(HarnessStatus status) noexcept {
  switch (status) {
  case HarnessStatus::OK:
    return "ok";
  case HarnessStatus::INVALID_ARGUMENT:
    return "invalid argument";
  case HarnessStatus::SPAWN_FAILED:
    return "spawn failed";
  case HarnessStatus::TIMED_OUT:
    return "timed out";
  }
  return "unknown";
}

/* ----------------------------- ScalingConfig ----------------------------- */

bool ScalingConfig::isValid() const noexcept {
  return std::isfinite(budgetSec) && budgetSec > 0.0 && std::isfinite(timeoutSec) &&
         timeoutSec >= 0.0;
}

std::size_t ScalingConfig::resolvedWorkers() const noexcept {
  return (workers > 0) ? workers : logicalCpuCount();
}

double ScalingConfig::resolvedTimeoutSec() const noexcept {
  return (timeoutSec > 0.0) ? timeoutSec : budgetSec * TIMEOUT_BUDGET_FACTOR + TIMEOUT_SLACK_SEC;
}

/* ----------------------------- ScalingResult ----------------------------- */

std::string ScalingResult::toString() const {
  return fmt::format("workers={} aggregate={:.4f} status={} elapsed={:.3f}s", workers,
                     aggregateThroughput, engine::toString(status), nsToSec(elapsedNs));
}

/* ----------------------------- API ----------------------------- */

ScalingResult runScaled(const probe::Probe& p, const ScalingConfig& cfg) noexcept {
  ScalingResult result{};
  if (!cfg.isValid() || !p.isValid()) {
    result.status = HarnessStatus::INVALID_ARGUMENT;
    return result;
  }

  const std::size_t N = cfg.resolvedWorkers();
  const std::uint64_t START = getMonotonicNs();
  const double TIMEOUT_SEC = std::min(cfg.resolvedTimeoutSec(), MAX_TIMEOUT_SEC);
  const auto TIMEOUT = std::chrono::steady_clock::now() +
                       std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                           std::chrono::duration<double>(TIMEOUT_SEC));

  auto state = std::make_shared<RunState>();
  state->probe = p;
  state->warmup = cfg.warmup;
  state->budgetNs = secToNs(cfg.budgetSec);
  state->perWorker.assign(N, 0.0);

  std::vector<std::thread> threads;
  threads.reserve(N);
  try {
    for (std::size_t i = 0; i < N; ++i) {
      threads.emplace_back(workerMain, state, i);
    }
  } catch (const std::system_error&) {
    abandon(*state);
    for (std::thread& t : threads) {
      t.join();
    }
    result.status = HarnessStatus::SPAWN_FAILED;
    return result;
  }
  result.workers = N;

  bool completed = false;
  {
    std::unique_lock<std::mutex> lock(state->mtx);
    const bool WARMED =
        state->cv.wait_until(lock, TIMEOUT, [&state, N] { return state->warmedUp == N; });
    if (WARMED) {
      state->deadlineNs = deadlineAfter(getMonotonicNs(), state->budgetNs);
      state->released = true;
      state->cv.notify_all();
      completed =
          state->cv.wait_until(lock, TIMEOUT, [&state, N] { return state->finished == N; });
    }
  }

  if (!completed) {
    abandon(*state);
    for (std::thread& t : threads) {
      t.detach();
    }
    result.status = HarnessStatus::TIMED_OUT;
    result.elapsedNs = getMonotonicNs() - START;
    return result;
  }

  for (std::thread& t : threads) {
    t.join();
  }

  result.perWorker = state->perWorker;
  for (const double V : result.perWorker) {
    result.aggregateThroughput += V;
  }
  result.status = HarnessStatus::OK;
  result.elapsedNs = getMonotonicNs() - START;
  return result;
}

} // namespace engine

} // namespace yardstick
