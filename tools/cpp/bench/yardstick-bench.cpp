/**
 * @file yardstick-bench.cpp
 * @brief Run the benchmark categories and print per-category and total scores.
 *
 * Categories run in declared order with thermal snapshots around each one.
 * Throttling is reported as a warning and never stops the run.
 */

#include "src/engine/inc/Runner.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/host/inc/HostInfo.hpp"
#include "src/scoring/inc/Scoring.hpp"
#include "src/suites/inc/GpuProbes.hpp"
#include "src/suites/inc/Suites.hpp"
#include "src/thermal/inc/ThermalSupervisor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace args = yardstick::helpers::args;
namespace engine = yardstick::engine;
namespace scoring = yardstick::scoring;
namespace suites = yardstick::suites;
namespace thermal = yardstick::thermal;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_ONLY = 2,
  ARG_QUICK = 3,
  ARG_STRESS = 4,
  ARG_DURATION = 5,
  ARG_WORKERS = 6,
  ARG_DIR = 7,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Measure CPU, memory, disk and GPU performance and report a composite score.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_ONLY] = {"--only", 1, false,
                   "Comma list: cpu-single, cpu-multi, memory, disk, gpu (default: all)"};
  map[ARG_QUICK] = {"--quick", 0, false, "Quick mode: 3 s per category, no warm-up"};
  map[ARG_STRESS] = {"--stress", 0, false, "Stress mode: 60 s per category"};
  map[ARG_DURATION] = {"--duration", 1, false, "Seconds per category (min 1, overrides modes)"};
  map[ARG_WORKERS] = {"--workers", 1, false, "Multi-core workers (default: logical CPUs)"};
  map[ARG_DIR] = {"--dir", 1, false, "Directory for disk test files (default: /tmp)"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printCategory(const engine::CategoryResult& result, const scoring::CategoryOutcome& outcome) {
  fmt::print("\n--- {} ({:.1f}s) ---\n", engine::displayName(result.category), result.durationSec);
  for (const engine::MetricResult& m : result.metrics) {
    fmt::print("  {:<22} {:>12} {:<8} {}\n", m.label, m.formattedValue(), m.unit,
               yardstick::probe::indicator(m.direction));
  }
  fmt::print("  Score: {}\n", scoring::toString(outcome));
  if (result.hadThrottling()) {
    fmt::print("  Thermal: {} -> {} (throttling)\n", thermal::toString(result.thermalStart),
               thermal::toString(result.thermalEnd));
  }
}

void printHuman(const engine::RunResults& run, const scoring::ScoreCard& card,
                const yardstick::host::HostInfo& host) {
  fmt::print("=== Yardstick Benchmark ===\n");
  fmt::print("Host: {}\n", host.toString());
  fmt::print("Budget: {:.0f}s per category{}\n", run.categoryBudgetSec,
             run.quickMode ? " (quick mode)" : "");

  for (const engine::CategoryResult& result : run.categories) {
    printCategory(result, card.outcome(result.category));
  }

  fmt::print("\n=== Scores ===\n{}\n", card.toString());
  if (run.categories.size() < engine::CATEGORY_COUNT) {
    fmt::print("Note: partial run; the total is reweighted over the categories that ran.\n");
  }
  if (run.quickMode) {
    fmt::print("Note: quick mode scores are less stable than standard runs.\n");
  }
  fmt::print("Thermal: {}\n", run.thermalSummary);
}

/* ----------------------------- JSON Output ----------------------------- */

void printJsonMetric(const engine::MetricResult& m, bool last) {
  fmt::print("        {{\"key\": \"{}\", \"label\": \"{}\", \"unit\": \"{}\", "
             "\"direction\": \"{}\", \"value\": {:.6g}, \"samples\": {}, \"failed\": {}}}{}\n",
             m.key, m.label, m.unit, yardstick::probe::toString(m.direction), m.value, m.samples,
             m.failed(), last ? "" : ",");
}

void printJson(const engine::RunResults& run, const scoring::ScoreCard& card,
               const engine::RunConfig& cfg) {
  fmt::print("{{\n");
  fmt::print("  \"config\": {{\n");
  fmt::print("    \"categoryBudgetSec\": {:.1f},\n", cfg.categoryBudgetSec);
  fmt::print("    \"quickMode\": {},\n", cfg.quickMode);
  fmt::print("    \"workers\": {},\n", cfg.workers);
  fmt::print("    \"selection\": \"{}\"\n", cfg.selection.toString());
  fmt::print("  }},\n");

  fmt::print("  \"timestampMs\": {},\n", run.timestampMs);
  fmt::print("  \"logicalCpus\": {},\n", run.logicalCpus);
  fmt::print("  \"categories\": [\n");
  for (std::size_t i = 0; i < run.categories.size(); ++i) {
    const engine::CategoryResult& R = run.categories[i];
    const scoring::CategoryOutcome& OUTCOME = card.outcome(R.category);
    fmt::print("    {{\n");
    fmt::print("      \"category\": \"{}\",\n", engine::toString(R.category));
    fmt::print("      \"durationSec\": {:.3f},\n", R.durationSec);
    fmt::print("      \"thermalStart\": \"{}\",\n", thermal::toString(R.thermalStart));
    fmt::print("      \"thermalEnd\": \"{}\",\n", thermal::toString(R.thermalEnd));
    fmt::print("      \"ran\": {},\n", scoring::ran(OUTCOME));
    fmt::print("      \"failed\": {},\n",
               std::holds_alternative<scoring::RanAndFailed>(OUTCOME));
    fmt::print("      \"score\": {:.1f},\n", scoring::scoreOf(OUTCOME));
    fmt::print("      \"metrics\": [\n");
    for (std::size_t j = 0; j < R.metrics.size(); ++j) {
      printJsonMetric(R.metrics[j], j + 1 == R.metrics.size());
    }
    fmt::print("      ]\n");
    fmt::print("    }}{}\n", (i + 1 == run.categories.size()) ? "" : ",");
  }
  fmt::print("  ],\n");

  fmt::print("  \"totalScore\": {:.1f},\n", card.total);
  fmt::print("  \"thermal\": {{\n");
  fmt::print("    \"summary\": \"{}\",\n", run.thermalSummary);
  fmt::print("    \"throttling\": {},\n", run.hadAnyThrottling());
  fmt::print("    \"snapshots\": [\n");
  for (std::size_t i = 0; i < run.snapshots.size(); ++i) {
    const thermal::ThermalSnapshot& S = run.snapshots[i];
    fmt::print("      {{\"phase\": \"{}\", \"level\": \"{}\", \"timestampMs\": {}}}{}\n",
               S.phase.data(), thermal::toString(S.level), S.timestampMs,
               (i + 1 == run.snapshots.size()) ? "" : ",");
  }
  fmt::print("    ]\n");
  fmt::print("  }}\n");
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = args::has(pargs, ARG_JSON);
  const bool QUICK = args::has(pargs, ARG_QUICK);
  const bool STRESS = args::has(pargs, ARG_STRESS);

  std::optional<double> duration;
  if (const auto TOK = args::value(pargs, ARG_DURATION)) {
    duration = args::parseDouble(*TOK);
    if (!duration) {
      fmt::print(stderr, "Error: invalid --duration '{}'\n", *TOK);
      return 1;
    }
  }

  engine::RunConfig cfg = QUICK ? engine::RunConfig::quick() : engine::RunConfig::standard();
  cfg.categoryBudgetSec = engine::resolveCategoryBudgetSec(duration, STRESS, QUICK);
  if (const auto TOK = args::value(pargs, ARG_ONLY)) {
    cfg.selection = engine::parseSelection(*TOK);
  }
  if (const auto TOK = args::value(pargs, ARG_WORKERS)) {
    const auto WORKERS = args::parseUint(*TOK);
    if (!WORKERS || *WORKERS == 0) {
      fmt::print(stderr, "Error: invalid --workers '{}'\n", *TOK);
      return 1;
    }
    cfg.workers = static_cast<std::size_t>(*WORKERS);
  }
  if (!cfg.isValid()) {
    fmt::print(stderr, "Error: invalid run configuration\n");
    return 1;
  }

  const yardstick::host::HostInfo HOST = yardstick::host::getHostInfo();
  suites::SuiteOptions opts = suites::SuiteOptions::forHost(HOST, QUICK);
  if (const auto TOK = args::value(pargs, ARG_DIR)) {
    opts.setDiskDirectory(std::string(*TOK).c_str());
  }
  if (cfg.selection.contains(engine::Category::DISK) &&
      !suites::diskConfigFor(opts).isValid()) {
    fmt::print(stderr, "Warning: disk directory '{}' is not usable; disk probes will fail\n",
               opts.resolvedDiskDirectory());
  }
  if (cfg.selection.contains(engine::Category::GPU) && !suites::gpuBackendAvailable()) {
    fmt::print(stderr, "Note: no GPU compute backend; GPU probes will report Failed\n");
  }

  const std::vector<engine::CategoryPlan> PLANS = suites::buildPlans(cfg, opts);
  thermal::ThermalSupervisor supervisor;

  const engine::RunObserver OBSERVER = [JSON_OUTPUT](const engine::RunEvent& ev) {
    switch (ev.kind) {
    case engine::RunEvent::Kind::CATEGORY_STARTED:
      if (!JSON_OUTPUT) {
        fmt::print(stderr, "Running {}...\n", engine::displayName(ev.category));
      }
      break;
    case engine::RunEvent::Kind::THROTTLING:
      fmt::print(stderr, "Warning: thermal level {} before/after {}; results may be throttled\n",
                 thermal::toString(ev.level), engine::displayName(ev.category));
      break;
    default:
      break;
    }
  };

  const engine::RunResults RUN = engine::runBenchmarks(PLANS, cfg, supervisor, OBSERVER);

  scoring::ScoringContext ctx{};
  ctx.actualCores = (cfg.workers != 0) ? cfg.workers : HOST.logicalCpus;
  const scoring::ScoreCard CARD = scoring::scoreRun(RUN, scoring::referenceBaselines(), ctx);

  if (JSON_OUTPUT) {
    printJson(RUN, CARD, cfg);
  } else {
    printHuman(RUN, CARD, HOST);
  }
  return CARD.anyRan() ? 0 : 1;
}
