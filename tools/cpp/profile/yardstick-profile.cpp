/**
 * @file yardstick-profile.cpp
 * @brief Advanced profiling: cache boundaries, queue depth and scaling cliff.
 *
 * Runs the working-set, stride, queue-depth and worker sweeps, then infers
 * structural findings from the collected series. Points that cannot be
 * measured are gaps; findings with fewer than two points are omitted.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/host/inc/HostInfo.hpp"
#include "src/profiler/inc/Profiler.hpp"
#include "src/suites/inc/Suites.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = yardstick::helpers::args;
namespace format = yardstick::helpers::format;
namespace profiler = yardstick::profiler;
namespace suites = yardstick::suites;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_QUICK = 2,
  ARG_THOROUGH = 3,
  ARG_DIR = 4,
  ARG_MAX_WORKERS = 5,
  ARG_CLIFF = 6,
  ARG_SKIP_DISK = 7,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Infer cache boundaries, optimal I/O queue depth and the multicore scaling cliff.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_QUICK] = {"--quick", 0, false, "Short sparse sweeps"};
  map[ARG_THOROUGH] = {"--thorough", 0, false, "Long dense sweeps up to 256 MiB"};
  map[ARG_DIR] = {"--dir", 1, false, "Directory for the queue-depth file (default: /tmp)"};
  map[ARG_MAX_WORKERS] = {"--max-workers", 1, false, "Largest worker count (default: CPUs)"};
  map[ARG_CLIFF] = {"--cliff", 1, false, "Scaling-cliff efficiency threshold % (default: 70)"};
  map[ARG_SKIP_DISK] = {"--skip-disk", 0, false, "Skip the queue-depth sweeps"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printSizeSeries(const profiler::SizeSeries& series) {
  for (const profiler::SizeSample& S : series) {
    fmt::print("  {:>10}  {}\n", format::bytesBinary(S.sizeBytes),
               S.throughput ? fmt::format("{} GB/s", format::compactValue(*S.throughput))
                            : std::string("gap"));
  }
}

void printDepthSeries(const char* name, const profiler::DepthSeries& series) {
  if (series.empty()) {
    return;
  }
  fmt::print("  {}:", name);
  for (const profiler::DepthSample& S : series) {
    fmt::print(" qd{}={}", S.depth,
               S.throughput ? format::compactValue(*S.throughput) : std::string("gap"));
  }
  fmt::print("\n");
}

void printHuman(const profiler::ProfileReport& report, const yardstick::host::HostInfo& host) {
  fmt::print("=== Yardstick Profile ===\n");
  fmt::print("Host: {}\n", host.toString());

  fmt::print("\n--- Working-set sweep ---\n");
  printSizeSeries(report.sizeSeries);

  fmt::print("\n--- Queue-depth sweep (IOPS) ---\n");
  printDepthSeries("read ", report.readDepthSeries);
  printDepthSeries("write", report.writeDepthSeries);

  if (report.scaling) {
    fmt::print("\n--- Scaling efficiency ---\n");
    for (const profiler::EfficiencyPoint& P : report.scaling->points) {
      fmt::print("  {:>4} workers  {:>10}  {:5.1f}%\n", P.workers,
                 format::compactValue(P.throughput), P.efficiencyPercent);
    }
  }

  fmt::print("\n=== Findings ===\n{}\n", report.toString());
}

/* ----------------------------- JSON Output ----------------------------- */

std::string jsonOptional(const std::optional<double>& v) {
  return v ? fmt::format("{:.6g}", *v) : std::string("null");
}

void printJsonFinding(const char* name, const std::optional<profiler::QueueDepthFinding>& f,
                      bool last) {
  if (!f) {
    fmt::print("      \"{}\": null{}\n", name, last ? "" : ",");
    return;
  }
  fmt::print("      \"{}\": {{\"optimalDepth\": {}, \"throughputAtOptimal\": {:.6g}, "
             "\"peakDepth\": {}, \"peakThroughput\": {:.6g}}}{}\n",
             name, f->optimalDepth, f->throughputAtOptimal, f->peakDepth, f->peakThroughput,
             last ? "" : ",");
}

void printJson(const profiler::ProfileReport& report, const profiler::ProfileConfig& cfg) {
  fmt::print("{{\n");
  fmt::print("  \"config\": {{\n");
  fmt::print("    \"minSizeBytes\": {},\n", cfg.minSizeBytes);
  fmt::print("    \"maxSizeBytes\": {},\n", cfg.maxSizeBytes);
  fmt::print("    \"strideSetBytes\": {},\n", cfg.strideSetBytes);
  fmt::print("    \"maxQueueDepth\": {},\n", cfg.maxQueueDepth);
  fmt::print("    \"maxWorkers\": {},\n", cfg.resolvedMaxWorkers());
  fmt::print("    \"pointBudgetSec\": {:.3f},\n", cfg.pointBudgetSec);
  fmt::print("    \"dropThreshold\": {:.3f},\n", cfg.dropThreshold);
  fmt::print("    \"gainThreshold\": {:.3f},\n", cfg.gainThreshold);
  fmt::print("    \"cliffThresholdPercent\": {:.1f}\n", cfg.cliffThresholdPercent);
  fmt::print("  }},\n");

  fmt::print("  \"series\": {{\n");
  fmt::print("    \"size\": [");
  for (std::size_t i = 0; i < report.sizeSeries.size(); ++i) {
    fmt::print("{}[{}, {}]", (i == 0) ? "" : ", ", report.sizeSeries[i].sizeBytes,
               jsonOptional(report.sizeSeries[i].throughput));
  }
  fmt::print("],\n    \"stride\": [");
  for (std::size_t i = 0; i < report.strideSeries.size(); ++i) {
    fmt::print("{}[{}, {}]", (i == 0) ? "" : ", ", report.strideSeries[i].strideBytes,
               jsonOptional(report.strideSeries[i].throughput));
  }
  fmt::print("],\n    \"readDepth\": [");
  for (std::size_t i = 0; i < report.readDepthSeries.size(); ++i) {
    fmt::print("{}[{}, {}]", (i == 0) ? "" : ", ", report.readDepthSeries[i].depth,
               jsonOptional(report.readDepthSeries[i].throughput));
  }
  fmt::print("],\n    \"writeDepth\": [");
  for (std::size_t i = 0; i < report.writeDepthSeries.size(); ++i) {
    fmt::print("{}[{}, {}]", (i == 0) ? "" : ", ", report.writeDepthSeries[i].depth,
               jsonOptional(report.writeDepthSeries[i].throughput));
  }
  fmt::print("],\n    \"workers\": [");
  for (std::size_t i = 0; i < report.workerSeries.size(); ++i) {
    fmt::print("{}[{}, {}]", (i == 0) ? "" : ", ", report.workerSeries[i].workers,
               jsonOptional(report.workerSeries[i].throughput));
  }
  fmt::print("]\n  }},\n");

  fmt::print("  \"findings\": {{\n");
  if (report.cache) {
    fmt::print("    \"cacheBoundaries\": [");
    for (std::size_t i = 0; i < report.cache->boundaries.size(); ++i) {
      const profiler::CacheBoundary& B = report.cache->boundaries[i];
      fmt::print("{}{{\"sizeBytes\": {}, \"level\": {}, \"drop\": {:.3f}}}", (i == 0) ? "" : ", ",
                 B.lastFitBytes, B.estimatedLevel, B.dropFraction);
    }
    fmt::print("],\n");
  } else {
    fmt::print("    \"cacheBoundaries\": null,\n");
  }
  if (report.stride) {
    fmt::print("    \"stride\": {{\"peakStrideBytes\": {}, \"peakThroughput\": {:.6g}, "
               "\"sequentialLimitBytes\": {}}},\n",
               report.stride->peakStrideBytes, report.stride->peakThroughput,
               report.stride->sequentialLimitBytes
                   ? fmt::format("{}", *report.stride->sequentialLimitBytes)
                   : std::string("null"));
  } else {
    fmt::print("    \"stride\": null,\n");
  }
  fmt::print("    \"queueDepth\": {{\n");
  printJsonFinding("read", report.queueDepth.read, false);
  printJsonFinding("write", report.queueDepth.write, true);
  fmt::print("    }},\n");
  if (report.scaling) {
    fmt::print("    \"scaling\": {{\"cliffWorkers\": {}, \"thresholdPercent\": {:.1f}}}\n",
               report.scaling->cliffWorkers ? fmt::format("{}", *report.scaling->cliffWorkers)
                                            : std::string("null"),
               report.scaling->thresholdPercent);
  } else {
    fmt::print("    \"scaling\": null\n");
  }
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

  profiler::ProfileConfig cfg{};
  if (QUICK) {
    cfg = profiler::ProfileConfig::quick();
  } else if (args::has(pargs, ARG_THOROUGH)) {
    cfg = profiler::ProfileConfig::thorough();
  }
  if (const auto TOK = args::value(pargs, ARG_MAX_WORKERS)) {
    const auto N = args::parseUint(*TOK);
    if (!N || *N == 0) {
      fmt::print(stderr, "Error: invalid --max-workers '{}'\n", *TOK);
      return 1;
    }
    cfg.maxWorkers = static_cast<std::size_t>(*N);
  }
  if (const auto TOK = args::value(pargs, ARG_CLIFF)) {
    const auto PCT = args::parseDouble(*TOK);
    if (!PCT) {
      fmt::print(stderr, "Error: invalid --cliff '{}'\n", *TOK);
      return 1;
    }
    cfg.cliffThresholdPercent = *PCT;
  }
  if (!cfg.isValid()) {
    fmt::print(stderr, "Error: invalid profile configuration\n");
    return 1;
  }

  const yardstick::host::HostInfo HOST = yardstick::host::getHostInfo();
  suites::SuiteOptions opts = suites::SuiteOptions::forHost(HOST, QUICK);
  if (const auto TOK = args::value(pargs, ARG_DIR)) {
    opts.setDiskDirectory(std::string(*TOK).c_str());
  }
  opts.skipDisk = args::has(pargs, ARG_SKIP_DISK);

  const profiler::ProfileProbes PROBES = suites::buildProfileProbes(cfg, opts);
  if (!opts.skipDisk && !PROBES.readDepthProbe) {
    fmt::print(stderr, "Warning: no queue-depth file in '{}'; skipping queue-depth sweeps\n",
               opts.resolvedDiskDirectory());
  }

  const profiler::ProfileObserver OBSERVER = [JSON_OUTPUT](const char* sweep) {
    if (!JSON_OUTPUT) {
      fmt::print(stderr, "Sweeping {}...\n", sweep);
    }
  };

  const profiler::ProfileReport REPORT =
      profiler::runProfile(PROBES, cfg, HOST.cacheSizes(), OBSERVER);

  if (JSON_OUTPUT) {
    printJson(REPORT, cfg);
  } else {
    printHuman(REPORT, HOST);
  }
  return 0;
}
