/**
 * @file MemoryProbes.cpp
 * @brief Memory bandwidth, latency, working-set and stride payloads.
 */

#include "src/suites/inc/MemoryProbes.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/host/inc/HostInfo.hpp"
#include "src/suites/inc/AlignedBuffer.hpp"

#include <atomic>
#include <cstring>
#include <random>

namespace yardstick {

namespace suites {

using yardstick::helpers::clock::getMonotonicNs;
using yardstick::host::bufferAllowed;
using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::probe::Probe;

namespace {

constexpr std::size_t WORD = sizeof(std::uint64_t);

std::atomic<std::uint64_t> g_sink{0};

inline double elapsedSec(std::uint64_t startNs) noexcept {
  const std::uint64_t NOW = getMonotonicNs();
  return static_cast<double>((NOW > startNs) ? NOW - startNs : 1) / 1.0e9;
}

/// Allocate and pre-fault, or return an empty buffer when refused.
AlignedBuffer acquire(std::uint64_t bytes, std::uint64_t physicalRamBytes) noexcept {
  if (bytes < WORD || !bufferAllowed(bytes, physicalRamBytes)) {
    return AlignedBuffer{};
  }
  AlignedBuffer buf(static_cast<std::size_t>(bytes));
  if (buf.valid()) {
    std::memset(buf.data(), 0x5A, buf.size());
  }
  return buf;
}

inline std::uint64_t sumWords(const std::uint64_t* words, std::size_t count) noexcept {
  std::uint64_t acc = 0;
  for (std::size_t i = 0; i < count; ++i) {
    acc += words[i];
  }
  return acc;
}

} // namespace

/* ----------------------------- MemoryProbeConfig ----------------------------- */

bool MemoryProbeConfig::isValid() const noexcept {
  return bufferBytes >= 2 * WORD && latencyBytes >= 2 * WORD && latencySteps > 0;
}

/* ----------------------------- Payloads ----------------------------- */

double memReadGbps(const MemoryProbeConfig& cfg) noexcept {
  AlignedBuffer buf = acquire(cfg.bufferBytes, cfg.physicalRamBytes);
  if (!buf.valid()) {
    return 0.0;
  }
  const auto* words = reinterpret_cast<const std::uint64_t*>(buf.data());
  const std::size_t COUNT = buf.size() / WORD;

  const std::uint64_t START = getMonotonicNs();
  const std::uint64_t ACC = sumWords(words, COUNT);
  const double SEC = elapsedSec(START);
  g_sink.store(ACC, std::memory_order_relaxed);

  return static_cast<double>(COUNT * WORD) / 1.0e9 / SEC;
}

double memWriteGbps(const MemoryProbeConfig& cfg) noexcept {
  AlignedBuffer buf = acquire(cfg.bufferBytes, cfg.physicalRamBytes);
  if (!buf.valid()) {
    return 0.0;
  }

  const std::uint64_t START = getMonotonicNs();
  std::memset(buf.data(), 0xA5, buf.size());
  const double SEC = elapsedSec(START);
  g_sink.store(buf.data()[buf.size() / 2], std::memory_order_relaxed);

  return static_cast<double>(buf.size()) / 1.0e9 / SEC;
}

double memCopyGbps(const MemoryProbeConfig& cfg) noexcept {
  AlignedBuffer buf = acquire(cfg.bufferBytes, cfg.physicalRamBytes);
  if (!buf.valid()) {
    return 0.0;
  }
  const std::size_t HALF = (buf.size() / 2) & ~(BUFFER_ALIGNMENT - 1);
  if (HALF == 0) {
    return 0.0;
  }

  const std::uint64_t START = getMonotonicNs();
  std::memcpy(buf.data() + HALF, buf.data(), HALF);
  const double SEC = elapsedSec(START);
  g_sink.store(buf.data()[HALF + HALF / 2], std::memory_order_relaxed);

  return static_cast<double>(HALF) / 1.0e9 / SEC;
}

double memLatencyNs(const MemoryProbeConfig& cfg) noexcept {
  AlignedBuffer buf = acquire(cfg.latencyBytes, cfg.physicalRamBytes);
  if (!buf.valid() || cfg.latencySteps == 0) {
    return 0.0;
  }
  auto* next = reinterpret_cast<std::uint64_t*>(buf.data());
  const std::uint64_t N = buf.size() / WORD;
  buildCyclicChain(next, N);

  std::uint64_t idx = 0;
  const std::uint64_t START = getMonotonicNs();
  for (std::uint64_t i = 0; i < cfg.latencySteps; ++i) {
    idx = next[idx];
  }
  const double SEC = elapsedSec(START);
  g_sink.store(idx, std::memory_order_relaxed);

  return SEC * 1.0e9 / static_cast<double>(cfg.latencySteps);
}

double workingSetReadGbps(std::uint64_t sizeBytes, std::uint64_t physicalRamBytes) noexcept {
  AlignedBuffer buf = acquire(sizeBytes, physicalRamBytes);
  if (!buf.valid()) {
    return 0.0;
  }
  const auto* words = reinterpret_cast<const std::uint64_t*>(buf.data());
  const std::size_t COUNT = buf.size() / WORD;
  const std::uint64_t PASS_BYTES = COUNT * WORD;
  const std::uint64_t PASSES =
      (PASS_BYTES >= MIN_SWEEP_TOUCH_BYTES) ? 1 : (MIN_SWEEP_TOUCH_BYTES + PASS_BYTES - 1) / PASS_BYTES;

  std::uint64_t acc = 0;
  const std::uint64_t START = getMonotonicNs();
  for (std::uint64_t p = 0; p < PASSES; ++p) {
    acc += sumWords(words, COUNT);
  }
  const double SEC = elapsedSec(START);
  g_sink.store(acc, std::memory_order_relaxed);

  return static_cast<double>(PASS_BYTES * PASSES) / 1.0e9 / SEC;
}

double strideReadGbps(std::uint64_t setBytes, std::uint64_t strideBytes,
                      std::uint64_t physicalRamBytes) noexcept {
  if (strideBytes < WORD || strideBytes > setBytes) {
    return 0.0;
  }
  AlignedBuffer buf = acquire(setBytes, physicalRamBytes);
  if (!buf.valid()) {
    return 0.0;
  }
  const std::uint8_t* base = buf.data();
  const std::uint64_t LOADS_PER_PASS = (buf.size() - WORD) / strideBytes + 1;
  const std::uint64_t PASSES = (LOADS_PER_PASS >= MIN_STRIDE_LOADS)
                                   ? 1
                                   : (MIN_STRIDE_LOADS + LOADS_PER_PASS - 1) / LOADS_PER_PASS;

  std::uint64_t acc = 0;
  const std::uint64_t START = getMonotonicNs();
  for (std::uint64_t p = 0; p < PASSES; ++p) {
    for (std::uint64_t off = 0; off + WORD <= buf.size(); off += strideBytes) {
      std::uint64_t w = 0;
      std::memcpy(&w, base + off, WORD);
      acc += w;
    }
  }
  const double SEC = elapsedSec(START);
  g_sink.store(acc, std::memory_order_relaxed);

  return static_cast<double>(LOADS_PER_PASS * PASSES * WORD) / 1.0e9 / SEC;
}

/* ----------------------------- Helpers ----------------------------- */

void buildCyclicChain(std::uint64_t* next, std::uint64_t n, std::uint64_t seed) noexcept {
  if (next == nullptr || n == 0) {
    return;
  }
  for (std::uint64_t i = 0; i < n; ++i) {
    next[i] = i;
  }
  // Sattolo: j < i yields one cycle through every slot.
  std::mt19937_64 rng(seed);
  for (std::uint64_t i = n - 1; i > 0; --i) {
    std::uniform_int_distribution<std::uint64_t> dist(0, i - 1);
    const std::uint64_t J = dist(rng);
    const std::uint64_t TMP = next[i];
    next[i] = next[J];
    next[J] = TMP;
  }
}

/* ----------------------------- Probe Set ----------------------------- */

std::vector<Probe> memoryProbes(const MemoryProbeConfig& cfg) {
  std::vector<Probe> out;
  out.push_back(makeProbe("mem_read", "Memory Read", "GB/s", Direction::HIGHER_IS_BETTER,
                          [cfg] { return memReadGbps(cfg); }));
  out.push_back(makeProbe("mem_write", "Memory Write", "GB/s", Direction::HIGHER_IS_BETTER,
                          [cfg] { return memWriteGbps(cfg); }));
  out.push_back(makeProbe("mem_copy", "Memory Copy", "GB/s", Direction::HIGHER_IS_BETTER,
                          [cfg] { return memCopyGbps(cfg); }));
  out.push_back(makeProbe("mem_latency", "Memory Latency", "ns", Direction::LOWER_IS_BETTER,
                          [cfg] { return memLatencyNs(cfg); }));
  return out;
}

} // namespace suites

} // namespace yardstick
