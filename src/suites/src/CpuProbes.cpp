/**
 * @file CpuProbes.cpp
 * @brief CPU payload implementations and probe sets.
 */

#include "src/suites/inc/CpuProbes.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <atomic>
#include <string>

namespace yardstick {

namespace suites {

using yardstick::helpers::clock::getMonotonicNs;
using yardstick::probe::Direction;
using yardstick::probe::makeProbe;
using yardstick::probe::Probe;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr double INT_OPS_PER_ITERATION = 8.0;
constexpr double FLOAT_OPS_PER_ITERATION = 6.0;
constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

/// Sinks for payload results.
std::atomic<std::uint64_t> g_intSink{0};
std::atomic<double> g_floatSink{0.0};

/* ----------------------------- Helpers ----------------------------- */

/// Elapsed seconds since startNs, never zero.
inline double elapsedSec(std::uint64_t startNs) noexcept {
  const std::uint64_t NOW = getMonotonicNs();
  const std::uint64_t NS = (NOW > startNs) ? NOW - startNs : 1;
  return static_cast<double>(NS) / 1.0e9;
}

/// Byte pattern with runs of varying length (compressible, not trivial).
std::vector<std::uint8_t> makeRunPattern(std::size_t bytes) {
  std::vector<std::uint8_t> data(bytes);
  std::size_t i = 0;
  std::uint8_t value = 0;
  std::size_t run = 1;
  while (i < bytes) {
    for (std::size_t r = 0; r < run && i < bytes; ++r, ++i) {
      data[i] = value;
    }
    value = static_cast<std::uint8_t>(value * 31U + 7U);
    run = (run % 61) + 3;
  }
  return data;
}

double runInteger() { return integerMathMops(); }
double runFloat() { return floatMathMops(); }
double runSimd() { return simdFmaGflops(); }
double runHash() { return hashMbps(); }
double runCompression() { return compressionMbps(); }

struct Payload {
  const char* key;
  const char* label;
  const char* unit;
  double (*fn)();
};

constexpr Payload PAYLOADS[] = {
    {"integer", "Integer Math", "Mops/s", runInteger},
    {"float", "Floating Point", "Mops/s", runFloat},
    {"simd", "SIMD FMA", "GFLOPS", runSimd},
    {"hash", "Hashing", "MB/s", runHash},
    {"compression", "Compression", "MB/s", runCompression},
};

} // namespace

/* ----------------------------- Payloads ----------------------------- */

double integerMathMops(std::size_t iterations) noexcept {
  if (iterations == 0) {
    return 0.0;
  }
  std::uint64_t a = 0x9E3779B97F4A7C15ULL;
  std::uint64_t b = 12345;
  std::uint64_t acc = 0;

  const std::uint64_t START = getMonotonicNs();
  for (std::size_t i = 0; i < iterations; ++i) {
    a = a * 6364136223846793005ULL + 1442695040888963407ULL;
    b ^= a >> 13;
    acc += b + i;
    b = (b << 7) | (b >> 57);
  }
  const double SEC = elapsedSec(START);
  g_intSink.store(acc ^ b, std::memory_order_relaxed);

  return static_cast<double>(iterations) * INT_OPS_PER_ITERATION / SEC / 1.0e6;
}

double floatMathMops(std::size_t iterations) noexcept {
  if (iterations == 0) {
    return 0.0;
  }
  double x = 1.0;
  double y = 2.0;

  const std::uint64_t START = getMonotonicNs();
  for (std::size_t i = 0; i < iterations; ++i) {
    x = x * 1.0000001 + 1.0e-7;
    y = y * 0.9999999 + x * 1.0e-9;
    x = x / 1.00000005;
  }
  const double SEC = elapsedSec(START);
  g_floatSink.store(x + y, std::memory_order_relaxed);

  return static_cast<double>(iterations) * FLOAT_OPS_PER_ITERATION / SEC / 1.0e6;
}

double simdFmaGflops(std::size_t elements, std::size_t passes) {
  if (elements == 0 || passes == 0) {
    return 0.0;
  }
  std::vector<float> a(elements);
  std::vector<float> b(elements);
  std::vector<float> c(elements, 0.0F);
  for (std::size_t i = 0; i < elements; ++i) {
    a[i] = 1.0F - static_cast<float>(i % 17) * 1.0e-3F;
    b[i] = 1.0e-3F + static_cast<float>(i % 13) * 1.0e-5F;
  }

  const std::uint64_t START = getMonotonicNs();
  for (std::size_t p = 0; p < passes; ++p) {
    for (std::size_t i = 0; i < elements; ++i) {
      c[i] = a[i] * b[i] + c[i];
    }
  }
  const double SEC = elapsedSec(START);
  g_floatSink.store(static_cast<double>(c[elements / 2]), std::memory_order_relaxed);

  const double FLOPS = 2.0 * static_cast<double>(elements) * static_cast<double>(passes);
  return FLOPS / SEC / 1.0e9;
}

double hashMbps(std::size_t bytes) {
  if (bytes == 0) {
    return 0.0;
  }
  const std::vector<std::uint8_t> DATA = makeRunPattern(bytes);

  const std::uint64_t START = getMonotonicNs();
  const std::uint64_t H = fnv1a(DATA.data(), DATA.size());
  const double SEC = elapsedSec(START);
  g_intSink.store(H, std::memory_order_relaxed);

  return static_cast<double>(bytes) / 1.0e6 / SEC;
}

double compressionMbps(std::size_t bytes) {
  if (bytes == 0) {
    return 0.0;
  }
  const std::vector<std::uint8_t> DATA = makeRunPattern(bytes);
  std::vector<std::uint8_t> out;
  out.reserve(bytes * 2);

  const std::uint64_t START = getMonotonicNs();
  const std::size_t ENCODED = rleEncode(DATA.data(), DATA.size(), out);
  const double SEC = elapsedSec(START);
  g_intSink.store(ENCODED, std::memory_order_relaxed);

  return static_cast<double>(bytes) / 1.0e6 / SEC;
}

/* ----------------------------- Helpers ----------------------------- */

std::uint64_t fnv1a(const std::uint8_t* data, std::size_t len) noexcept {
  std::uint64_t h = FNV_OFFSET;
  if (data == nullptr) {
    return h;
  }
  for (std::size_t i = 0; i < len; ++i) {
    h ^= data[i];
    h *= FNV_PRIME;
  }
  return h;
}

std::size_t rleEncode(const std::uint8_t* in, std::size_t len, std::vector<std::uint8_t>& out) {
  out.clear();
  if (in == nullptr) {
    return 0;
  }
  std::size_t i = 0;
  while (i < len) {
    const std::uint8_t VALUE = in[i];
    std::size_t run = 1;
    while (i + run < len && in[i + run] == VALUE && run < 255) {
      ++run;
    }
    out.push_back(static_cast<std::uint8_t>(run));
    out.push_back(VALUE);
    i += run;
  }
  return out.size();
}

/* ----------------------------- Probe Sets ----------------------------- */

std::vector<Probe> cpuSingleProbes() {
  std::vector<Probe> out;
  for (const Payload& P : PAYLOADS) {
    out.push_back(makeProbe(P.key, P.label, P.unit, Direction::HIGHER_IS_BETTER, P.fn));
  }
  return out;
}

std::vector<Probe> cpuMultiProbes() {
  std::vector<Probe> out;
  for (const Payload& P : PAYLOADS) {
    out.push_back(makeProbe(std::string(P.key) + MULTI_SUFFIX,
                            std::string(P.label) + " (multi)", P.unit,
                            Direction::HIGHER_IS_BETTER, P.fn));
  }
  return out;
}

} // namespace suites

} // namespace yardstick
