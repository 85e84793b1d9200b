/**
 * @file Baseline.cpp
 * @brief Baseline table and the reference values of the shipped probes.
 */

#include "src/scoring/inc/Baseline.hpp"

#include <cmath>

namespace yardstick {

namespace scoring {

using probe::Direction;

/* ----------------------------- BaselineTable ----------------------------- */

BaselineTable::BaselineTable(std::initializer_list<Item> items, std::size_t referenceCores)
    : referenceCores_((referenceCores == 0) ? 1 : referenceCores) {
  entries_.reserve(items.size());
  for (const Item& IT : items) {
    if (std::isfinite(IT.second.value) && IT.second.value > 0.0) {
      entries_.emplace(IT.first, IT.second);
    }
  }
}

std::optional<BaselineEntry> BaselineTable::lookup(std::string_view key) const {
  const auto IT = entries_.find(std::string(key));
  if (IT == entries_.end()) {
    return std::nullopt;
  }
  return IT->second;
}

/* ----------------------------- Reference ----------------------------- */

BaselineTable referenceBaselines() {
  constexpr Direction HIGHER = Direction::HIGHER_IS_BETTER;
  constexpr Direction LOWER = Direction::LOWER_IS_BETTER;

  return BaselineTable(
      {
          // CPU single-core
          {"integer", {2000.0, HIGHER}},    // Mops/s
          {"float", {400.0, HIGHER}},       // Mops/s
          {"simd", {8.0, HIGHER}},          // GFLOPS
          {"hash", {1500.0, HIGHER}},       // MB/s
          {"compression", {800.0, HIGHER}}, // MB/s

          // CPU multi-core (calibrated separately on the 8-core reference)
          {"integer_multi", {14000.0, HIGHER}},
          {"float_multi", {1100.0, HIGHER}},
          {"simd_multi", {40.0, HIGHER}},
          {"hash_multi", {10000.0, HIGHER}},
          {"compression_multi", {5000.0, HIGHER}},

          // Memory
          {"mem_read", {20.0, HIGHER}},  // GB/s
          {"mem_write", {15.0, HIGHER}}, // GB/s
          {"mem_copy", {10.0, HIGHER}},  // GB/s
          {"mem_latency", {90.0, LOWER}}, // ns

          // Disk
          {"disk_seq_write", {1500.0, HIGHER}},  // MB/s
          {"disk_seq_read", {2500.0, HIGHER}},   // MB/s
          {"disk_rand_write", {40000.0, HIGHER}}, // IOPS
          {"disk_rand_read", {80000.0, HIGHER}},  // IOPS

          // GPU
          {"gpu_compute", {2000.0, HIGHER}},   // GFLOPS
          {"gpu_particles", {5000.0, HIGHER}}, // Mparticles/s
          {"gpu_blur", {2000.0, HIGHER}},      // MP/s
          {"gpu_edge", {3000.0, HIGHER}},      // MP/s
      },
      8);
}

} // namespace scoring

} // namespace yardstick
