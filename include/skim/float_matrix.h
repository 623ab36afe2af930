#pragma once

#include "skim/types.h"

namespace skim {

// Dense n_zones x n_zones matrix of accumulators.
//
// Storage is allocated once in the constructor and never reallocated.
// Concurrent writes to different (from, to) cells are therefore safe.
// Concurrent writes to the same cell are not supported: callers partition
// the work by origin zone, so every row has exactly one writer.
struct float_matrix {
  float_matrix(std::uint32_t n_zones, float default_value);

  void set(zone_idx_t from, zone_idx_t to, float value);

  // returns the new value
  float add(zone_idx_t from, zone_idx_t to, float value);

  // returns the new value
  float multiply(zone_idx_t from, zone_idx_t to, float factor);

  float get(zone_idx_t from, zone_idx_t to) const;

  std::uint32_t n_zones() const { return n_zones_; }

  std::uint32_t n_zones_;
  flat_matrix<float> data_;
};

}  // namespace skim
