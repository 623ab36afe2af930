#include "skim/float_matrix.h"

#include "utl/helpers/algorithm.h"

namespace skim {

float_matrix::float_matrix(std::uint32_t const n_zones,
                           float const default_value)
    : n_zones_{n_zones} {
  data_.resize(n_zones, n_zones);
  utl::fill(data_.entries_, default_value);
}

void float_matrix::set(zone_idx_t const from,
                       zone_idx_t const to,
                       float const value) {
  data_[to_idx(from)][to_idx(to)] = value;
}

float float_matrix::add(zone_idx_t const from,
                        zone_idx_t const to,
                        float const value) {
  auto& cell = data_[to_idx(from)][to_idx(to)];
  cell += value;
  return cell;
}

float float_matrix::multiply(zone_idx_t const from,
                             zone_idx_t const to,
                             float const factor) {
  auto& cell = data_[to_idx(from)][to_idx(to)];
  cell *= factor;
  return cell;
}

float float_matrix::get(zone_idx_t const from, zone_idx_t const to) const {
  return data_[to_idx(from)][to_idx(to)];
}

}  // namespace skim
