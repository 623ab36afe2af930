#pragma once

#include "skim/float_matrix.h"

namespace skim {

// Sums collected for one (origin sample, destination sample) pair.
struct od_indicators {
  float adaption_time_;
  float travel_time_;
  float access_time_;
  float egress_time_;
  float transfer_count_;
  float train_travel_time_share_;
  float train_distance_share_;
};

// Zone-to-zone public transport indicators.
//
// During the parallel phase the matrices hold sums over all contributing
// sample pairs and `data_count_` holds the number of contributions.
// `finalize()` turns the sums into averages and derives the frequency.
// Cells without any contribution hold +Infinity in every matrix except
// `data_count_` (which stays 0) after finalization.
struct pt_indicators {
  explicit pt_indicators(std::uint32_t n_zones);

  // Marks the cell as "no connection". Does nothing if the cell already
  // holds data, so the result does not depend on the evaluation order of
  // the sample pairs.
  void invalidate(zone_idx_t from, zone_idx_t to);

  // Adds the values of one sample pair. The first contribution overwrites
  // a previously invalidated cell.
  void accumulate(zone_idx_t from, zone_idx_t to, od_indicators const&);

  bool has_data(zone_idx_t from, zone_idx_t to) const;

  // Divides every sum by its count and sets
  // frequency = window_length / avg_adaption_time / 4.
  // Call once, after all writers have finished.
  void finalize(double window_length);

  std::uint32_t n_zones() const { return data_count_.n_zones(); }

  float_matrix adaption_time_;
  float_matrix frequency_;
  float_matrix travel_time_;
  float_matrix access_time_;
  float_matrix egress_time_;
  float_matrix transfer_count_;
  float_matrix train_travel_time_share_;
  float_matrix train_distance_share_;

  // number of sample pairs that contributed to the averages
  float_matrix data_count_;
};

// Rooftop constant relating the average adaption time to an equivalent
// service frequency per window.
constexpr auto const kAdaptionTimeToFrequency = 4.0;

inline double frequency(double const window_length,
                        double const avg_adaption_time) {
  return window_length / avg_adaption_time / kAdaptionTimeToFrequency;
}

}  // namespace skim
