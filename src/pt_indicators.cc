#include "skim/pt_indicators.h"

#include <limits>

namespace skim {

namespace {

constexpr auto const kInvalid = std::numeric_limits<float>::infinity();

template <typename Fn>
void for_each_value_matrix(pt_indicators& pti, Fn&& fn) {
  fn(pti.adaption_time_);
  fn(pti.frequency_);
  fn(pti.travel_time_);
  fn(pti.access_time_);
  fn(pti.egress_time_);
  fn(pti.transfer_count_);
  fn(pti.train_travel_time_share_);
  fn(pti.train_distance_share_);
}

}  // namespace

pt_indicators::pt_indicators(std::uint32_t const n_zones)
    : adaption_time_{n_zones, 0.0F},
      frequency_{n_zones, 0.0F},
      travel_time_{n_zones, 0.0F},
      access_time_{n_zones, 0.0F},
      egress_time_{n_zones, 0.0F},
      transfer_count_{n_zones, 0.0F},
      train_travel_time_share_{n_zones, 0.0F},
      train_distance_share_{n_zones, 0.0F},
      data_count_{n_zones, 0.0F} {}

void pt_indicators::invalidate(zone_idx_t const from, zone_idx_t const to) {
  if (has_data(from, to)) {
    return;
  }
  for_each_value_matrix(
      *this, [&](float_matrix& m) { m.set(from, to, kInvalid); });
}

void pt_indicators::accumulate(zone_idx_t const from,
                               zone_idx_t const to,
                               od_indicators const& x) {
  if (!has_data(from, to)) {
    for_each_value_matrix(*this,
                          [&](float_matrix& m) { m.set(from, to, 0.0F); });
  }
  adaption_time_.add(from, to, x.adaption_time_);
  travel_time_.add(from, to, x.travel_time_);
  access_time_.add(from, to, x.access_time_);
  egress_time_.add(from, to, x.egress_time_);
  transfer_count_.add(from, to, x.transfer_count_);
  train_travel_time_share_.add(from, to, x.train_travel_time_share_);
  train_distance_share_.add(from, to, x.train_distance_share_);
  data_count_.add(from, to, 1.0F);
}

bool pt_indicators::has_data(zone_idx_t const from,
                             zone_idx_t const to) const {
  return data_count_.get(from, to) > 0.0F;
}

void pt_indicators::finalize(double const window_length) {
  auto const end = zone_idx_t{n_zones()};
  for (auto from = zone_idx_t{0U}; from != end; ++from) {
    for (auto to = zone_idx_t{0U}; to != end; ++to) {
      if (!has_data(from, to)) {
        for_each_value_matrix(
            *this, [&](float_matrix& m) { m.set(from, to, kInvalid); });
        continue;
      }

      auto const avg_factor = 1.0F / data_count_.get(from, to);
      auto const adaption_time = adaption_time_.multiply(from, to, avg_factor);
      travel_time_.multiply(from, to, avg_factor);
      access_time_.multiply(from, to, avg_factor);
      egress_time_.multiply(from, to, avg_factor);
      transfer_count_.multiply(from, to, avg_factor);
      train_travel_time_share_.multiply(from, to, avg_factor);
      train_distance_share_.multiply(from, to, avg_factor);
      frequency_.set(from, to,
                     static_cast<float>(frequency(window_length, adaption_time)));
    }
  }
}

}  // namespace skim
