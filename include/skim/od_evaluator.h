#pragma once

#include <vector>

#include "skim/pt_indicators.h"
#include "skim/routing/travel_info.h"

namespace skim {

struct route_shares {
  double total_distance_{0.0};
  double train_distance_{0.0};
  double total_in_vehicle_time_{0.0};
  double train_in_vehicle_time_{0.0};

  // NaN if the route has no distance / in-vehicle time
  double train_distance_share() const {
    return train_distance_ / total_distance_;
  }
  double train_travel_time_share() const {
    return train_in_vehicle_time_ / total_in_vehicle_time_;
  }
};

// Sums distance and in-vehicle time of all transit parts of the route.
route_shares get_route_shares(std::vector<routing::route_part> const&,
                              train_classifier_t const&);

struct time_window {
  double length() const { return max_departure_time_ - min_departure_time_; }

  double min_departure_time_;
  double max_departure_time_;
};

// Evaluates one (origin point, destination point) pair against the trees
// built for the origin point and adds the result to `pti`.
// Returns false (and invalidates the cell) if no connection exists.
bool calc_for_od(pt_indicators&,
                 zone_idx_t from,
                 zone_idx_t to,
                 std::vector<routing::tree_t> const& trees,
                 std::vector<routing::offset> const& egress,
                 time_window const&,
                 train_classifier_t const&);

}  // namespace skim
