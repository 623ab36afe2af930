#pragma once

#include <vector>

#include "skim/types.h"

namespace skim::routing {

// A stop reachable from the origin, together with the time to get there
// (walking from the origin point, or walking from the stop to the
// destination point).
struct offset {
  stop_idx_t target_;
  double duration_;
};

// One leg of a route. Walk and transfer legs carry an invalid line.
struct route_part {
  bool is_transit() const { return line_ != line_idx_t::invalid(); }

  stop_idx_t from_;
  stop_idx_t to_;
  line_idx_t line_{line_idx_t::invalid()};
  route_idx_t route_{route_idx_t::invalid()};
  double distance_{0.0};
  double boarding_time_{0.0};
  double arrival_time_{0.0};
};

// Best way to reach one stop in a shortest path tree.
struct travel_info {
  // origin stop the route starts at
  stop_idx_t departure_stop_;

  // departure from `departure_stop_`
  double pt_departure_time_;

  // from `pt_departure_time_` to the arrival at the reached stop
  double pt_travel_time_;

  // walking time from the origin point to `departure_stop_`
  double access_time_;

  std::uint32_t transfer_count_;

  std::vector<route_part> route_;
};

// reached stop -> best travel info
using tree_t = hash_map<stop_idx_t, travel_info>;

}  // namespace skim::routing
