#pragma once

#include <vector>

#include "skim/routing/travel_info.h"

namespace skim {

// One door-to-door trip candidate for an (origin point, destination point)
// pair. Points into the tree it was built from; the trees have to outlive
// the connection.
struct od_connection {
  // departure at the first stop minus access time
  double effective_departure_time() const {
    return departure_time_ - access_time_;
  }

  double total_travel_time() const {
    return access_time_ + travel_time_ + egress_time_;
  }

  double departure_time_;
  double travel_time_;
  double access_time_;
  double egress_time_;
  double transfer_count_;
  routing::travel_info const* travel_info_;
};

// One connection per (tree, egress stop reached in that tree).
std::vector<od_connection> build_od_connections(
    std::vector<routing::tree_t> const& trees,
    std::vector<routing::offset> const& egress);

// Sorts by effective departure time and removes every connection that is
// never the best choice for a traveller:
//  - forward: a later connection is dropped if leaving earlier with the last
//    kept connection is at least as good
//  - backward: an earlier connection is dropped if waiting for the next kept
//    connection is at least as good
// The result is ascending by effective departure time, with strictly
// increasing effective departure times.
std::vector<od_connection> sort_and_filter_connections(
    std::vector<od_connection>);

// Minimum total travel time, first one on ties. nullptr if empty.
od_connection const* find_fastest_connection(std::vector<od_connection> const&);

}  // namespace skim
