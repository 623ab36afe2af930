#pragma once

#include <string>
#include <vector>

#include "skim/routing/stop_index.h"
#include "skim/types.h"

namespace skim::network {

using trip_idx_t = cista::strong<std::uint32_t, struct _trip_idx>;

struct line {
  std::string name_;
  bool is_train_;
};

struct route {
  line_idx_t line_;
  std::vector<stop_idx_t> stops_;

  // distance from the first stop, one entry per stop
  std::vector<double> dist_;
};

struct trip {
  route_idx_t route_;

  // one entry per stop of the route
  std::vector<double> arr_;
  std::vector<double> dep_;
};

// Ride on a trip from one stop to the next.
struct connection {
  trip_idx_t trip_;

  // position of from_ in the route's stop sequence
  std::uint32_t stop_idx_;

  stop_idx_t from_;
  stop_idx_t to_;
  double dep_;
  double arr_;
};

// Minimal schedule: stops, lines, routes, trips.
// Call finalize() after the last trip was added.
struct timetable {
  stop_idx_t add_stop(coord);
  line_idx_t add_line(std::string name, bool is_train);
  route_idx_t add_route(line_idx_t, std::vector<stop_idx_t>);
  trip_idx_t add_trip(route_idx_t,
                      std::vector<double> arr,
                      std::vector<double> dep);

  // builds the connection array, sorted by departure time
  void finalize();

  bool is_train(line_idx_t, route_idx_t) const;

  std::vector<routing::stop> get_stops() const;

  std::uint32_t n_stops() const {
    return static_cast<std::uint32_t>(stop_pos_.size());
  }

  std::vector<coord> stop_pos_;
  std::vector<line> lines_;
  std::vector<route> routes_;
  std::vector<trip> trips_;
  std::vector<connection> connections_;
};

}  // namespace skim::network
