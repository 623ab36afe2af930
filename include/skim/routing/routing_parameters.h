#pragma once

namespace skim::routing {

struct routing_parameters {
  void verify() const;

  // walk speed along the straight line between two points [m/s]
  double beeline_walk_speed_{1.3 / 1.3};

  // stops closer than this are access/egress candidates [m]
  double search_radius_{1000.0};

  // if no stop is within the search radius: consider stops up to
  // distance(nearest stop) + extension radius [m]
  double extension_radius_{200.0};

  // minimum time between alighting and boarding another trip [s]
  double min_transfer_time_{60.0};
};

}  // namespace skim::routing
