#pragma once

#include <string>
#include <vector>

#include "skim/network/timetable.h"

namespace skim::network {

struct grid_settings {
  std::uint32_t n_x_{5U};
  std::uint32_t n_y_{5U};

  // distance between neighbouring stops [m]
  double spacing_{1000.0};

  // [s]
  double headway_{600.0};
  double service_start_{6.0 * 3600.0};
  double service_end_{10.0 * 3600.0};

  // [m/s]
  double train_speed_{20.0};
  double bus_speed_{8.0};

  std::uint32_t samples_per_zone_{3U};
  std::uint32_t seed_{42U};
};

// Rectangular test network:
//  - one stop every `spacing_` meters on an n_x * n_y grid
//  - one train line per grid row, one bus line per grid column, each with a
//    route per direction, buses shifted by half a headway
//  - one zone per stop: the square of side `spacing_` around it, with
//    `samples_per_zone_` pseudo random sample points (fixed seed)
struct grid_network {
  timetable tt_;
  std::vector<std::string> zones_;
  hash_map<std::string, std::vector<coord>> coords_per_zone_;
};

grid_network make_grid_network(grid_settings const&);

}  // namespace skim::network
