#include <cmath>
#include <iostream>
#include <memory>

#include "boost/program_options.hpp"

#include "utl/progress_tracker.h"

#include "skim/compute_matrices.h"
#include "skim/logging.h"
#include "skim/network/csa_tree_builder.h"
#include "skim/network/grid_network.h"
#include "skim/network/grid_stop_index.h"

namespace bpo = boost::program_options;
using namespace skim;

struct summary {
  std::uint32_t n_valid_{0U};
  std::uint32_t n_invalid_{0U};
  double travel_time_sum_{0.0};
  double frequency_sum_{0.0};
};

summary summarize(pt_indicators const& pti) {
  auto s = summary{};
  auto const n = zone_idx_t{pti.n_zones()};
  for (auto from = zone_idx_t{0U}; from != n; ++from) {
    for (auto to = zone_idx_t{0U}; to != n; ++to) {
      if (pti.data_count_.get(from, to) == 0.0F) {
        ++s.n_invalid_;
        continue;
      }
      ++s.n_valid_;
      s.travel_time_sum_ += pti.travel_time_.get(from, to);
      if (std::isfinite(pti.frequency_.get(from, to))) {
        s.frequency_sum_ += pti.frequency_.get(from, to);
      }
    }
  }
  return s;
}

int main(int ac, char** av) {
  auto grid = network::grid_settings{};
  auto settings = skim_settings{};
  auto params = routing::routing_parameters{};
  auto from_hour = 7.0;
  auto to_hour = 8.0;

  auto desc = bpo::options_description{"Options"};
  desc.add_options()  //
      ("help,h", "produce this help message")  //
      ("nx", bpo::value(&grid.n_x_)->default_value(grid.n_x_),
       "number of stops in x direction")  //
      ("ny", bpo::value(&grid.n_y_)->default_value(grid.n_y_),
       "number of stops in y direction")  //
      ("spacing", bpo::value(&grid.spacing_)->default_value(grid.spacing_),
       "distance between stops [m]")  //
      ("headway", bpo::value(&grid.headway_)->default_value(grid.headway_),
       "headway of all lines [s]")  //
      ("samples", bpo::value(&grid.samples_per_zone_)
                      ->default_value(grid.samples_per_zone_),
       "sample points per zone")  //
      ("seed", bpo::value(&grid.seed_)->default_value(grid.seed_),
       "seed for the sample points")  //
      ("from", bpo::value(&from_hour)->default_value(from_hour),
       "start of the departure window [h]")  //
      ("to", bpo::value(&to_hour)->default_value(to_hour),
       "end of the departure window [h]")  //
      ("step", bpo::value(&settings.step_size_)
                   ->default_value(settings.step_size_),
       "time between two shortest path trees [s]")  //
      ("walk_speed", bpo::value(&params.beeline_walk_speed_)
                         ->default_value(params.beeline_walk_speed_),
       "beeline walk speed [m/s]")  //
      ("search_radius", bpo::value(&params.search_radius_)
                            ->default_value(params.search_radius_),
       "access/egress search radius [m]")  //
      ("threads,t", bpo::value(&settings.n_workers_)->default_value(0U),
       "number of worker threads, 0 = hardware concurrency");

  auto vm = bpo::variables_map{};
  bpo::store(bpo::command_line_parser(ac, av).options(desc).run(), vm);
  bpo::notify(vm);

  if (vm.count("help") != 0U) {
    std::cout << desc << "\n";
    return 0;
  }

  settings.min_departure_time_ = from_hour * 3600.0;
  settings.max_departure_time_ = to_hour * 3600.0;
  grid.service_start_ = settings.min_departure_time_ - 3600.0;
  grid.service_end_ = settings.max_departure_time_ + 3600.0;

  try {
    auto bars = utl::global_progress_bars{false};
    auto progress_tracker = utl::activate_progress_tracker("skim");

    auto const net = network::make_grid_network(grid);
    auto const stops = network::grid_stop_index{net.tt_.get_stops()};
    auto const& tt = net.tt_;

    auto const result = compute_matrices(
        net.zones_, net.coords_per_zone_, stops,
        [&]() { return std::make_unique<network::csa_tree_builder>(tt); },
        settings, params,
        [&](line_idx_t const l, route_idx_t const r) {
          return tt.is_train(l, r);
        });

    auto const s = summarize(result.pti_);
    log(log_lvl::info, "skim", "valid cells: {}, invalid cells: {}",
        s.n_valid_, s.n_invalid_);
    if (s.n_valid_ != 0U) {
      log(log_lvl::info, "skim",
          "mean travel time: {:.1f}s, mean finite frequency: {:.2f}",
          s.travel_time_sum_ / s.n_valid_, s.frequency_sum_ / s.n_valid_);
    }
  } catch (std::exception const& e) {
    log(log_lvl::error, "skim", "error: {}", e.what());
    return 1;
  }

  return 0;
}
