#include "skim/network/grid_network.h"

#include <algorithm>
#include <random>

#include "fmt/core.h"

#include "utl/verify.h"

namespace skim::network {

namespace {

void add_line(timetable& tt,
              grid_settings const& s,
              std::string name,
              bool const is_train,
              std::vector<stop_idx_t> stops,
              double const speed,
              double const offset) {
  auto const l = tt.add_line(std::move(name), is_train);
  auto const segment_time = s.spacing_ / speed;

  for (auto const dir : {0, 1}) {
    auto seq = stops;
    if (dir == 1) {
      std::reverse(begin(seq), end(seq));
    }
    auto const r = tt.add_route(l, seq);
    for (auto start = s.service_start_ + offset; start < s.service_end_;
         start += s.headway_) {
      auto times = std::vector<double>(seq.size());
      for (auto i = 0U; i != seq.size(); ++i) {
        times[i] = start + i * segment_time;
      }
      tt.add_trip(r, times, times);
    }
  }
}

}  // namespace

grid_network make_grid_network(grid_settings const& s) {
  utl::verify(s.n_x_ >= 2U && s.n_y_ >= 2U, "grid must be at least 2x2");
  utl::verify(s.spacing_ > 0.0 && s.headway_ > 0.0, "invalid grid settings");
  utl::verify(s.train_speed_ > 0.0 && s.bus_speed_ > 0.0,
              "speeds must be positive");

  auto n = grid_network{};
  auto& tt = n.tt_;

  auto const stop_at = [&](std::uint32_t const x, std::uint32_t const y) {
    return stop_idx_t{y * s.n_x_ + x};
  };
  for (auto y = 0U; y != s.n_y_; ++y) {
    for (auto x = 0U; x != s.n_x_; ++x) {
      tt.add_stop({x * s.spacing_, y * s.spacing_});
    }
  }

  for (auto y = 0U; y != s.n_y_; ++y) {
    auto stops = std::vector<stop_idx_t>{};
    for (auto x = 0U; x != s.n_x_; ++x) {
      stops.emplace_back(stop_at(x, y));
    }
    add_line(tt, s, fmt::format("T{}", y), true, std::move(stops),
             s.train_speed_, 0.0);
  }
  for (auto x = 0U; x != s.n_x_; ++x) {
    auto stops = std::vector<stop_idx_t>{};
    for (auto y = 0U; y != s.n_y_; ++y) {
      stops.emplace_back(stop_at(x, y));
    }
    add_line(tt, s, fmt::format("B{}", x), false, std::move(stops),
             s.bus_speed_, s.headway_ / 2.0);
  }

  tt.finalize();

  auto rng = std::mt19937{s.seed_};
  auto dist = std::uniform_real_distribution<double>{-s.spacing_ / 2.0,
                                                     s.spacing_ / 2.0};
  for (auto y = 0U; y != s.n_y_; ++y) {
    for (auto x = 0U; x != s.n_x_; ++x) {
      auto const center = tt.stop_pos_[to_idx(stop_at(x, y))];
      auto points = std::vector<coord>{};
      for (auto i = 0U; i != s.samples_per_zone_; ++i) {
        auto const dx = dist(rng);
        auto const dy = dist(rng);
        points.push_back({center.x_ + dx, center.y_ + dy});
      }
      auto name = fmt::format("{}_{}", x, y);
      n.coords_per_zone_.emplace(name, std::move(points));
      n.zones_.emplace_back(std::move(name));
    }
  }

  return n;
}

}  // namespace skim::network
