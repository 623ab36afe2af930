#include "skim/network/timetable.h"

#include <algorithm>

#include "utl/verify.h"

namespace skim::network {

stop_idx_t timetable::add_stop(coord const pos) {
  auto const idx = stop_idx_t{static_cast<std::uint32_t>(stop_pos_.size())};
  stop_pos_.emplace_back(pos);
  return idx;
}

line_idx_t timetable::add_line(std::string name, bool const is_train) {
  auto const idx = line_idx_t{static_cast<std::uint32_t>(lines_.size())};
  lines_.emplace_back(line{std::move(name), is_train});
  return idx;
}

route_idx_t timetable::add_route(line_idx_t const l,
                                 std::vector<stop_idx_t> stops) {
  utl::verify(to_idx(l) < lines_.size(), "add_route: unknown line {}",
              to_idx(l));
  utl::verify(stops.size() >= 2U, "add_route: route needs at least 2 stops");

  auto dist = std::vector<double>{};
  dist.reserve(stops.size());
  dist.emplace_back(0.0);
  for (auto i = 1U; i != stops.size(); ++i) {
    utl::verify(to_idx(stops[i]) < stop_pos_.size(),
                "add_route: unknown stop {}", to_idx(stops[i]));
    dist.emplace_back(dist.back() + distance(stop_pos_[to_idx(stops[i - 1U])],
                                             stop_pos_[to_idx(stops[i])]));
  }

  auto const idx = route_idx_t{static_cast<std::uint32_t>(routes_.size())};
  routes_.emplace_back(route{l, std::move(stops), std::move(dist)});
  return idx;
}

trip_idx_t timetable::add_trip(route_idx_t const r,
                               std::vector<double> arr,
                               std::vector<double> dep) {
  utl::verify(to_idx(r) < routes_.size(), "add_trip: unknown route {}",
              to_idx(r));
  auto const n_stops = routes_[to_idx(r)].stops_.size();
  utl::verify(arr.size() == n_stops && dep.size() == n_stops,
              "add_trip: route has {} stops, got {} arrivals, {} departures",
              n_stops, arr.size(), dep.size());
  for (auto i = 0U; i != n_stops; ++i) {
    utl::verify(arr[i] <= dep[i], "add_trip: departure before arrival");
    utl::verify(i == 0U || dep[i - 1U] <= arr[i],
                "add_trip: arrival before previous departure");
  }

  auto const idx = trip_idx_t{static_cast<std::uint32_t>(trips_.size())};
  trips_.emplace_back(trip{r, std::move(arr), std::move(dep)});
  return idx;
}

void timetable::finalize() {
  connections_.clear();
  for (auto t = 0U; t != trips_.size(); ++t) {
    auto const& tr = trips_[t];
    auto const& stops = routes_[to_idx(tr.route_)].stops_;
    for (auto i = 0U; i + 1U < stops.size(); ++i) {
      connections_.emplace_back(connection{.trip_ = trip_idx_t{t},
                                           .stop_idx_ = i,
                                           .from_ = stops[i],
                                           .to_ = stops[i + 1U],
                                           .dep_ = tr.dep_[i],
                                           .arr_ = tr.arr_[i + 1U]});
    }
  }
  std::stable_sort(begin(connections_), end(connections_),
                   [](connection const& a, connection const& b) {
                     return a.dep_ < b.dep_;
                   });
}

bool timetable::is_train(line_idx_t const l, route_idx_t) const {
  return lines_[to_idx(l)].is_train_;
}

std::vector<routing::stop> timetable::get_stops() const {
  auto stops = std::vector<routing::stop>{};
  stops.reserve(stop_pos_.size());
  for (auto i = 0U; i != stop_pos_.size(); ++i) {
    stops.emplace_back(routing::stop{stop_idx_t{i}, stop_pos_[i]});
  }
  return stops;
}

}  // namespace skim::network
