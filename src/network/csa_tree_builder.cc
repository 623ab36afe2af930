#include "skim/network/csa_tree_builder.h"

#include <algorithm>

#include "utl/verify.h"

namespace skim::network {

csa_tree_builder::csa_tree_builder(timetable const& tt) : tt_{tt} {}

void csa_tree_builder::reset() {
  labels_.assign(tt_.n_stops(), label{});
  trip_enter_.assign(tt_.trips_.size(), kNone);
}

routing::tree_t csa_tree_builder::build_tree(
    std::vector<routing::offset> const& from,
    double const departure_time,
    routing::routing_parameters const& p) {
  reset();

  for (auto const& o : from) {
    auto& l = labels_[to_idx(o.target_)];
    auto const arr = departure_time + o.duration_;
    if (arr < l.arr_) {
      l.arr_ = arr;
      l.access_time_ = o.duration_;
    }
  }

  auto const& conns = tt_.connections_;
  auto const first = std::lower_bound(
      begin(conns), end(conns), departure_time,
      [](connection const& c, double const t) { return c.dep_ < t; });
  for (auto it = first; it != end(conns); ++it) {
    auto const& c = *it;
    auto const c_idx = static_cast<std::uint32_t>(it - begin(conns));
    auto& enter = trip_enter_[to_idx(c.trip_)];

    if (enter == kNone) {
      auto const& l = labels_[to_idx(c.from_)];
      if (l.arr_ == kUnreachable) {
        continue;
      }
      auto const ready = l.arr_ + (l.is_origin() ? 0.0 : p.min_transfer_time_);
      if (ready > c.dep_) {
        continue;
      }
      enter = c_idx;
    }

    auto& target = labels_[to_idx(c.to_)];
    if (c.arr_ < target.arr_) {
      target.arr_ = c.arr_;
      target.enter_ = enter;
      target.exit_ = c_idx;
    }
  }

  auto tree = routing::tree_t{};
  for (auto s = 0U; s != labels_.size(); ++s) {
    if (!labels_[s].is_origin()) {
      tree.emplace(stop_idx_t{s}, reconstruct(stop_idx_t{s}));
    }
  }
  return tree;
}

routing::travel_info csa_tree_builder::reconstruct(stop_idx_t const s) const {
  auto const& conns = tt_.connections_;

  auto route = std::vector<routing::route_part>{};
  auto cur = s;
  while (!labels_[to_idx(cur)].is_origin()) {
    utl::verify(route.size() <= tt_.n_stops(),
                "csa: cycle while reconstructing stop {}", to_idx(s));

    auto const& l = labels_[to_idx(cur)];
    auto const& enter = conns[l.enter_];
    auto const& exit = conns[l.exit_];
    auto const& tr = tt_.trips_[to_idx(exit.trip_)];
    auto const& r = tt_.routes_[to_idx(tr.route_)];
    route.emplace_back(routing::route_part{
        .from_ = enter.from_,
        .to_ = exit.to_,
        .line_ = r.line_,
        .route_ = tr.route_,
        .distance_ = r.dist_[exit.stop_idx_ + 1U] - r.dist_[enter.stop_idx_],
        .boarding_time_ = enter.dep_,
        .arrival_time_ = exit.arr_});
    cur = enter.from_;
  }
  std::reverse(begin(route), end(route));

  auto const dep = route.front().boarding_time_;
  return routing::travel_info{
      .departure_stop_ = cur,
      .pt_departure_time_ = dep,
      .pt_travel_time_ = labels_[to_idx(s)].arr_ - dep,
      .access_time_ = labels_[to_idx(cur)].access_time_,
      .transfer_count_ = static_cast<std::uint32_t>(route.size() - 1U),
      .route_ = std::move(route)};
}

}  // namespace skim::network
