#include "skim/od_connection.h"

#include <algorithm>

namespace skim {

std::vector<od_connection> build_od_connections(
    std::vector<routing::tree_t> const& trees,
    std::vector<routing::offset> const& egress) {
  auto connections = std::vector<od_connection>{};
  for (auto const& tree : trees) {
    for (auto const& e : egress) {
      auto const it = tree.find(e.target_);
      if (it == tree.end()) {
        continue;
      }
      auto const& info = it->second;
      connections.push_back(
          od_connection{.departure_time_ = info.pt_departure_time_,
                        .travel_time_ = info.pt_travel_time_,
                        .access_time_ = info.access_time_,
                        .egress_time_ = e.duration_,
                        .transfer_count_ = static_cast<double>(
                            info.transfer_count_),
                        .travel_info_ = &info});
    }
  }
  return connections;
}

std::vector<od_connection> sort_and_filter_connections(
    std::vector<od_connection> connections) {
  std::stable_sort(begin(connections), end(connections),
                   [](od_connection const& a, od_connection const& b) {
                     return a.effective_departure_time() <
                            b.effective_departure_time();
                   });

  auto const fold = [](auto const from, auto const to, auto&& is_better) {
    auto kept = std::vector<od_connection>{};
    for (auto it = from; it != to; ++it) {
      if (kept.empty() || is_better(kept.back(), *it)) {
        kept.push_back(*it);
      }
    }
    return kept;
  };

  auto const forward = fold(
      begin(connections), end(connections),
      [](od_connection const& earlier, od_connection const& c) {
        auto const wait = c.effective_departure_time() -
                          earlier.effective_departure_time();
        return earlier.total_travel_time() + wait > c.total_travel_time();
      });

  auto filtered = fold(
      rbegin(forward), rend(forward),
      [](od_connection const& later, od_connection const& c) {
        auto const wait =
            later.effective_departure_time() - c.effective_departure_time();
        return later.total_travel_time() + wait > c.total_travel_time();
      });

  std::reverse(begin(filtered), end(filtered));
  return filtered;
}

od_connection const* find_fastest_connection(
    std::vector<od_connection> const& connections) {
  auto fastest = static_cast<od_connection const*>(nullptr);
  for (auto const& c : connections) {
    if (fastest == nullptr ||
        c.total_travel_time() < fastest->total_travel_time()) {
      fastest = &c;
    }
  }
  return fastest;
}

}  // namespace skim
