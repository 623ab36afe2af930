#include "skim/od_evaluator.h"

#include "skim/od_connection.h"
#include "skim/rooftop.h"

namespace skim {

route_shares get_route_shares(std::vector<routing::route_part> const& route,
                              train_classifier_t const& is_train) {
  auto s = route_shares{};
  for (auto const& part : route) {
    if (!part.is_transit()) {
      continue;
    }

    auto const in_vehicle_time = part.arrival_time_ - part.boarding_time_;
    s.total_distance_ += part.distance_;
    s.total_in_vehicle_time_ += in_vehicle_time;

    if (is_train(part.line_, part.route_)) {
      s.train_distance_ += part.distance_;
      s.train_in_vehicle_time_ += in_vehicle_time;
    }
  }
  return s;
}

bool calc_for_od(pt_indicators& pti,
                 zone_idx_t const from,
                 zone_idx_t const to,
                 std::vector<routing::tree_t> const& trees,
                 std::vector<routing::offset> const& egress,
                 time_window const& window,
                 train_classifier_t const& is_train) {
  auto const connections =
      sort_and_filter_connections(build_od_connections(trees, egress));
  if (connections.empty()) {
    pti.invalidate(from, to);
    return false;
  }

  auto const avg_adaption_time = calc_average_adaption_time(
      connections, window.min_departure_time_, window.max_departure_time_);

  auto const& fastest = *find_fastest_connection(connections);
  auto const shares = get_route_shares(fastest.travel_info_->route_, is_train);

  pti.accumulate(
      from, to,
      od_indicators{
          .adaption_time_ = static_cast<float>(avg_adaption_time),
          .travel_time_ = static_cast<float>(fastest.total_travel_time()),
          .access_time_ = static_cast<float>(fastest.access_time_),
          .egress_time_ = static_cast<float>(fastest.egress_time_),
          .transfer_count_ = static_cast<float>(fastest.transfer_count_),
          .train_travel_time_share_ =
              static_cast<float>(shares.train_travel_time_share()),
          .train_distance_share_ =
              static_cast<float>(shares.train_distance_share())});
  return true;
}

}  // namespace skim
