#include "skim/access_egress.h"

#include "utl/to_vec.h"
#include "utl/verify.h"

namespace skim {

std::vector<routing::stop> find_stop_candidates(
    routing::stop_index const& idx,
    coord const pos,
    routing::routing_parameters const& p) {
  auto stops = idx.find_nearby_stops(pos, p.search_radius_);
  if (stops.empty()) {
    auto const nearest = idx.find_nearest_stop(pos);
    utl::verify(nearest.has_value(), "no stop near ({}, {}): empty network",
                pos.x_, pos.y_);
    stops = idx.find_nearby_stops(
        pos, distance(pos, nearest->pos_) + p.extension_radius_);
  }
  return stops;
}

std::vector<routing::offset> walk_offsets(
    routing::stop_index const& idx,
    coord const pos,
    routing::routing_parameters const& p) {
  return utl::to_vec(find_stop_candidates(idx, pos, p),
                     [&](routing::stop const& s) {
                       return routing::offset{
                           s.idx_, distance(pos, s.pos_) / p.beeline_walk_speed_};
                     });
}

}  // namespace skim
