#pragma once

#include <vector>

#include "skim/pt_indicators.h"
#include "skim/routing/routing_parameters.h"
#include "skim/routing/stop_index.h"
#include "skim/routing/tree_builder.h"
#include "skim/skim_settings.h"
#include "skim/zone_index.h"

namespace skim {

// Computes the zone-to-zone indicators for zones [0, samples.size()).
// `samples[z]` holds the sample points of zone z (empty: invalid zone).
// Blocks until all workers have finished. Rethrows the first exception
// raised by a worker.
pt_indicators compute_indicators(
    routing::stop_index const&,
    routing::tree_builder_factory_t const&,
    std::vector<std::vector<coord>> const& samples,
    skim_settings const&,
    routing::routing_parameters const&,
    train_classifier_t const&);

template <typename Zone>
struct skim_matrices {
  float get(float_matrix const& m, Zone const& from, Zone const& to) const {
    return m.get(zones_.at(from), zones_.at(to));
  }

  zone_index<Zone> zones_;
  pt_indicators pti_;
};

// Zones missing in `coords_per_zone` are treated like zones without sample
// points: their rows and columns are invalid.
// CoordsPerZone: associative container Zone -> sequence of coord.
template <typename Zone, typename CoordsPerZone>
skim_matrices<Zone> compute_matrices(
    std::vector<Zone> zones,
    CoordsPerZone const& coords_per_zone,
    routing::stop_index const& stops,
    routing::tree_builder_factory_t const& make_router,
    skim_settings const& settings,
    routing::routing_parameters const& params,
    train_classifier_t const& is_train) {
  auto index = zone_index<Zone>{std::move(zones)};

  auto samples = std::vector<std::vector<coord>>(index.size());
  for (auto i = 0U; i != index.size(); ++i) {
    auto const it = coords_per_zone.find(index.ids_[i]);
    if (it != coords_per_zone.end()) {
      samples[i].assign(begin(it->second), end(it->second));
    }
  }

  auto pti = compute_indicators(stops, make_router, samples, settings, params,
                                is_train);
  return skim_matrices<Zone>{std::move(index), std::move(pti)};
}

}  // namespace skim
