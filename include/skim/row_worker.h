#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "utl/progress_tracker.h"

#include "skim/od_evaluator.h"
#include "skim/pt_indicators.h"
#include "skim/routing/stop_index.h"
#include "skim/routing/tree_builder.h"
#include "skim/skim_settings.h"

namespace skim {

// Read-only input shared by all workers plus the output matrices and the
// origin zone queue.
struct matrix_context {
  routing::stop_index const& stops_;
  routing::routing_parameters const& params_;
  skim_settings const& settings_;
  train_classifier_t const& is_train_;

  // zone -> sample points, empty if the zone has no points
  std::vector<std::vector<coord>> const& samples_;

  // zone -> sample point -> egress stops
  std::vector<std::vector<std::vector<routing::offset>>> const& egress_;

  pt_indicators& pti_;

  // origin zones; next_origin_ is the index of the next zone to process
  std::vector<zone_idx_t> const& origins_;
  std::atomic_size_t& next_origin_;

  utl::progress_tracker_sptr progress_;
};

// Pulls origin zones from the shared queue until it is empty and computes
// their rows. Owns the routing oracle it uses.
struct row_worker {
  row_worker(matrix_context&, std::unique_ptr<routing::tree_builder>);

  void run();

private:
  void calc_for_row(zone_idx_t from);
  void calc_for_point(zone_idx_t from, coord);
  void invalidate_row(zone_idx_t from);
  zone_idx_t n_zones() const;

  matrix_context& ctx_;
  std::unique_ptr<routing::tree_builder> router_;
  std::vector<routing::tree_t> trees_;
};

}  // namespace skim
