#include "skim/row_worker.h"

#include "skim/access_egress.h"

namespace skim {

row_worker::row_worker(matrix_context& ctx,
                       std::unique_ptr<routing::tree_builder> router)
    : ctx_{ctx}, router_{std::move(router)} {}

void row_worker::run() {
  while (true) {
    auto const i = ctx_.next_origin_.fetch_add(1U, std::memory_order_relaxed);
    if (i >= ctx_.origins_.size()) {
      return;
    }
    calc_for_row(ctx_.origins_[i]);
    ctx_.progress_->increment();
  }
}

void row_worker::calc_for_row(zone_idx_t const from) {
  auto const& from_points = ctx_.samples_[to_idx(from)];
  if (from_points.empty()) {
    invalidate_row(from);
    return;
  }
  for (auto const& p : from_points) {
    calc_for_point(from, p);
  }
}

void row_worker::calc_for_point(zone_idx_t const from, coord const pos) {
  auto const access = walk_offsets(ctx_.stops_, pos, ctx_.params_);

  auto const& s = ctx_.settings_;
  trees_.clear();
  trees_.reserve(s.n_departures());
  for (auto i = 0U; i != s.n_departures(); ++i) {
    auto const t = s.min_departure_time_ + i * s.step_size_;
    trees_.emplace_back(router_->build_tree(access, t, ctx_.params_));
  }

  auto const window = time_window{s.min_departure_time_, s.max_departure_time_};
  for (auto to = zone_idx_t{0U}; to != n_zones(); ++to) {
    auto const& egress = ctx_.egress_[to_idx(to)];
    if (egress.empty()) {
      ctx_.pti_.invalidate(from, to);
      continue;
    }
    for (auto const& e : egress) {
      calc_for_od(ctx_.pti_, from, to, trees_, e, window, ctx_.is_train_);
    }
  }
}

zone_idx_t row_worker::n_zones() const {
  return zone_idx_t{ctx_.pti_.n_zones()};
}

void row_worker::invalidate_row(zone_idx_t const from) {
  for (auto to = zone_idx_t{0U}; to != n_zones(); ++to) {
    ctx_.pti_.invalidate(from, to);
  }
}

}  // namespace skim
