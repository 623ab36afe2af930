#include "skim/network/grid_stop_index.h"

#include <algorithm>
#include <cmath>

#include "utl/verify.h"

namespace skim::network {

grid_stop_index::grid_stop_index(std::vector<routing::stop> stops,
                                 double const cell_size)
    : stops_{std::move(stops)}, cell_size_{cell_size} {
  utl::verify(cell_size_ > 0.0, "grid cell size {} not positive", cell_size_);

  std::sort(begin(stops_), end(stops_),
            [](routing::stop const& a, routing::stop const& b) {
              return a.idx_ < b.idx_;
            });

  if (!stops_.empty()) {
    auto max = stops_.front().pos_;
    min_ = stops_.front().pos_;
    for (auto const& s : stops_) {
      min_.x_ = std::min(min_.x_, s.pos_.x_);
      min_.y_ = std::min(min_.y_, s.pos_.y_);
      max.x_ = std::max(max.x_, s.pos_.x_);
      max.y_ = std::max(max.y_, s.pos_.y_);
    }
    n_cols_ = static_cast<std::uint32_t>((max.x_ - min_.x_) / cell_size_) + 1U;
    n_rows_ = static_cast<std::uint32_t>((max.y_ - min_.y_) / cell_size_) + 1U;
  }

  cells_.resize(static_cast<std::size_t>(n_rows_) * n_cols_);
  for (auto i = 0U; i != stops_.size(); ++i) {
    auto const& s = stops_[i];
    cells_[static_cast<std::size_t>(cell_y(s.pos_.y_)) * n_cols_ +
           cell_x(s.pos_.x_)]
        .push_back(i);
  }
}

std::uint32_t grid_stop_index::cell_x(double const x) const {
  auto const c = std::floor((x - min_.x_) / cell_size_);
  return static_cast<std::uint32_t>(
      std::clamp(c, 0.0, static_cast<double>(n_cols_ - 1U)));
}

std::uint32_t grid_stop_index::cell_y(double const y) const {
  auto const c = std::floor((y - min_.y_) / cell_size_);
  return static_cast<std::uint32_t>(
      std::clamp(c, 0.0, static_cast<double>(n_rows_ - 1U)));
}

std::vector<std::uint32_t> const& grid_stop_index::cell(
    std::uint32_t const x, std::uint32_t const y) const {
  return cells_[static_cast<std::size_t>(y) * n_cols_ + x];
}

std::vector<routing::stop> grid_stop_index::find_nearby_stops(
    coord const pos, double const radius) const {
  auto found = std::vector<routing::stop>{};
  if (stops_.empty()) {
    return found;
  }

  auto const from_x = cell_x(pos.x_ - radius);
  auto const to_x = cell_x(pos.x_ + radius);
  auto const from_y = cell_y(pos.y_ - radius);
  auto const to_y = cell_y(pos.y_ + radius);
  for (auto y = from_y; y <= to_y; ++y) {
    for (auto x = from_x; x <= to_x; ++x) {
      for (auto const i : cell(x, y)) {
        if (distance(pos, stops_[i].pos_) <= radius) {
          found.push_back(stops_[i]);
        }
      }
    }
  }

  std::sort(begin(found), end(found),
            [](routing::stop const& a, routing::stop const& b) {
              return a.idx_ < b.idx_;
            });
  return found;
}

std::optional<routing::stop> grid_stop_index::find_nearest_stop(
    coord const pos) const {
  auto nearest = std::optional<routing::stop>{};
  auto best = kUnreachable;
  for (auto const& s : stops_) {
    auto const d = distance(pos, s.pos_);
    if (d < best) {
      best = d;
      nearest = s;
    }
  }
  return nearest;
}

}  // namespace skim::network
