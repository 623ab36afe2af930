#pragma once

#include <vector>

#include "skim/routing/stop_index.h"

namespace skim::network {

// Buckets stops into square cells of `cell_size` meters.
// Immutable after construction.
struct grid_stop_index final : public routing::stop_index {
  explicit grid_stop_index(std::vector<routing::stop>,
                           double cell_size = 500.0);

  std::vector<routing::stop> find_nearby_stops(coord pos,
                                               double radius) const override;

  std::optional<routing::stop> find_nearest_stop(coord pos) const override;

private:
  std::uint32_t cell_x(double x) const;
  std::uint32_t cell_y(double y) const;
  std::vector<std::uint32_t> const& cell(std::uint32_t x,
                                         std::uint32_t y) const;

  std::vector<routing::stop> stops_;
  double cell_size_;
  coord min_{0.0, 0.0};
  std::uint32_t n_cols_{1U};
  std::uint32_t n_rows_{1U};

  // row major: cell (x, y) at y * n_cols_ + x, holds positions in stops_
  std::vector<std::vector<std::uint32_t>> cells_;
};

}  // namespace skim::network
