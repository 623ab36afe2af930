#pragma once

#include <optional>
#include <vector>

#include "skim/types.h"

namespace skim::routing {

struct stop {
  stop_idx_t idx_;
  coord pos_;
};

// Spatial lookup of stops.
// Shared by all workers: const member functions must be safe to call
// concurrently.
struct stop_index {
  stop_index() = default;
  stop_index(stop_index const&) = delete;
  stop_index& operator=(stop_index const&) = delete;
  stop_index(stop_index&&) = delete;
  stop_index& operator=(stop_index&&) = delete;
  virtual ~stop_index() = default;

  // all stops with distance(pos, stop) <= radius, ordered by stop index
  virtual std::vector<stop> find_nearby_stops(coord pos,
                                              double radius) const = 0;

  // nullopt only if there are no stops at all
  virtual std::optional<stop> find_nearest_stop(coord pos) const = 0;
};

}  // namespace skim::routing
