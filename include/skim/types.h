#pragma once

#include <cinttypes>
#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "cista/containers/flat_matrix.h"
#include "cista/containers/hash_map.h"
#include "cista/strong.h"

namespace skim {

template <typename K, typename V>
using hash_map = cista::raw::hash_map<K, V>;

template <typename T>
using flat_matrix = cista::raw::flat_matrix<T>;

using zone_idx_t = cista::strong<std::uint32_t, struct _zone_idx>;
using stop_idx_t = cista::strong<std::uint32_t, struct _stop_idx>;
using line_idx_t = cista::strong<std::uint32_t, struct _line_idx>;
using route_idx_t = cista::strong<std::uint32_t, struct _route_idx>;

using cista::to_idx;

constexpr auto const kUnreachable = std::numeric_limits<double>::infinity();

struct coord {
  double x_;
  double y_;
};

inline double distance(coord const& a, coord const& b) {
  return std::hypot(a.x_ - b.x_, a.y_ - b.y_);
}

// seconds since midnight -> HH:MM:SS, hours may exceed 24
std::string format_time(double seconds);

// (line, route) -> is this a train?
using train_classifier_t = std::function<bool(line_idx_t, route_idx_t)>;

}  // namespace skim
