#pragma once

#include <vector>

#include "utl/verify.h"

#include "skim/types.h"

namespace skim {

// Maps caller supplied zone ids to dense indices [0, n).
template <typename Zone>
struct zone_index {
  explicit zone_index(std::vector<Zone> ids) : ids_{std::move(ids)} {
    for (auto i = 0U; i != ids_.size(); ++i) {
      auto const inserted =
          idx_.emplace(ids_[i], zone_idx_t{static_cast<std::uint32_t>(i)})
              .second;
      utl::verify(inserted, "duplicate zone at position {}", i);
    }
  }

  zone_idx_t at(Zone const& id) const {
    auto const it = idx_.find(id);
    utl::verify(it != idx_.end(), "unknown zone");
    return it->second;
  }

  bool contains(Zone const& id) const { return idx_.find(id) != idx_.end(); }

  Zone const& id(zone_idx_t const z) const { return ids_[to_idx(z)]; }

  std::uint32_t size() const { return static_cast<std::uint32_t>(ids_.size()); }

  std::vector<Zone> ids_;
  hash_map<Zone, zone_idx_t> idx_;
};

}  // namespace skim
