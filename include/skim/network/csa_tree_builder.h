#pragma once

#include <limits>
#include <vector>

#include "skim/network/timetable.h"
#include "skim/routing/tree_builder.h"

namespace skim::network {

// Earliest arrival connection scan over a finalized timetable.
// Holds the scan state, so every thread needs its own instance.
struct csa_tree_builder final : public routing::tree_builder {
  explicit csa_tree_builder(timetable const&);

  routing::tree_t build_tree(std::vector<routing::offset> const& from,
                             double departure_time,
                             routing::routing_parameters const&) override;

private:
  static constexpr auto const kNone = std::numeric_limits<std::uint32_t>::max();

  struct label {
    bool is_origin() const { return exit_ == kNone; }

    double arr_{kUnreachable};
    double access_time_{0.0};

    // connections where the trip reaching this stop was entered / left
    std::uint32_t enter_{kNone};
    std::uint32_t exit_{kNone};
  };

  void reset();
  routing::travel_info reconstruct(stop_idx_t) const;

  timetable const& tt_;
  std::vector<label> labels_;
  std::vector<std::uint32_t> trip_enter_;
};

}  // namespace skim::network
