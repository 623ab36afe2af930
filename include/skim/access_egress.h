#pragma once

#include <vector>

#include "skim/routing/routing_parameters.h"
#include "skim/routing/stop_index.h"
#include "skim/routing/travel_info.h"

namespace skim {

// Stops within the search radius. If there is none: the nearest stop and
// all stops not farther away than distance(nearest) + extension radius.
// Throws if the network has no stops at all.
std::vector<routing::stop> find_stop_candidates(
    routing::stop_index const&, coord pos, routing::routing_parameters const&);

// Candidate stops with walking time (beeline distance / walk speed).
std::vector<routing::offset> walk_offsets(routing::stop_index const&,
                                          coord pos,
                                          routing::routing_parameters const&);

}  // namespace skim
