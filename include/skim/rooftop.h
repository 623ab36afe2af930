#pragma once

#include <vector>

#include "skim/od_connection.h"

namespace skim {

// Sampling interval of the rooftop algorithm [s].
constexpr auto const kRooftopStep = 60.0;

// Time a traveller ready at `t` has to shift to catch the closest
// connection. `prev`/`next`: effective departure of the closest connection
// at or before / after `t`, NaN if there is none.
double calc_adaption_time(double prev, double next, double t);

// Average adaption time over [min_departure_time, max_departure_time),
// sampled every minute. `connections` must be sorted ascending by effective
// departure time (see `sort_and_filter_connections`) and non-empty.
double calc_average_adaption_time(std::vector<od_connection> const&,
                                  double min_departure_time,
                                  double max_departure_time);

}  // namespace skim
