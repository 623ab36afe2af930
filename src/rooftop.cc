#include "skim/rooftop.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "utl/verify.h"

namespace skim {

double calc_adaption_time(double const prev, double const next, double const t) {
  if (std::isnan(prev)) {
    return next - t;
  } else if (std::isnan(next)) {
    return t - prev;
  } else {
    return std::min(t - prev, next - t);
  }
}

double calc_average_adaption_time(std::vector<od_connection> const& connections,
                                  double const min_departure_time,
                                  double const max_departure_time) {
  utl::verify(!connections.empty(), "rooftop: no connections");
  utl::verify(min_departure_time < max_departure_time,
              "rooftop: empty window [{}, {})", min_departure_time,
              max_departure_time);

  constexpr auto const kNone = std::numeric_limits<double>::quiet_NaN();

  auto it = begin(connections);
  auto prev = kNone;
  auto next = it->effective_departure_time();

  auto sum = 0.0;
  auto count = 0U;
  for (auto t = min_departure_time; t < max_departure_time; t += kRooftopStep) {
    while (!std::isnan(next) && t >= next) {
      prev = next;
      ++it;
      next = it == end(connections) ? kNone : it->effective_departure_time();
    }
    sum += calc_adaption_time(prev, next, t);
    ++count;
  }

  return sum / count;
}

}  // namespace skim
