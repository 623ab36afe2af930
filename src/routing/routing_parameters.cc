#include "skim/routing/routing_parameters.h"

#include "utl/verify.h"

namespace skim::routing {

void routing_parameters::verify() const {
  utl::verify(beeline_walk_speed_ > 0.0, "beeline walk speed {} not positive",
              beeline_walk_speed_);
  utl::verify(search_radius_ >= 0.0, "search radius {} negative",
              search_radius_);
  utl::verify(extension_radius_ >= 0.0, "extension radius {} negative",
              extension_radius_);
  utl::verify(min_transfer_time_ >= 0.0, "min transfer time {} negative",
              min_transfer_time_);
}

}  // namespace skim::routing
