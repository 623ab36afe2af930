#include "skim/skim_settings.h"

#include <cmath>
#include <thread>

#include "utl/verify.h"

namespace skim {

void skim_settings::verify() const {
  utl::verify(min_departure_time_ < max_departure_time_,
              "empty departure window [{}, {})", min_departure_time_,
              max_departure_time_);
  utl::verify(step_size_ > 0.0, "step size {} not positive", step_size_);
  utl::verify(n_workers() != 0U, "no worker threads");
}

unsigned skim_settings::n_workers() const {
  return n_workers_ == 0U ? std::thread::hardware_concurrency() : n_workers_;
}

std::uint32_t skim_settings::n_departures() const {
  return static_cast<std::uint32_t>(
      std::ceil((max_departure_time_ - min_departure_time_) / step_size_));
}

}  // namespace skim
