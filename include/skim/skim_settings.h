#pragma once

#include <cinttypes>

namespace skim {

struct skim_settings {
  void verify() const;

  // resolves n_workers_ == 0 to the number of hardware threads
  unsigned n_workers() const;

  std::uint32_t n_departures() const;

  // departure window [min_departure_time_, max_departure_time_)
  // in seconds since midnight
  double min_departure_time_{7.0 * 3600.0};
  double max_departure_time_{8.0 * 3600.0};

  // one shortest path tree per step_size_ seconds
  double step_size_{60.0};

  unsigned n_workers_{0U};
};

}  // namespace skim
