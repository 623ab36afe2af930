#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "skim/routing/routing_parameters.h"
#include "skim/routing/travel_info.h"

namespace skim::routing {

// Routing oracle: computes a shortest path tree from a set of origin stops
// for one departure instant.
// Instances are not required to be thread safe. Every worker owns one.
struct tree_builder {
  tree_builder() = default;
  tree_builder(tree_builder const&) = delete;
  tree_builder& operator=(tree_builder const&) = delete;
  tree_builder(tree_builder&&) = delete;
  tree_builder& operator=(tree_builder&&) = delete;
  virtual ~tree_builder() = default;

  // `from`: origin stops with their access times
  // `departure_time`: earliest time the traveller leaves the origin point
  virtual tree_t build_tree(std::vector<offset> const& from,
                            double departure_time,
                            routing_parameters const&) = 0;
};

using tree_builder_factory_t = std::function<std::unique_ptr<tree_builder>()>;

}  // namespace skim::routing
