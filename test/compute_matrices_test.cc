#include "gtest/gtest.h"

#include <bit>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

#include "skim/compute_matrices.h"
#include "skim/network/csa_tree_builder.h"
#include "skim/network/grid_network.h"
#include "skim/network/grid_stop_index.h"

using namespace skim;
using namespace skim::routing;
using namespace skim::network;

namespace {

using coords_t = std::map<std::string, std::vector<coord>>;

constexpr auto const kInf = std::numeric_limits<float>::infinity();

// A (0,0) --train--> B (1000,0), departures at 0 and 600
timetable two_stops() {
  auto tt = timetable{};
  auto const a = tt.add_stop({0.0, 0.0});
  auto const b = tt.add_stop({1000.0, 0.0});
  auto const r = tt.add_route(tt.add_line("T", true), {a, b});
  tt.add_trip(r, {0.0, 300.0}, {0.0, 300.0});
  tt.add_trip(r, {600.0, 900.0}, {600.0, 900.0});
  tt.finalize();
  return tt;
}

tree_builder_factory_t csa_factory(timetable const& tt) {
  return [&]() { return std::make_unique<csa_tree_builder>(tt); };
}

train_classifier_t classifier(timetable const& tt) {
  return [&](line_idx_t const l, route_idx_t const r) {
    return tt.is_train(l, r);
  };
}

skim_settings first_ten_minutes(unsigned const n_workers) {
  auto s = skim_settings{};
  s.min_departure_time_ = 0.0;
  s.max_departure_time_ = 600.0;
  s.step_size_ = 60.0;
  s.n_workers_ = n_workers;
  return s;
}

routing_parameters small_radius() {
  auto p = routing_parameters{};
  p.search_radius_ = 100.0;
  p.extension_radius_ = 0.0;
  return p;
}

void expect_invalid(skim_matrices<std::string> const& m,
                    std::string const& from,
                    std::string const& to) {
  auto const& pti = m.pti_;
  EXPECT_EQ(0.0F, m.get(pti.data_count_, from, to)) << from << "->" << to;
  for (auto const* x :
       {&pti.adaption_time_, &pti.frequency_, &pti.travel_time_,
        &pti.access_time_, &pti.egress_time_, &pti.transfer_count_,
        &pti.train_travel_time_share_, &pti.train_distance_share_}) {
    EXPECT_EQ(kInf, m.get(*x, from, to)) << from << "->" << to;
  }
}

struct failing_router final : public tree_builder {
  tree_t build_tree(std::vector<offset> const&,
                    double,
                    routing_parameters const&) override {
    throw std::runtime_error{"router failure"};
  }
};

}  // namespace

TEST(compute_matrices, one_line) {
  auto const tt = two_stops();
  auto const stops = grid_stop_index{tt.get_stops()};

  auto const m = compute_matrices(
      std::vector<std::string>{"a", "b"},
      coords_t{{"a", {{0.0, 0.0}}}, {"b", {{1000.0, 0.0}}}}, stops,
      csa_factory(tt), first_ten_minutes(2U), small_radius(), classifier(tt));

  auto const& pti = m.pti_;
  EXPECT_EQ(1.0F, m.get(pti.data_count_, "a", "b"));
  EXPECT_FLOAT_EQ(150.0F, m.get(pti.adaption_time_, "a", "b"));
  EXPECT_FLOAT_EQ(1.0F, m.get(pti.frequency_, "a", "b"));
  EXPECT_FLOAT_EQ(300.0F, m.get(pti.travel_time_, "a", "b"));
  EXPECT_FLOAT_EQ(0.0F, m.get(pti.access_time_, "a", "b"));
  EXPECT_FLOAT_EQ(0.0F, m.get(pti.egress_time_, "a", "b"));
  EXPECT_FLOAT_EQ(0.0F, m.get(pti.transfer_count_, "a", "b"));
  EXPECT_FLOAT_EQ(1.0F, m.get(pti.train_travel_time_share_, "a", "b"));
  EXPECT_FLOAT_EQ(1.0F, m.get(pti.train_distance_share_, "a", "b"));

  expect_invalid(m, "b", "a");
  expect_invalid(m, "a", "a");
  expect_invalid(m, "b", "b");
}

TEST(compute_matrices, zones_without_points) {
  auto const tt = two_stops();
  auto const stops = grid_stop_index{tt.get_stops()};

  auto const m = compute_matrices(
      std::vector<std::string>{"a", "b", "empty", "missing"},
      coords_t{{"a", {{0.0, 0.0}}}, {"b", {{1000.0, 0.0}}}, {"empty", {}}},
      stops, csa_factory(tt), first_ten_minutes(3U), small_radius(),
      classifier(tt));

  EXPECT_EQ(4U, m.pti_.n_zones());
  EXPECT_EQ(1.0F, m.get(m.pti_.data_count_, "a", "b"));
  for (auto const z : {"empty", "missing"}) {
    for (auto const other : {"a", "b", "empty", "missing"}) {
      expect_invalid(m, z, other);
      expect_invalid(m, other, z);
    }
  }
}

TEST(compute_matrices, worker_failure) {
  auto const tt = two_stops();
  auto const stops = grid_stop_index{tt.get_stops()};
  auto const factory = tree_builder_factory_t{
      []() { return std::make_unique<failing_router>(); }};

  EXPECT_THROW(
      compute_matrices(std::vector<std::string>{"a", "b"},
                       coords_t{{"a", {{0.0, 0.0}}}, {"b", {{1000.0, 0.0}}}},
                       stops, factory, first_ten_minutes(2U), small_radius(),
                       classifier(tt)),
      std::runtime_error);
}

TEST(compute_matrices, invalid_settings) {
  auto const tt = two_stops();
  auto const stops = grid_stop_index{tt.get_stops()};

  auto s = first_ten_minutes(1U);
  s.step_size_ = 0.0;
  EXPECT_THROW(compute_matrices(std::vector<std::string>{"a"},
                                coords_t{{"a", {{0.0, 0.0}}}}, stops,
                                csa_factory(tt), s, small_radius(),
                                classifier(tt)),
               std::runtime_error);

  s = first_ten_minutes(1U);
  s.max_departure_time_ = s.min_departure_time_;
  EXPECT_THROW(compute_matrices(std::vector<std::string>{"a"},
                                coords_t{{"a", {{0.0, 0.0}}}}, stops,
                                csa_factory(tt), s, small_radius(),
                                classifier(tt)),
               std::runtime_error);
}

TEST(compute_matrices, independent_of_worker_count) {
  auto g = grid_settings{};
  g.n_x_ = 4U;
  g.n_y_ = 4U;
  g.samples_per_zone_ = 2U;
  auto const net = make_grid_network(g);
  auto const stops = grid_stop_index{net.tt_.get_stops()};

  auto const run = [&](unsigned const n_workers) {
    auto s = skim_settings{};
    s.min_departure_time_ = 7.0 * 3600.0;
    s.max_departure_time_ = 7.5 * 3600.0;
    s.step_size_ = 120.0;
    s.n_workers_ = n_workers;
    return compute_matrices(net.zones_, net.coords_per_zone_, stops,
                            csa_factory(net.tt_), s, routing_parameters{},
                            classifier(net.tt_));
  };

  auto const single = run(1U);
  auto const multi = run(4U);

  auto const n = zone_idx_t{single.pti_.n_zones()};
  ASSERT_EQ(16U, single.pti_.n_zones());
  auto n_valid = 0U;
  for (auto from = zone_idx_t{0U}; from != n; ++from) {
    for (auto to = zone_idx_t{0U}; to != n; ++to) {
      auto const& a = single.pti_;
      auto const& b = multi.pti_;
      auto const pairs = {
          std::pair{&a.adaption_time_, &b.adaption_time_},
          std::pair{&a.frequency_, &b.frequency_},
          std::pair{&a.travel_time_, &b.travel_time_},
          std::pair{&a.access_time_, &b.access_time_},
          std::pair{&a.egress_time_, &b.egress_time_},
          std::pair{&a.transfer_count_, &b.transfer_count_},
          std::pair{&a.train_travel_time_share_, &b.train_travel_time_share_},
          std::pair{&a.train_distance_share_, &b.train_distance_share_},
          std::pair{&a.data_count_, &b.data_count_}};
      for (auto const& [x, y] : pairs) {
        EXPECT_EQ(std::bit_cast<std::uint32_t>(x->get(from, to)),
                  std::bit_cast<std::uint32_t>(y->get(from, to)));
      }

      if (!a.has_data(from, to)) {
        continue;
      }
      ++n_valid;
      auto const adaption = a.adaption_time_.get(from, to);
      EXPECT_GT(adaption, 0.0F);
      EXPECT_NEAR(1800.0 / adaption / 4.0, a.frequency_.get(from, to), 1e-3);
      EXPECT_GE(a.train_distance_share_.get(from, to), 0.0F);
      EXPECT_LE(a.train_distance_share_.get(from, to), 1.0F);
    }
  }
  EXPECT_GT(n_valid, 0U);
}

TEST(compute_matrices, invalid_routing_parameters) {
  auto const tt = two_stops();
  auto const stops = grid_stop_index{tt.get_stops()};

  auto p = small_radius();
  p.beeline_walk_speed_ = 0.0;
  EXPECT_THROW(compute_matrices(std::vector<std::string>{"a"},
                                coords_t{{"a", {{0.0, 0.0}}}}, stops,
                                csa_factory(tt), first_ten_minutes(1U), p,
                                classifier(tt)),
               std::runtime_error);
}

TEST(zone_index, lookup) {
  auto const idx = zone_index<std::string>{{"x", "y", "z"}};
  EXPECT_EQ(3U, idx.size());
  EXPECT_EQ(zone_idx_t{1U}, idx.at("y"));
  EXPECT_EQ("z", idx.id(zone_idx_t{2U}));
  EXPECT_TRUE(idx.contains("x"));
  EXPECT_FALSE(idx.contains("w"));
  EXPECT_THROW(idx.at("w"), std::runtime_error);
  EXPECT_THROW((zone_index<std::string>{{"x", "x"}}), std::runtime_error);
}
