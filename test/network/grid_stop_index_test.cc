#include "gtest/gtest.h"

#include "skim/network/grid_stop_index.h"

using namespace skim;
using namespace skim::routing;
using skim::network::grid_stop_index;

namespace {

std::vector<stop_idx_t> ids(std::vector<stop> const& stops) {
  auto v = std::vector<stop_idx_t>{};
  for (auto const& s : stops) {
    v.emplace_back(s.idx_);
  }
  return v;
}

}  // namespace

TEST(grid_stop_index, nearby) {
  auto const idx = grid_stop_index{{{stop_idx_t{3U}, {1000.0, 1000.0}},
                                    {stop_idx_t{0U}, {0.0, 0.0}},
                                    {stop_idx_t{2U}, {0.0, 300.0}},
                                    {stop_idx_t{1U}, {100.0, 0.0}}},
                                   250.0};

  EXPECT_EQ((std::vector<stop_idx_t>{stop_idx_t{0U}, stop_idx_t{1U}}),
            ids(idx.find_nearby_stops({0.0, 0.0}, 150.0)));
  EXPECT_EQ((std::vector<stop_idx_t>{stop_idx_t{0U}}),
            ids(idx.find_nearby_stops({0.0, 0.0}, 0.0)));
  EXPECT_EQ((std::vector<stop_idx_t>{stop_idx_t{0U}, stop_idx_t{1U},
                                     stop_idx_t{2U}}),
            ids(idx.find_nearby_stops({0.0, 0.0}, 300.0)));
  EXPECT_EQ(4U, idx.find_nearby_stops({500.0, 500.0}, 1000.0).size());
  EXPECT_TRUE(idx.find_nearby_stops({5000.0, 5000.0}, 100.0).empty());
  EXPECT_TRUE(idx.find_nearby_stops({-5000.0, 0.0}, 100.0).empty());
}

TEST(grid_stop_index, nearest) {
  auto const idx = grid_stop_index{{{stop_idx_t{0U}, {0.0, 0.0}},
                                    {stop_idx_t{1U}, {100.0, 0.0}},
                                    {stop_idx_t{2U}, {1000.0, 1000.0}}}};

  auto const a = idx.find_nearest_stop({900.0, 900.0});
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(stop_idx_t{2U}, a->idx_);

  auto const b = idx.find_nearest_stop({-20000.0, 10.0});
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(stop_idx_t{0U}, b->idx_);
}

TEST(grid_stop_index, empty) {
  auto const idx = grid_stop_index{std::vector<stop>{}};
  EXPECT_FALSE(idx.find_nearest_stop({0.0, 0.0}).has_value());
  EXPECT_TRUE(idx.find_nearby_stops({0.0, 0.0}, 1e6).empty());
}
