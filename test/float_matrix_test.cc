#include "gtest/gtest.h"

#include <cmath>

#include "skim/float_matrix.h"
#include "skim/pt_indicators.h"

using namespace skim;

namespace {

constexpr auto const z0 = zone_idx_t{0U};
constexpr auto const z1 = zone_idx_t{1U};
constexpr auto const z2 = zone_idx_t{2U};

od_indicators values(float const x) {
  return {.adaption_time_ = x,
          .travel_time_ = 10.0F * x,
          .access_time_ = x,
          .egress_time_ = x,
          .transfer_count_ = x,
          .train_travel_time_share_ = x / 10.0F,
          .train_distance_share_ = x / 10.0F};
}

}  // namespace

TEST(matrix, float_matrix_ops) {
  auto m = float_matrix{3U, 0.0F};

  for (auto from = z0; from != zone_idx_t{3U}; ++from) {
    for (auto to = z0; to != zone_idx_t{3U}; ++to) {
      EXPECT_EQ(0.0F, m.get(from, to));
    }
  }

  m.set(z1, z1, 4.0F);
  EXPECT_EQ(4.0F, m.get(z1, z1));

  EXPECT_EQ(6.5F, m.add(z1, z1, 2.5F));
  EXPECT_EQ(6.5F, m.get(z1, z1));

  EXPECT_EQ(3.25F, m.multiply(z1, z1, 0.5F));
  EXPECT_EQ(3.25F, m.get(z1, z1));

  m.set(z0, z2, 1.0F);
  EXPECT_EQ(1.0F, m.get(z0, z2));
  EXPECT_EQ(0.0F, m.get(z2, z0));
}

TEST(matrix, default_value) {
  auto const m = float_matrix{2U, 7.0F};
  EXPECT_EQ(2U, m.n_zones());
  EXPECT_EQ(7.0F, m.get(z1, z0));
}

TEST(matrix, invalidate_without_data) {
  auto pti = pt_indicators{2U};
  pti.invalidate(z0, z1);
  pti.finalize(3600.0);

  EXPECT_TRUE(std::isinf(pti.adaption_time_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.frequency_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.travel_time_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.access_time_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.egress_time_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.transfer_count_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.train_travel_time_share_.get(z0, z1)));
  EXPECT_TRUE(std::isinf(pti.train_distance_share_.get(z0, z1)));
  EXPECT_EQ(0.0F, pti.data_count_.get(z0, z1));
}

TEST(matrix, untouched_cells_are_invalid_after_finalize) {
  auto pti = pt_indicators{2U};
  pti.finalize(3600.0);
  EXPECT_TRUE(std::isinf(pti.travel_time_.get(z1, z1)));
  EXPECT_TRUE(std::isinf(pti.frequency_.get(z1, z1)));
  EXPECT_EQ(0.0F, pti.data_count_.get(z1, z1));
}

TEST(matrix, invalidation_does_not_depend_on_order) {
  auto a = pt_indicators{2U};
  a.invalidate(z0, z1);
  a.accumulate(z0, z1, values(100.0F));
  a.invalidate(z0, z1);
  a.accumulate(z0, z1, values(300.0F));

  auto b = pt_indicators{2U};
  b.accumulate(z0, z1, values(100.0F));
  b.accumulate(z0, z1, values(300.0F));
  b.invalidate(z0, z1);

  for (auto* pti : {&a, &b}) {
    EXPECT_EQ(2.0F, pti->data_count_.get(z0, z1));
    EXPECT_EQ(400.0F, pti->adaption_time_.get(z0, z1));
    EXPECT_EQ(4000.0F, pti->travel_time_.get(z0, z1));

    pti->finalize(3600.0);
    EXPECT_EQ(2.0F, pti->data_count_.get(z0, z1));
    EXPECT_FLOAT_EQ(200.0F, pti->adaption_time_.get(z0, z1));
    EXPECT_FLOAT_EQ(2000.0F, pti->travel_time_.get(z0, z1));
    EXPECT_FLOAT_EQ(200.0F, pti->access_time_.get(z0, z1));
    EXPECT_FLOAT_EQ(200.0F, pti->egress_time_.get(z0, z1));
    EXPECT_FLOAT_EQ(200.0F, pti->transfer_count_.get(z0, z1));
    EXPECT_FLOAT_EQ(20.0F, pti->train_travel_time_share_.get(z0, z1));
    EXPECT_FLOAT_EQ(20.0F, pti->train_distance_share_.get(z0, z1));
    EXPECT_FLOAT_EQ(3600.0F / 200.0F / 4.0F, pti->frequency_.get(z0, z1));
  }
}

TEST(matrix, frequency_formula) {
  EXPECT_DOUBLE_EQ(1.0, frequency(600.0, 150.0));
  EXPECT_DOUBLE_EQ(3600.0 / 1406.0 / 4.0, frequency(3600.0, 1406.0));
}
