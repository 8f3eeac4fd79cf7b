#include <gtest/gtest.h>

#include <stdexcept>

#include "rl/schedule.hpp"

using namespace rl;

TEST(Linear, AnnealsToEnd) {
  auto beta = Linear(0.5f, 1.0f, 16);

  EXPECT_EQ(beta.evaluate(0.0f), 0.5f);
  EXPECT_EQ(beta.evaluate(8.0f), 0.75f);
  EXPECT_EQ(beta.evaluate(16.0f), 1.0f);
}

TEST(Linear, NotClampedPastHorizon) {
  auto beta = Linear(0.5f, 1.0f, 16);
  EXPECT_EQ(beta.evaluate(32.0f), 1.5f);
}

TEST(Linear, Decreasing) {
  auto x = Linear(2.0f, 0.5f, 3);
  EXPECT_EQ(x.evaluate(0.0f), 2.0f);
  EXPECT_EQ(x.evaluate(2.0f), 1.0f);
  EXPECT_EQ(x.evaluate(3.0f), 0.5f);
}

TEST(Linear, RejectsZeroHorizon) {
  EXPECT_THROW(Linear(0.5f, 1.0f, 0), std::invalid_argument);
}
