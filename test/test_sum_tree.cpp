#include <gtest/gtest.h>

#include <random>
#include <stdexcept>

#include "rl/sum_tree.hpp"

using namespace rl;

TEST(SumTree, RoundsCapacityUp) {
  EXPECT_EQ(SumTree(8).size(), 15);
  EXPECT_EQ(SumTree(5).capacity(), 8);
  EXPECT_EQ(SumTree(1).capacity(), 1);
  EXPECT_EQ(SumTree(1).size(), 1);
  EXPECT_THROW(SumTree(0), std::invalid_argument);
}

TEST(SumTree, Functional) {
  auto tree = SumTree(8);

  for (auto i = 0; i < 8; i++) {
    tree.update(i, static_cast<float>(i));
  }

  EXPECT_EQ(tree.sum(), 28.0f);

  auto [left, left_value] = tree.find(4.0f);
  EXPECT_EQ(left, 3);
  EXPECT_EQ(left_value, 3.0f);

  auto [right, right_value] = tree.find(18.0f);
  EXPECT_EQ(right, 6);
  EXPECT_EQ(right_value, 6.0f);

  tree.update(3, 12.0f);
  EXPECT_EQ(tree.max(), 12.0f);
  EXPECT_EQ(tree.sum(), 37.0f);
}

TEST(SumTree, FindCoversPrefixIntervals) {
  auto tree = SumTree(4);
  tree.update(0, 1.0f);
  tree.update(1, 2.0f);
  tree.update(2, 0.0f);
  tree.update(3, 4.0f);

  EXPECT_EQ(tree.find(0.5f).first, 0);
  EXPECT_EQ(tree.find(1.5f).first, 1);
  EXPECT_EQ(tree.find(3.0f).first, 1);
  EXPECT_EQ(tree.find(3.5f).first, 3);
  EXPECT_EQ(tree.find(6.9f).first, 3);
}

TEST(SumTree, SumMatchesLeaves) {
  auto gen = std::mt19937{42};
  auto slot_dist = std::uniform_int_distribution<std::size_t>(0, 11);
  auto value_dist = std::uniform_int_distribution<int>(0, 64);

  auto tree = SumTree(12);
  for (auto i = 0; i < 500; i++) {
    // multiples of 1/4 keep every partial sum exact
    tree.update(slot_dist(gen), value_dist(gen) / 4.0f);

    auto expected = 0.0f;
    for (std::size_t slot = 0; slot < tree.capacity(); slot++) {
      expected += tree[slot];
    }
    ASSERT_EQ(tree.sum(), expected);
  }
}

TEST(SumTree, MaxNeverDecreases) {
  auto tree = SumTree(4);
  tree.update(0, 3.0f);
  tree.update(1, 5.0f);
  tree.update(1, 1.0f);
  tree.update(2, 2.0f);

  EXPECT_EQ(tree.max(), 5.0f);
  EXPECT_EQ(tree.sum(), 6.0f);
}

TEST(SumTree, RepeatedUpdateIsIdempotent) {
  auto tree = SumTree(4);
  tree.update(2, 1.5f);
  tree.update(2, 1.5f);
  tree.update(2, 1.5f);

  EXPECT_EQ(tree.sum(), 1.5f);
  EXPECT_EQ(tree[2], 1.5f);
}

TEST(SumTree, RejectsBadUpdates) {
  auto tree = SumTree(4);
  EXPECT_THROW(tree.update(4, 1.0f), std::out_of_range);
  EXPECT_THROW(tree.update(0, -1.0f), std::invalid_argument);
  EXPECT_EQ(tree.sum(), 0.0f);
}
