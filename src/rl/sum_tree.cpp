#include "rl/sum_tree.hpp"

#include <assert.h>

#include <bit>
#include <format>
#include <stdexcept>

namespace rl {

namespace {

auto leaf_count_for(std::size_t capacity) -> std::size_t {
  if (capacity == 0) {
    throw std::invalid_argument("SumTree capacity must be positive");
  }
  return std::bit_ceil(capacity);
}

}  // namespace

SumTree::SumTree(std::size_t capacity)
    : leaf_count_(leaf_count_for(capacity)), tree_(2 * leaf_count_ - 1, 0.0f) {}

auto SumTree::update(std::size_t slot, float value) -> void {
  if (slot >= leaf_count_) {
    throw std::out_of_range(
        std::format("slot {} outside sum tree of {} leaves", slot, leaf_count_));
  }
  if (not (value >= 0.0f)) {
    throw std::invalid_argument(
        std::format("priority must be non-negative, got {}", value));
  }

  auto index = leaf(slot);
  auto change = value - tree_[index];

  tree_[index] = value;

  while (index > 0) {
    index = (index - 1) / 2;
    tree_[index] += change;
  }

  if (value > max_) {
    max_ = value;
  }
}

auto SumTree::find(float target) const -> std::pair<std::size_t, float> {
  auto index = std::size_t{0};
  while (index < leaf_count_ - 1) {
    auto left = 2 * index + 1;
    auto right = left + 1;
    if (target <= tree_[left]) {
      index = left;
    } else {
      target -= tree_[left];
      index = right;
    }
  }

  return {index - (leaf_count_ - 1), tree_[index]};
}

auto SumTree::operator[](std::size_t slot) const -> float {
  assert(slot < leaf_count_);
  return tree_[leaf(slot)];
}

}  // namespace rl
