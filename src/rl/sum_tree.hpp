#pragma once

#include <utility>
#include <vector>

namespace rl {

/// Complete binary tree over `capacity` leaves (rounded up to a power of
/// two) where every internal node holds the sum of its two children.
///
/// Leaves are addressed by slot index, so slot `i` of a RingBuffer maps to
/// leaf `i`. The root therefore holds the total priority mass, and a uniform
/// draw over `[0, sum())` passed to `find` lands on a leaf with probability
/// proportional to its value.
class SumTree {
 public:
  explicit SumTree(std::size_t capacity);

  /// Sets leaf `slot` to `value` and propagates the change to the root.
  auto update(std::size_t slot, float value) -> void;

  /// Descends from the root towards the leaf whose prefix-sum interval
  /// contains `target`. Returns the slot index and the leaf value.
  auto find(float target) const -> std::pair<std::size_t, float>;

  auto sum() const -> float { return tree_[0]; }

  /// Largest value ever written to a leaf.
  auto max() const -> float { return max_; }

  auto capacity() const -> std::size_t { return leaf_count_; }
  auto size() const -> std::size_t { return tree_.size(); }

  auto operator[](std::size_t slot) const -> float;

 private:
  auto leaf(std::size_t slot) const -> std::size_t {
    return slot + leaf_count_ - 1;
  }

  std::size_t leaf_count_;
  std::vector<float> tree_;
  float max_ = 0.0f;
};

}  // namespace rl
