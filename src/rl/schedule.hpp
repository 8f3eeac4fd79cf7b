#pragma once

#include <cstddef>

namespace rl {

/// v(t) = start + (end - start) * t / horizon
///
/// Reaches `end` exactly at `t == horizon` and keeps going past it.
class Linear {
 public:
  Linear(float start, float end, std::size_t horizon);

  auto evaluate(float t) const -> float;

  auto start() const -> float { return start_; }
  auto end() const -> float { return end_; }
  auto horizon() const -> std::size_t { return horizon_; }

 private:
  float start_;
  float end_;
  std::size_t horizon_;
};

}  // namespace rl
