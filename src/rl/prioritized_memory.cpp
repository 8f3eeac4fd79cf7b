#include "rl/prioritized_memory.hpp"

#include <algorithm>
#include <cmath>

namespace rl {

auto importance_weights(std::span<const float> probs, std::size_t n,
                        float beta) -> std::vector<float> {
  auto weights = std::vector<float>();
  weights.reserve(probs.size());

  auto scale = static_cast<float>(n);
  for (auto p : probs) {
    weights.emplace_back(std::pow(scale * p, -beta));
  }

  if (weights.empty()) {
    return weights;
  }

  auto w_max = std::ranges::max(weights);
  for (auto& w : weights) {
    w /= w_max;
  }

  return weights;
}

}  // namespace rl
