#include "rl/schedule.hpp"

#include <stdexcept>

namespace rl {

Linear::Linear(float start, float end, std::size_t horizon)
    : start_(start), end_(end), horizon_(horizon) {
  if (horizon == 0) {
    throw std::invalid_argument("Linear schedule horizon must be positive");
  }
}

auto Linear::evaluate(float t) const -> float {
  return start_ + (end_ - start_) * t / static_cast<float>(horizon_);
}

}  // namespace rl
