#pragma once

#include <algorithm>
#include <optional>
#include <random>
#include <ranges>
#include <stdexcept>
#include <vector>

#include "rl/env.hpp"
#include "rl/experience.hpp"
#include "rl/ring_buffer.hpp"

namespace rl {

namespace detail {

inline auto validate_sizes(std::size_t capacity, std::size_t batch_size)
    -> void {
  if (capacity == 0) {
    throw std::invalid_argument("memory capacity must be positive");
  }
  if (batch_size == 0) {
    throw std::invalid_argument("memory batch size must be positive");
  }
  if (batch_size > capacity) {
    throw std::invalid_argument("memory batch size exceeds its capacity");
  }
}

}  // namespace detail

/// Fixed-size store of experiences with uniform sampling. The oldest
/// experiences are overwritten once the capacity is reached.
template <concepts::Environment Env>
class ReplayMemory {
 public:
  using Experience = Exp<Env>;
  using Batch = rl::Batch<Env>;

  struct Config {
    std::size_t capacity = 65536;
    std::size_t batch_size = 128;
  };

  ReplayMemory(Config config, std::mt19937& gen)
      : config_(config), gen_(gen), data_(config.capacity) {
    detail::validate_sizes(config.capacity, config.batch_size);
  }

  auto push(Experience exp) -> void { data_.push(std::move(exp)); }

  auto size() const -> std::size_t { return data_.size(); }
  auto capacity() const -> std::size_t { return data_.capacity(); }
  auto batch_size() const -> std::size_t { return config_.batch_size; }

  auto data() const -> const RingBuffer<Experience>& { return data_; }

  /// Draws `batch_size()` distinct experiences, or nothing while fewer than
  /// that many are stored.
  auto sample() const -> std::optional<std::vector<const Experience*>> {
    return sample(config_.batch_size);
  }

  auto sample(std::size_t batch_size) const
      -> std::optional<std::vector<const Experience*>> {
    if (batch_size > data_.size()) {
      return std::nullopt;
    }

    auto pointers = data_.view() | std::views::transform(
                                       [](const Experience& exp) { return &exp; });

    // the view only models an input range, so std::sample needs a random
    // access output
    auto batch = std::vector<const Experience*>(batch_size);
    std::ranges::sample(pointers, batch.begin(), batch_size, gen_);
    // reservoir sampling leaves the first slots in buffer order
    std::ranges::shuffle(batch, gen_);

    return batch;
  }

  auto sample_zipped() const -> std::optional<Batch> {
    return sample_zipped(config_.batch_size);
  }

  auto sample_zipped(std::size_t batch_size) const -> std::optional<Batch> {
    auto experiences = sample(batch_size);
    if (not experiences) {
      return std::nullopt;
    }
    return Batch::from_range(*experiences, batch_size);
  }

 private:
  Config config_;
  std::mt19937& gen_;
  RingBuffer<Experience> data_;
};

}  // namespace rl
