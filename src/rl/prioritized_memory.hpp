#pragma once

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <vector>

#include "rl/env.hpp"
#include "rl/experience.hpp"
#include "rl/memory.hpp"
#include "rl/ring_buffer.hpp"
#include "rl/schedule.hpp"
#include "rl/sum_tree.hpp"

namespace rl {

/// Priority given to new experiences before any priority has been recorded.
inline constexpr float kMinPriority = 1e-5f;

/// Normalized importance-sampling weights `(n * p)^-beta / max_w` for the
/// sampling probabilities `probs` of a memory holding `n` experiences. The
/// largest returned weight is exactly 1.
auto importance_weights(std::span<const float> probs, std::size_t n,
                        float beta) -> std::vector<float>;

/// Replay memory that samples experiences in proportion to their priority,
/// after Schaul et al., "Prioritized Experience Replay" (2015).
///
/// Priorities are `|td_error|^alpha`. An `alpha` of 0 makes every priority 1
/// and therefore sampling uniform, larger values sharpen the bias towards
/// surprising transitions. The bias is corrected by importance-sampling
/// weights whose exponent beta is annealed linearly from `beta_0` at episode
/// 0 to 1 at episode `num_episodes`.
///
/// Slot `i` of the ring buffer and leaf `i` of the sum tree always describe
/// the same experience.
template <concepts::Environment Env>
class PrioritizedReplayMemory {
 public:
  using Experience = Exp<Env>;
  using Batch = rl::Batch<Env>;

  struct Config {
    std::size_t capacity = 65536;
    std::size_t batch_size = 128;
    float alpha = 0.7;
    float beta_0 = 0.5;
    std::size_t num_episodes = 1000;
  };

  struct Sample {
    std::vector<Experience> experiences;
    std::vector<float> weights;
    std::vector<std::size_t> indices;
  };

  struct ZippedSample {
    Batch batch;
    std::vector<float> weights;
    std::vector<std::size_t> indices;
  };

  PrioritizedReplayMemory(Config config, std::mt19937& gen)
      : config_(config),
        gen_(gen),
        data_(config.capacity),
        priorities_(config.capacity),
        beta_(config.beta_0, 1.0f, config.num_episodes) {
    detail::validate_sizes(config.capacity, config.batch_size);
    if (not (config.alpha >= 0.0f)) {
      throw std::invalid_argument("alpha must be non-negative");
    }
  }

  /// Stores `exp` with the highest priority seen so far, so that it is
  /// sampled at least once before its priority is learned.
  auto push(Experience exp) -> void {
    auto slot = data_.push(std::move(exp));
    priorities_.update(slot, std::max(priorities_.max(), kMinPriority));
  }

  /// Draws `batch_size()` experiences with replacement, each in proportion
  /// to its priority. Returns nothing while fewer than `batch_size()`
  /// experiences are stored.
  ///
  /// Keep the returned indices and pass them to `update_priorities` along
  /// with the TD errors computed for the batch.
  auto sample(std::size_t episode) const -> std::optional<Sample> {
    if (config_.batch_size > data_.size()) {
      return std::nullopt;
    }

    auto total = priorities_.sum();
    auto dist = std::uniform_real_distribution<float>(0.0f, total);

    auto result = Sample{};
    result.experiences.reserve(config_.batch_size);
    result.indices.reserve(config_.batch_size);

    auto probs = std::vector<float>();
    probs.reserve(config_.batch_size);

    for (std::size_t i = 0; i < config_.batch_size; i++) {
      auto [slot, _] = priorities_.find(dist(gen_));
      // rounding can descend into a leaf that has never been written
      slot = std::min(slot, data_.size() - 1);

      result.experiences.emplace_back(data_[slot]);
      probs.emplace_back(priorities_[slot] / total);
      result.indices.emplace_back(slot);
    }

    result.weights = importance_weights(probs, data_.size(), beta(episode));

    return result;
  }

  auto sample_zipped(std::size_t episode) const -> std::optional<ZippedSample> {
    auto sampled = sample(episode);
    if (not sampled) {
      return std::nullopt;
    }

    return ZippedSample{
        .batch = Batch::from_range(sampled->experiences, config_.batch_size),
        .weights = std::move(sampled->weights),
        .indices = std::move(sampled->indices),
    };
  }

  /// Sets the priority of each slot in `indices` to `|td_error|^alpha`,
  /// floored at kMinPriority so that every stored experience stays reachable.
  auto update_priorities(std::span<const std::size_t> indices,
                         std::span<const float> td_errors) -> void {
    if (indices.size() != td_errors.size()) {
      throw std::invalid_argument(std::format(
          "got {} indices but {} td errors", indices.size(), td_errors.size()));
    }

    // reject the whole call before touching the tree
    for (auto slot : indices) {
      if (slot >= data_.size()) {
        throw std::out_of_range(std::format(
            "slot {} is not occupied, memory holds {} experiences", slot,
            data_.size()));
      }
    }

    for (std::size_t i = 0; i < indices.size(); i++) {
      auto priority = std::pow(std::abs(td_errors[i]), config_.alpha);
      priorities_.update(indices[i], std::max(priority, kMinPriority));
    }
  }

  auto beta(std::size_t episode) const -> float {
    return beta_.evaluate(static_cast<float>(episode));
  }

  auto alpha() const -> float { return config_.alpha; }
  auto size() const -> std::size_t { return data_.size(); }
  auto capacity() const -> std::size_t { return data_.capacity(); }
  auto batch_size() const -> std::size_t { return config_.batch_size; }

  auto data() const -> const RingBuffer<Experience>& { return data_; }
  auto priorities() const -> const SumTree& { return priorities_; }

 private:
  Config config_;
  std::mt19937& gen_;
  RingBuffer<Experience> data_;
  SumTree priorities_;
  Linear beta_;
};

}  // namespace rl
