#pragma once

#include <torch/torch.h>

#include <concepts>
#include <span>
#include <vector>

#include "rl/env.hpp"
#include "rl/experience.hpp"

namespace rl {

namespace concepts {

/// Environments whose states and actions can be fed to a network.
template <typename E>
concept TensorEncodable =
    Environment<E> and requires(const typename E::State& state,
                                const typename E::Action& action) {
      { E::encode_state(state) } -> std::same_as<torch::Tensor>;
      { E::encode_action(action) } -> std::same_as<torch::Tensor>;
    };

}  // namespace concepts

struct BatchTensors {
  torch::Tensor states;
  torch::Tensor actions;
  torch::Tensor rewards;
  torch::Tensor non_terminal_mask;
  // only the non-terminal next states, in batch order
  torch::Tensor next_states;
};

/// [B, 1] float tensor of rewards.
auto rewards_tensor(std::span<const float> rewards, torch::Device device)
    -> torch::Tensor;

/// [B, 1] float tensor of importance-sampling weights.
auto weights_tensor(std::span<const float> weights, torch::Device device)
    -> torch::Tensor;

/// [B, 1] bool tensor, true where the transition has a next state.
auto non_terminal_mask(const std::vector<bool>& has_next, torch::Device device)
    -> torch::Tensor;

/// Copies a tensor of TD errors to the host as a flat vector, ready for
/// `PrioritizedReplayMemory::update_priorities`.
auto td_errors_from(const torch::Tensor& td_errors) -> std::vector<float>;

template <concepts::TensorEncodable Env>
auto to_tensors(const Batch<Env>& batch, torch::Device device)
    -> BatchTensors {
  std::vector<torch::Tensor> states;
  std::vector<torch::Tensor> actions;
  std::vector<torch::Tensor> next_states;
  std::vector<bool> has_next;

  states.reserve(batch.size());
  actions.reserve(batch.size());
  next_states.reserve(batch.size());
  has_next.reserve(batch.size());

  for (std::size_t i = 0; i < batch.size(); i++) {
    states.emplace_back(Env::encode_state(batch.states[i]));
    actions.emplace_back(Env::encode_action(batch.actions[i]));

    has_next.push_back(batch.next_states[i].has_value());
    if (batch.next_states[i]) {
      next_states.emplace_back(Env::encode_state(*batch.next_states[i]));
    }
  }

  return {
      .states = torch::stack(states, 0).to(device),
      .actions = torch::stack(actions, 0).to(device),
      .rewards = rewards_tensor(batch.rewards, device),
      .non_terminal_mask = non_terminal_mask(has_next, device),
      .next_states = next_states.empty()
                         ? torch::empty({0}, torch::kFloat32).to(device)
                         : torch::stack(next_states, 0).to(device),
  };
}

}  // namespace rl
