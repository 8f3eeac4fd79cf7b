#pragma once

#include <functional>
#include <optional>
#include <ranges>
#include <vector>

#include "rl/env.hpp"

namespace rl {

/// One transition. A missing `next_state` marks a terminal transition.
template <concepts::ExperienceValue State, concepts::ExperienceValue Action>
struct Experience {
  State state;
  Action action;
  std::optional<State> next_state;
  float reward = 0.0f;

  constexpr auto is_terminal() const -> bool {
    return not next_state.has_value();
  }
};

namespace detail {

template <typename T>
constexpr auto deref(const T& value) -> const T& {
  return value;
}

template <typename T>
constexpr auto deref(const T* value) -> const T& {
  return *value;
}

template <typename T>
constexpr auto deref(std::reference_wrapper<T> value) -> const T& {
  return value.get();
}

}  // namespace detail

/// Column-wise form of a batch of experiences. Element `i` of every vector
/// describes the same transition.
template <concepts::ExperienceValue State, concepts::ExperienceValue Action>
struct ExpBatch {
  std::vector<State> states;
  std::vector<Action> actions;
  std::vector<std::optional<State>> next_states;
  std::vector<float> rewards;

  constexpr auto size() const -> std::size_t { return states.size(); }

  /// Transposes `experiences` in iteration order. Accepts experiences,
  /// pointers to experiences, or reference wrappers.
  template <std::ranges::input_range R>
  static auto from_range(R&& experiences, std::size_t batch_size)
      -> ExpBatch {
    auto batch = ExpBatch{};
    batch.states.reserve(batch_size);
    batch.actions.reserve(batch_size);
    batch.next_states.reserve(batch_size);
    batch.rewards.reserve(batch_size);

    for (auto&& item : experiences) {
      const Experience<State, Action>& exp = detail::deref(item);
      batch.states.emplace_back(exp.state);
      batch.actions.emplace_back(exp.action);
      batch.next_states.emplace_back(exp.next_state);
      batch.rewards.emplace_back(exp.reward);
    }

    return batch;
  }
};

template <concepts::Environment Env>
using Exp = Experience<typename Env::State, typename Env::Action>;

template <concepts::Environment Env>
using Batch = ExpBatch<typename Env::State, typename Env::Action>;

}  // namespace rl
