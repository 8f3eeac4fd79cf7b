#pragma once

#include <concepts>
#include <optional>
#include <utility>

namespace rl {

namespace concepts {

/// States and actions are copied into sampled batches, so they should be
/// small value types.
template <typename T>
concept ExperienceValue = std::copyable<T>;

template <typename E>
concept Environment =
    ExperienceValue<typename E::State> and
    ExperienceValue<typename E::Action> and
    requires(E env, const typename E::Action& action) {
      { env.reset() } -> std::same_as<typename E::State>;

      {
        env.step(action)
      } -> std::same_as<std::pair<std::optional<typename E::State>, float>>;
    };

}  // namespace concepts

}  // namespace rl
