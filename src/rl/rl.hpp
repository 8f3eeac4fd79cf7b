#pragma once

#include <random>
#include <variant>

#include "rl/env.hpp"
#include "rl/experience.hpp"
#include "rl/memory.hpp"
#include "rl/prioritized_memory.hpp"
#include "rl/ring_buffer.hpp"
#include "rl/schedule.hpp"
#include "rl/sum_tree.hpp"
#include "rl/tensor.hpp"

namespace rl {

/// Replay memory chosen when an agent is configured.
template <concepts::Environment Env>
using AnyMemory =
    std::variant<ReplayMemory<Env>, PrioritizedReplayMemory<Env>>;

template <concepts::Environment Env>
auto push(AnyMemory<Env>& memory, Exp<Env> exp) -> void {
  std::visit([&](auto& m) { m.push(std::move(exp)); }, memory);
}

template <concepts::Environment Env>
auto memory_size(const AnyMemory<Env>& memory) -> std::size_t {
  return std::visit([](const auto& m) { return m.size(); }, memory);
}

}  // namespace rl
