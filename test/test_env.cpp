#include <gtest/gtest.h>

#include <optional>
#include <random>
#include <utility>

#include "rl/memory.hpp"
#include "rl/prioritized_memory.hpp"

using namespace rl;

namespace {

/// Coin flips with no tensor encoding, usable by the memories alone.
struct CoinEnv {
  using State = bool;
  using Action = int;

  auto reset() -> State { return false; }

  auto step(const Action& action) -> std::pair<std::optional<State>, float> {
    if (action < 0) {
      return {std::nullopt, 0.0f};
    }
    return {action % 2 == 1, 1.0f};
  }
};

struct NoReset {
  using State = int;
  using Action = int;

  auto step(const Action&) -> std::pair<std::optional<State>, float> {
    return {std::nullopt, 0.0f};
  }
};

}  // namespace

static_assert(concepts::Environment<CoinEnv>);
static_assert(not concepts::Environment<NoReset>);

TEST(Environment, MemoriesNeedNoTensorEncoding) {
  auto gen = std::mt19937{0};
  auto uniform = ReplayMemory<CoinEnv>{{.capacity = 4, .batch_size = 2}, gen};
  auto prioritized =
      PrioritizedReplayMemory<CoinEnv>{{.capacity = 4, .batch_size = 2}, gen};

  auto env = CoinEnv{};
  auto state = env.reset();
  for (auto action : {1, 2, -1}) {
    auto [next_state, reward] = env.step(action);
    uniform.push({state, action, next_state, reward});
    prioritized.push({state, action, next_state, reward});
    if (next_state) {
      state = *next_state;
    }
  }

  auto batch = uniform.sample_zipped();
  ASSERT_TRUE(batch.has_value());
  EXPECT_EQ(batch->size(), 2);

  auto sample = prioritized.sample_zipped(0);
  ASSERT_TRUE(sample.has_value());
  EXPECT_EQ(sample->batch.size(), 2);
  EXPECT_TRUE(prioritized.data()[2].is_terminal());
}
