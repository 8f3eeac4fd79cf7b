#include <torch/torch.h>

#include <charconv>
#include <indicators/progress_bar.hpp>
#include <iostream>
#include <numeric>
#include <optional>
#include <print>
#include <random>
#include <span>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include "rl/rl.hpp"

namespace opt = indicators::option;

namespace {

/// Five-state random walk. Leaving on the right pays 1, on the left 0.
class RandomWalk {
 public:
  using State = int;
  using Action = int;

  static constexpr auto NumStates = 5;

  explicit RandomWalk(std::mt19937& gen) : gen_(gen) {}

  auto reset() -> State {
    state_ = NumStates / 2;
    return state_;
  }

  auto step(const Action& action) -> std::pair<std::optional<State>, float> {
    state_ += action == 0 ? -1 : 1;
    if (state_ < 0) {
      return {std::nullopt, 0.0f};
    }
    if (state_ >= NumStates) {
      return {std::nullopt, 1.0f};
    }
    return {state_, 0.0f};
  }

  auto random_action() -> Action {
    return std::uniform_int_distribution<Action>(0, 1)(gen_);
  }

  static auto encode_state(const State& state) -> torch::Tensor {
    return torch::tensor(static_cast<int64_t>(state), torch::kInt64);
  }

  static auto encode_action(const Action& action) -> torch::Tensor {
    return torch::tensor(static_cast<int64_t>(action), torch::kInt64);
  }

 private:
  std::mt19937& gen_;
  State state_ = NumStates / 2;
};

static_assert(rl::concepts::TensorEncodable<RandomWalk>);

struct Config {
  int32_t num_episodes = 2000;
  std::size_t capacity = 1024;
  std::size_t batch_size = 32;
  bool prioritized = false;
  float gamma = 1.0;
  float learning_rate = 0.05;
};

/// One TD(0) step on the value table. Returns the TD errors of the batch.
auto learn(torch::Tensor& values, const rl::Batch<RandomWalk>& batch,
           std::span<const float> weights, const Config& config)
    -> torch::Tensor {
  auto tensors = rl::to_tensors<RandomWalk>(batch, torch::kCPU);
  auto mask = tensors.non_terminal_mask.squeeze(1);

  auto next_values = torch::zeros({static_cast<int64_t>(batch.size())});
  if (tensors.next_states.numel() > 0) {
    next_values.index_put_({mask}, values.index({tensors.next_states}));
  }

  auto targets = tensors.rewards.squeeze(1) + config.gamma * next_values;
  auto td_errors = targets - values.index({tensors.states});

  auto step = config.learning_rate * td_errors;
  if (not weights.empty()) {
    step *= rl::weights_tensor(weights, torch::kCPU).squeeze(1);
  }
  values.index_add_(0, tensors.states, step);

  return td_errors;
}

/// Parses a strictly positive integer, rejecting signs and trailing text.
template <typename T>
auto parse_positive(std::string_view arg) -> std::optional<T> {
  auto value = T{};
  auto [end, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
  if (ec != std::errc{} or end != arg.data() + arg.size() or value <= 0) {
    return std::nullopt;
  }
  return value;
}

constexpr auto Usage =
    "usage: replay_demo [episodes] [capacity] [batch_size] [--prioritized]";

}  // namespace

auto main(int argc, char** argv) -> int {
  auto config = Config{};

  if (argc > 5) {
    std::println(std::cerr, "{}", Usage);
    return -1;
  }
  if (argc > 1) {
    auto episodes = parse_positive<int32_t>(argv[1]);
    if (not episodes) {
      std::println(std::cerr, "episodes must be a positive integer, got '{}'\n{}",
                   argv[1], Usage);
      return -1;
    }
    config.num_episodes = *episodes;
  }
  if (argc > 2) {
    auto capacity = parse_positive<std::size_t>(argv[2]);
    if (not capacity) {
      std::println(std::cerr, "capacity must be a positive integer, got '{}'\n{}",
                   argv[2], Usage);
      return -1;
    }
    config.capacity = *capacity;
  }
  if (argc > 3) {
    auto batch_size = parse_positive<std::size_t>(argv[3]);
    if (not batch_size or *batch_size > config.capacity) {
      std::println(std::cerr,
                   "batch_size must be a positive integer no larger than the "
                   "capacity {}, got '{}'\n{}",
                   config.capacity, argv[3], Usage);
      return -1;
    }
    config.batch_size = *batch_size;
  }
  if (argc > 4) {
    if (std::string_view(argv[4]) != "--prioritized") {
      std::println(std::cerr, "unknown option '{}'\n{}", argv[4], Usage);
      return -1;
    }
    config.prioritized = true;
  }

  auto gen = std::mt19937{std::random_device{}()};
  auto env = RandomWalk{gen};

  auto memory =
      config.prioritized
          ? rl::AnyMemory<RandomWalk>{rl::PrioritizedReplayMemory<RandomWalk>{
                {
                    .capacity = config.capacity,
                    .batch_size = config.batch_size,
                    .num_episodes = static_cast<std::size_t>(config.num_episodes),
                },
                gen}}
          : rl::AnyMemory<RandomWalk>{rl::ReplayMemory<RandomWalk>{
                {.capacity = config.capacity, .batch_size = config.batch_size},
                gen}};

  auto values = torch::full({RandomWalk::NumStates}, 0.5f);

  auto bar = indicators::ProgressBar{
      opt::BarWidth{50},
      opt::ForegroundColor{indicators::Color::white},
      opt::ShowElapsedTime{true},
      opt::ShowRemainingTime{true},
      opt::ShowPercentage{true},
      opt::MaxProgress{config.num_episodes},
      opt::PrefixText{config.prioritized ? "Prioritized Replay " : "Uniform Replay "},
      opt::FontStyles{
          std::vector<indicators::FontStyle>{indicators::FontStyle::bold}}};

  auto last_weights = std::vector<float>();

  for (auto episode = 0; episode < config.num_episodes; episode++) {
    auto state = env.reset();

    while (true) {
      auto action = env.random_action();
      auto [next_state, reward] = env.step(action);

      rl::push(memory, {state, action, next_state, reward});

      if (auto* uniform = std::get_if<rl::ReplayMemory<RandomWalk>>(&memory)) {
        if (auto batch = uniform->sample_zipped()) {
          learn(values, *batch, {}, config);
        }
      } else {
        auto& prioritized = std::get<rl::PrioritizedReplayMemory<RandomWalk>>(memory);
        if (auto sample = prioritized.sample_zipped(episode)) {
          auto td_errors = learn(values, sample->batch, sample->weights, config);
          prioritized.update_priorities(sample->indices,
                                        rl::td_errors_from(td_errors));
          last_weights = std::move(sample->weights);
        }
      }

      if (not next_state) {
        break;
      }
      state = *next_state;
    }

    bar.tick();
  }

  bar.mark_as_completed();

  std::println("Memory holds {} experiences", rl::memory_size(memory));

  auto estimates = std::vector<float>(values.data_ptr<float>(),
                                      values.data_ptr<float>() + values.numel());
  for (auto i = 0; i < RandomWalk::NumStates; i++) {
    std::println("V({}) = {:.3f} (true {:.3f})", i, estimates[i],
                 static_cast<float>(i + 1) / (RandomWalk::NumStates + 1));
  }

  if (auto* prioritized =
          std::get_if<rl::PrioritizedReplayMemory<RandomWalk>>(&memory)) {
    auto mean_weight =
        last_weights.empty()
            ? 0.0f
            : std::accumulate(last_weights.begin(), last_weights.end(), 0.0f) /
                  static_cast<float>(last_weights.size());
    std::println("Total priority {:.5f}, max priority {:.5f}, mean IS weight {:.3f}",
                 prioritized->priorities().sum(),
                 prioritized->priorities().max(), mean_weight);
  }

  return 0;
}
