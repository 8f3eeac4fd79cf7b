#include "rl/tensor.hpp"

#include <torch/torch.h>

#include <cstdint>

namespace rl {

auto rewards_tensor(std::span<const float> rewards, torch::Device device)
    -> torch::Tensor {
  auto values = std::vector<float>(rewards.begin(), rewards.end());
  return torch::tensor(values, torch::kFloat32).unsqueeze(1).to(device);
}

auto weights_tensor(std::span<const float> weights, torch::Device device)
    -> torch::Tensor {
  return rewards_tensor(weights, device);
}

auto non_terminal_mask(const std::vector<bool>& has_next, torch::Device device)
    -> torch::Tensor {
  auto values = std::vector<uint8_t>(has_next.begin(), has_next.end());
  return torch::tensor(values, torch::kUInt8)
      .to(torch::kBool)
      .unsqueeze(1)
      .to(device);
}

auto td_errors_from(const torch::Tensor& td_errors) -> std::vector<float> {
  auto flat = td_errors.detach().to(torch::kCPU, torch::kFloat32).contiguous()
                  .view({-1});
  return std::vector<float>(flat.data_ptr<float>(),
                            flat.data_ptr<float>() + flat.numel());
}

}  // namespace rl
