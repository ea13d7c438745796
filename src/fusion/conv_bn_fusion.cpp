#include "fusion/conv_bn_fusion.hpp"

#include <cmath>
#include <optional>
#include <string>
using std::string;
using std::to_string;
#include <utility>
#include <vector>
using std::vector;

#include "datatype.hpp"
#include "enums/error.hpp"
#include "glog/logging.h"
#include "network/tensor.hpp"
#include "tl/expected.hpp"
using tl::expected;

namespace qconv {
namespace fusion {

namespace {
expected<void, Error> CheckChannelVector(const string &name,
                                         const Tensor &tensor,
                                         size_t channels) {
  if (tensor.dtype() != dty::DataType::FP32) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     name + " must be FP32, got " + dty::NameOf(tensor.dtype()));
  }
  if (tensor.numel() != channels) {
    return MakeError(ErrorCode::kShapeError,
                     name + " has " + to_string(tensor.numel()) +
                         " elements, expected out_channels=" +
                         to_string(channels));
  }
  return {};
}
}  // namespace

expected<FusedWeights, Error> FuseConvBnWeights(
    const Tensor &weight, const std::optional<Tensor> &bias,
    const BatchNormParams &bn) {
  if (weight.dtype() != dty::DataType::FP32) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "weight must be FP32, got " + dty::NameOf(weight.dtype()));
  }
  if (weight.rank() == 0 || weight.numel() == 0) {
    return MakeError(ErrorCode::kShapeError, "weight is empty");
  }
  if (!(bn.eps >= 0)) {
    return MakeError(ErrorCode::kConfigError,
                     "eps=" + to_string(bn.eps) + " must not be negative");
  }

  const size_t channels = weight.dimension().dims(0);
  const size_t filter_size = weight.numel() / channels;

  vector<std::pair<string, const Tensor *>> vectors{
      {"running_mean", &bn.running_mean},
      {"running_var", &bn.running_var},
      {"gamma", &bn.gamma},
      {"beta", &bn.beta}};
  if (bias.has_value()) vectors.emplace_back("bias", &bias.value());
  for (const auto &entry : vectors) {
    auto result = CheckChannelVector(entry.first, *entry.second, channels);
    if (!result) return tl::make_unexpected(result.error());
  }

  FusedWeights fused{Tensor(weight.dimension().dims(), dty::DataType::FP32),
                     Tensor(channels, dty::DataType::FP32)};

  const float *w = weight.data<float>();
  const float *b = bias.has_value() ? bias->data<float>() : nullptr;
  const float *mean = bn.running_mean.data<float>();
  const float *var = bn.running_var.data<float>();
  const float *gamma = bn.gamma.data<float>();
  const float *beta = bn.beta.data<float>();
  float *fused_w = fused.weight.data<float>();
  float *fused_b = fused.bias.data<float>();

  for (size_t c = 0; c < channels; ++c) {
    const double denom = std::sqrt(static_cast<double>(var[c]) + bn.eps);
    if (!(denom > 0)) {
      return MakeError(ErrorCode::kConfigError,
                       "running_var[" + to_string(c) + "] + eps is not positive");
    }
    const double scale = static_cast<double>(gamma[c]) / denom;
    for (size_t k = 0; k < filter_size; ++k) {
      const size_t idx = c * filter_size + k;
      fused_w[idx] = static_cast<float>(static_cast<double>(w[idx]) * scale);
    }
    const double bias_c = b != nullptr ? static_cast<double>(b[c]) : 0.0;
    fused_b[c] = static_cast<float>((bias_c - mean[c]) * scale + beta[c]);
  }

  DLOG(INFO) << "Fused batch normalization into " << channels
             << " output channels";
  return fused;
}

}  // namespace fusion
}  // namespace qconv
