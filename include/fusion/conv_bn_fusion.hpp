#ifndef FUSION_CONV_BN_FUSION_HPP
#define FUSION_CONV_BN_FUSION_HPP

#include <optional>

#include "enums/error.hpp"
#include "network/tensor.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace fusion {

// Inference-time state of a batch normalization that follows a convolution.
// All tensors are FP32 with one element per output channel.
struct BatchNormParams {
  Tensor running_mean;
  Tensor running_var;
  Tensor gamma;
  Tensor beta;
  double eps;
};

struct FusedWeights {
  Tensor weight;
  Tensor bias;
};

// Folds the normalization into the convolution. For each output channel c:
//   s = gamma[c] / sqrt(running_var[c] + eps)
//   weight'[c] = weight[c] * s
//   bias'[c] = (bias[c] - running_mean[c]) * s + beta[c]
// A missing bias counts as zeros. Must run on real values, before any
// quantization.
tl::expected<FusedWeights, Error> FuseConvBnWeights(
    const Tensor &weight, const std::optional<Tensor> &bias,
    const BatchNormParams &bn);

}  // namespace fusion
}  // namespace qconv

#endif  // FUSION_CONV_BN_FUSION_HPP
