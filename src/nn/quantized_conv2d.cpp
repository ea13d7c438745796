#include "nn/quantized_conv2d.hpp"

#define SCOPE QuantizedConv2d

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
using std::optional;
using std::string;

#include "backends/conv_backend.hpp"
#include "backends/packed_weight.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "glog/logging.h"
#include "network/conv_config.hpp"
#include "network/descriptor.hpp"
#include "network/dimension.hpp"
#include "network/tensor.hpp"
#include "nn/state.hpp"
#include "quantization/quant_math.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"
using tl::expected;
using tl::make_unexpected;

namespace qconv {
namespace nn {

using quantization::QuantizedTensor;

namespace {
expected<void, Error> CheckWeight(const ConvConfig &config,
                                  const QuantizedTensor &weight) {
  if (weight.dtype() != dty::DataType::INT8) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "weight must be QINT8, got " +
                         string(dty::NameOf(weight.dtype())));
  }
  const Dimension expected_dims(config.WeightDims());
  if (weight.dimension() != expected_dims) {
    return MakeError(ErrorCode::kShapeError,
                     "weight shape " + weight.dimension().str() +
                         " does not match expected " + expected_dims.str());
  }
  return {};
}

expected<void, Error> CheckBias(const ConvConfig &config,
                                const optional<QuantizedTensor> &bias) {
  if (!bias.has_value()) return {};
  if (bias->dtype() != dty::DataType::INT32) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "bias must be QINT32, got " +
                         string(dty::NameOf(bias->dtype())));
  }
  if (bias->zero_point() != 0) {
    return MakeError(ErrorCode::kConfigError,
                     "bias zero_point must be 0, got " +
                         std::to_string(bias->zero_point()));
  }
  const Dimension expected_dims(
      std::vector<size_t>{static_cast<size_t>(config.out_channels())});
  if (bias->dimension() != expected_dims) {
    return MakeError(ErrorCode::kShapeError,
                     "bias shape " + bias->dimension().str() +
                         " does not match expected " + expected_dims.str());
  }
  return {};
}

expected<void, Error> CheckOutputQParams(double scale) {
  if (!std::isfinite(scale) || scale <= 0.0) {
    std::ostringstream ss;
    ss << "output scale must be positive and finite, got " << scale;
    return MakeError(ErrorCode::kConfigError, ss.str());
  }
  return {};
}

template <typename Type>
expected<Type, Error> GetStateValue(const StateDict &state,
                                    const string &key) {
  auto it = state.find(key);
  if (it == state.end()) {
    return MakeError(ErrorCode::kStateError, "missing key in state: " + key);
  }
  const Type *p_value = std::get_if<Type>(&it->second);
  if (p_value == nullptr) {
    return MakeError(ErrorCode::kStateError,
                     "unexpected value kind for state key: " + key);
  }
  return *p_value;
}

string PairStr(int64_t first, int64_t second) {
  std::ostringstream ss;
  ss << "(" << first << ", " << second << ")";
  return ss.str();
}

// Shortest decimal that reads back as `value`, with ".0" on integral values
// so a scale of 1 prints as 1.0.
string ScalarStr(double value) {
  string text;
  for (int precision = 1; precision <= 17; ++precision) {
    std::ostringstream ss;
    ss.precision(precision);
    ss << value;
    text = ss.str();
    if (std::strtod(text.c_str(), nullptr) == value) break;
  }
  if (std::isfinite(value) && text.find_first_of(".e") == string::npos) {
    text += ".0";
  }
  return text;
}

expected<std::shared_ptr<const backends::ConvBackend>, Error> ResolveBackend(
    std::shared_ptr<const backends::ConvBackend> backend) {
  if (backend != nullptr) return backend;
  return backends::CreateConvBackend(backends::ConvBackend::kDefaultBackend);
}
}  // namespace

SCOPE::QuantizedConv2d(ConvConfig config,
                       std::shared_ptr<const backends::ConvBackend> backend,
                       std::unique_ptr<backends::PackedWeight> packed_weight,
                       double weight_scale, optional<QuantizedTensor> bias)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      packed_weight_(std::move(packed_weight)),
      weight_scale_(weight_scale),
      bias_(std::move(bias)),
      scale_(1.0),
      zero_point_(0) {}

expected<QuantizedConv2d, Error> SCOPE::Create(
    const ConvConfig &config,
    std::shared_ptr<const backends::ConvBackend> backend) {
  auto valid = config.CheckValid();
  if (!valid) return make_unexpected(valid.error());

  auto p_backend = ResolveBackend(std::move(backend));
  if (!p_backend) return make_unexpected(p_backend.error());

  auto weight = QuantizedTensor::Zeros(config.WeightDims(),
                                       dty::DataType::INT8, 1.0, 0);
  if (!weight) return make_unexpected(weight.error());

  auto packed = p_backend.value()->Pack(weight.value(), config.descriptor());
  if (!packed) return make_unexpected(packed.error());

  optional<QuantizedTensor> bias;
  if (config.bias()) {
    auto zero_bias = QuantizedTensor::Zeros(
        {static_cast<size_t>(config.out_channels())}, dty::DataType::INT32,
        1.0, 0);
    if (!zero_bias) return make_unexpected(zero_bias.error());
    bias = std::move(zero_bias.value());
  }

  VLOG(1) << "created quantized conv2d with backend "
          << p_backend.value()->name();
  return QuantizedConv2d(config, std::move(p_backend.value()),
                         std::move(packed.value()), 1.0, std::move(bias));
}

expected<QuantizedConv2d, Error> SCOPE::FromState(
    const ConvState &state,
    std::shared_ptr<const backends::ConvBackend> backend) {
  ConvConfig config(state.in_channels, state.out_channels,
                    state.kernel_size[0], state.kernel_size[1]);
  config.groups(state.groups);
  auto module = Create(config, std::move(backend));
  if (!module) return make_unexpected(module.error());

  auto result = module->SetState(state);
  if (!result) return make_unexpected(result.error());
  return module;
}

expected<void, Error> SCOPE::SetWeight(const QuantizedTensor &weight) {
  auto valid = CheckWeight(config_, weight);
  if (!valid) return valid;

  auto packed = backend_->Pack(weight, config_.descriptor());
  if (!packed) return make_unexpected(packed.error());

  packed_weight_ = std::move(packed.value());
  weight_scale_ = weight.scale();
  return {};
}

expected<QuantizedTensor, Error> SCOPE::weight() const {
  return backend_->Unpack(*packed_weight_);
}

expected<void, Error> SCOPE::SetBias(optional<QuantizedTensor> bias) {
  auto valid = CheckBias(config_, bias);
  if (!valid) return valid;
  bias_ = std::move(bias);
  config_.bias(bias_.has_value());
  return {};
}

expected<void, Error> SCOPE::SetOutputQParams(double scale,
                                              int64_t zero_point) {
  auto valid = CheckOutputQParams(scale);
  if (!valid) return valid;
  scale_ = scale;
  zero_point_ = zero_point;
  return {};
}

expected<optional<QuantizedTensor>, Error> SCOPE::EffectiveBias(
    double input_scale) const {
  if (!bias_.has_value()) return optional<QuantizedTensor>();

  // dequantize in double, FP32 cannot hold every QINT32 value
  const size_t count = bias_->numel();
  Tensor real(bias_->dimension().dims(), dty::DataType::FP64);
  const int32_t *src = bias_->data<int32_t>();
  double *dst = real.data<double>();
  for (size_t i = 0; i < count; ++i) {
    dst[i] = bias_->scale() *
             static_cast<double>(static_cast<int64_t>(src[i]) -
                                 bias_->zero_point());
  }

  auto effective = quantization::Quantize(real, weight_scale_ * input_scale, 0,
                                          dty::DataType::INT32);
  if (!effective) return make_unexpected(effective.error());
  return optional<QuantizedTensor>(std::move(effective.value()));
}

expected<QuantizedTensor, Error> SCOPE::Forward(
    const QuantizedTensor &input) const {
  if (input.rank() != 4) {
    return MakeError(ErrorCode::kShapeError,
                     "expected rank 4 (NCHW) input, got rank " +
                         std::to_string(input.rank()) + " " +
                         input.dimension().str());
  }
  if (static_cast<int64_t>(input.dimension().c()) != config_.in_channels()) {
    return MakeError(ErrorCode::kShapeError,
                     "input channels=" +
                         std::to_string(input.dimension().c()) +
                         " do not match in_channels=" +
                         std::to_string(config_.in_channels()));
  }
  if (input.dtype() != dty::DataType::UINT8 &&
      input.dtype() != dty::DataType::INT8) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "input must be QUINT8 or QINT8, got " +
                         string(dty::NameOf(input.dtype())));
  }
  const auto &descriptor = config_.descriptor();
  const int64_t out_h = descriptor.OutputHeight(
      static_cast<int64_t>(input.dimension().h()), config_.kernel_height());
  const int64_t out_w = descriptor.OutputWidth(
      static_cast<int64_t>(input.dimension().w()), config_.kernel_width());
  if (out_h <= 0 || out_w <= 0) {
    return MakeError(ErrorCode::kShapeError,
                     "kernel " +
                         PairStr(config_.kernel_height(),
                                 config_.kernel_width()) +
                         " does not fit into input " +
                         input.dimension().str());
  }

  auto effective_bias = EffectiveBias(input.scale());
  if (!effective_bias) return make_unexpected(effective_bias.error());

  VLOG(2) << "forward " << input.dimension().str() << " -> ["
          << input.dimension().n() << ", " << config_.out_channels() << ", "
          << out_h << ", " << out_w << "]";
  return backend_->Forward(input, *packed_weight_, effective_bias.value(),
                           descriptor, scale_, zero_point_);
}

expected<StateDict, Error> SCOPE::SaveState(const string &prefix) const {
  auto unpacked = weight();
  if (!unpacked) return make_unexpected(unpacked.error());

  StateDict state;
  state[prefix + kWeightKey] = std::move(unpacked.value());
  if (bias_.has_value()) {
    state[prefix + kBiasKey] = bias_.value();
  } else {
    state[prefix + kBiasKey] = std::monostate();
  }
  state[prefix + kScaleKey] = scale_;
  state[prefix + kZeroPointKey] = zero_point_;
  return state;
}

expected<void, Error> SCOPE::LoadState(const StateDict &state,
                                       const string &prefix) {
  auto weight = GetStateValue<QuantizedTensor>(state, prefix + kWeightKey);
  if (!weight) return make_unexpected(weight.error());

  auto bias_it = state.find(prefix + kBiasKey);
  if (bias_it == state.end()) {
    return MakeError(ErrorCode::kStateError,
                     "missing key in state: " + prefix + kBiasKey);
  }
  optional<QuantizedTensor> bias;
  if (const auto *p_bias = std::get_if<QuantizedTensor>(&bias_it->second)) {
    bias = *p_bias;
  } else if (!std::holds_alternative<std::monostate>(bias_it->second)) {
    return MakeError(ErrorCode::kStateError,
                     "unexpected value kind for state key: " + prefix +
                         kBiasKey);
  }

  auto scale = GetStateValue<double>(state, prefix + kScaleKey);
  if (!scale) return make_unexpected(scale.error());
  auto zero_point = GetStateValue<int64_t>(state, prefix + kZeroPointKey);
  if (!zero_point) return make_unexpected(zero_point.error());

  // everything is validated and packed before the first member changes
  auto valid = CheckWeight(config_, weight.value());
  if (!valid) return valid;
  valid = CheckBias(config_, bias);
  if (!valid) return valid;
  valid = CheckOutputQParams(scale.value());
  if (!valid) return valid;
  auto packed = backend_->Pack(weight.value(), config_.descriptor());
  if (!packed) return make_unexpected(packed.error());

  packed_weight_ = std::move(packed.value());
  weight_scale_ = weight->scale();
  bias_ = std::move(bias);
  config_.bias(bias_.has_value());
  scale_ = scale.value();
  zero_point_ = zero_point.value();
  return {};
}

expected<ConvState, Error> SCOPE::GetState() const {
  auto unpacked = weight();
  if (!unpacked) return make_unexpected(unpacked.error());

  const auto &descriptor = config_.descriptor();
  return ConvState{config_.in_channels(),
                   config_.out_channels(),
                   {config_.kernel_height(), config_.kernel_width()},
                   {descriptor.stride_height(), descriptor.stride_width()},
                   {descriptor.padding_height(), descriptor.padding_width()},
                   {descriptor.dilation_height(), descriptor.dilation_width()},
                   false,
                   {0, 0},
                   descriptor.groups(),
                   config_.padding_mode(),
                   std::move(unpacked.value()),
                   bias_,
                   scale_,
                   zero_point_};
}

expected<void, Error> SCOPE::SetState(const ConvState &state) {
  if (state.transposed) {
    return MakeError(ErrorCode::kStateError,
                     "transposed convolution state cannot be loaded");
  }
  if (state.output_padding[0] != 0 || state.output_padding[1] != 0) {
    return MakeError(ErrorCode::kStateError,
                     "output_padding=" +
                         PairStr(state.output_padding[0],
                                 state.output_padding[1]) +
                         " must be (0, 0)");
  }

  ConvConfig config(state.in_channels, state.out_channels,
                    state.kernel_size[0], state.kernel_size[1]);
  config.descriptor(ConvDescriptor(state.stride[0], state.stride[1],
                                   state.padding[0], state.padding[1],
                                   state.dilation[0], state.dilation[1],
                                   state.groups));
  config.padding_mode(state.padding_mode);
  config.bias(state.bias.has_value());
  auto valid = config.CheckValid();
  if (!valid) return valid;
  valid = CheckWeight(config, state.weight);
  if (!valid) return valid;
  valid = CheckBias(config, state.bias);
  if (!valid) return valid;
  valid = CheckOutputQParams(state.scale);
  if (!valid) return valid;

  auto packed = backend_->Pack(state.weight, config.descriptor());
  if (!packed) return make_unexpected(packed.error());

  config_ = std::move(config);
  packed_weight_ = std::move(packed.value());
  weight_scale_ = state.weight.scale();
  bias_ = state.bias;
  scale_ = state.scale;
  zero_point_ = state.zero_point;
  return {};
}

string SCOPE::ExtraRepr() const {
  const auto &descriptor = config_.descriptor();
  std::ostringstream ss;
  ss << config_.in_channels() << ", " << config_.out_channels()
     << ", kernel_size="
     << PairStr(config_.kernel_height(), config_.kernel_width())
     << ", stride="
     << PairStr(descriptor.stride_height(), descriptor.stride_width())
     << ", scale=" << ScalarStr(scale_) << ", zero_point=" << zero_point_;
  if (descriptor.padding_height() != 0 || descriptor.padding_width() != 0) {
    ss << ", padding="
       << PairStr(descriptor.padding_height(), descriptor.padding_width());
  }
  if (descriptor.dilation_height() != 1 || descriptor.dilation_width() != 1) {
    ss << ", dilation="
       << PairStr(descriptor.dilation_height(), descriptor.dilation_width());
  }
  if (descriptor.groups() != 1) {
    ss << ", groups=" << descriptor.groups();
  }
  if (!bias_.has_value()) {
    ss << ", bias=False";
  }
  return ss.str();
}

}  // namespace nn
}  // namespace qconv
