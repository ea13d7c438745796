#ifndef NN_QUANTIZED_CONV2D_HPP
#define NN_QUANTIZED_CONV2D_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "backends/conv_backend.hpp"
#include "backends/packed_weight.hpp"
#include "enums/error.hpp"
#include "network/conv_config.hpp"
#include "nn/state.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace nn {

// Quantized 2-D convolution. The weight lives only in packed form; every
// portable view of it goes through the backend's Unpack.
//
// Forward is const and may run concurrently. SetWeight, SetBias,
// SetOutputQParams, LoadState and SetState must not overlap with Forward.
class QuantizedConv2d {
 public:
  static constexpr const char *const kWeightKey = "weight";
  static constexpr const char *const kBiasKey = "bias";
  static constexpr const char *const kScaleKey = "scale";
  static constexpr const char *const kZeroPointKey = "zero_point";

  // Validates `config` before anything is allocated. The module starts with
  // a zero QINT8 weight at (1.0, 0), a zero QINT32 bias when config.bias()
  // and output qparams (1.0, 0). A null backend selects the default one.
  static tl::expected<QuantizedConv2d, Error> Create(
      const ConvConfig &config,
      std::shared_ptr<const backends::ConvBackend> backend = nullptr);
  static tl::expected<QuantizedConv2d, Error> FromState(
      const ConvState &state,
      std::shared_ptr<const backends::ConvBackend> backend = nullptr);

  QuantizedConv2d(const QuantizedConv2d &) = delete;
  QuantizedConv2d &operator=(const QuantizedConv2d &) = delete;
  QuantizedConv2d(QuantizedConv2d &&) = default;
  QuantizedConv2d &operator=(QuantizedConv2d &&) = default;
  ~QuantizedConv2d() = default;

  const ConvConfig &config() const { return config_; }
  const backends::ConvBackend &backend() const { return *backend_; }

  // Repacks the weight. On failure the module is left untouched.
  tl::expected<void, Error> SetWeight(
      const quantization::QuantizedTensor &weight);
  tl::expected<quantization::QuantizedTensor, Error> weight() const;
  double weight_scale() const { return weight_scale_; }

  const std::optional<quantization::QuantizedTensor> &bias() const {
    return bias_;
  }
  tl::expected<void, Error> SetBias(
      std::optional<quantization::QuantizedTensor> bias);

  double scale() const { return scale_; }
  int64_t zero_point() const { return zero_point_; }
  tl::expected<void, Error> SetOutputQParams(double scale,
                                             int64_t zero_point);

  // Stored bias requantized to weight_scale * input_scale, the scale the
  // accumulator runs at for this input.
  tl::expected<std::optional<quantization::QuantizedTensor>, Error>
  EffectiveBias(double input_scale) const;

  tl::expected<quantization::QuantizedTensor, Error> Forward(
      const quantization::QuantizedTensor &input) const;

  tl::expected<StateDict, Error> SaveState(
      const std::string &prefix = "") const;
  tl::expected<void, Error> LoadState(const StateDict &state,
                                      const std::string &prefix = "");

  tl::expected<ConvState, Error> GetState() const;
  tl::expected<void, Error> SetState(const ConvState &state);

  std::string ExtraRepr() const;

 private:
  QuantizedConv2d(ConvConfig config,
                  std::shared_ptr<const backends::ConvBackend> backend,
                  std::unique_ptr<backends::PackedWeight> packed_weight,
                  double weight_scale,
                  std::optional<quantization::QuantizedTensor> bias);

  ConvConfig config_;
  std::shared_ptr<const backends::ConvBackend> backend_;
  std::unique_ptr<backends::PackedWeight> packed_weight_;
  double weight_scale_;
  std::optional<quantization::QuantizedTensor> bias_;
  double scale_;
  int64_t zero_point_;
};

}  // namespace nn
}  // namespace qconv

#endif  // NN_QUANTIZED_CONV2D_HPP
