#ifndef CONVERSION_FLOAT_CONV2D_HPP
#define CONVERSION_FLOAT_CONV2D_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <variant>

#include "calibration/observer.hpp"
#include "calibration/qconfig.hpp"
#include "fusion/conv_bn_fusion.hpp"
#include "network/conv_config.hpp"
#include "network/tensor.hpp"

namespace qconv {
namespace conversion {

enum class FloatModuleType {
  kConv2d = 0,   // plain float convolution
  kConvReLU2d,   // convolution followed by a ReLU, calibrated after the ReLU
  kQatConv2d,    // convolution trained with fake quantization
  kQatConvBn2d,  // fake-quantized convolution with an unfused batch norm
};

const char *NameOf(FloatModuleType type);
std::ostream &operator<<(std::ostream &out, FloatModuleType type);

// Post-training calibration: the weight observer is created from `qconfig`
// and run over the weight during conversion; `activation_observer` has
// already seen the calibration data.
struct PostTrainingSource {
  std::shared_ptr<const calibration::QConfig> qconfig;
  std::shared_ptr<calibration::Observer> activation_observer;
};

// Quantization-aware training: both observers were trained alongside the
// weights. `fused_norm` carries the batch norm of a kQatConvBn2d module.
struct QatSource {
  std::shared_ptr<calibration::Observer> weight_fake_quant;
  std::shared_ptr<calibration::Observer> activation_observer;
  std::optional<fusion::BatchNormParams> fused_norm;
};

using CalibrationSource =
    std::variant<std::monostate, PostTrainingSource, QatSource>;

// A calibrated float convolution ready for conversion. `weight` is FP32
// OIHW, `bias` FP32 with one value per output channel.
struct FloatConv2d {
  FloatModuleType type;
  ConvConfig config;
  Tensor weight;
  std::optional<Tensor> bias;
  CalibrationSource calibration;
};

}  // namespace conversion
}  // namespace qconv

#endif  // CONVERSION_FLOAT_CONV2D_HPP
