#include "conversion/from_float.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
using std::optional;
using std::string;

#include "backends/conv_backend.hpp"
#include "calibration/observer.hpp"
#include "conversion/float_conv2d.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "fusion/conv_bn_fusion.hpp"
#include "glog/logging.h"
#include "network/dimension.hpp"
#include "network/tensor.hpp"
#include "nn/quantized_conv2d.hpp"
#include "quantization/quant_math.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"
using tl::expected;
using tl::make_unexpected;

namespace qconv {
namespace conversion {

const char *NameOf(FloatModuleType type) {
  switch (type) {
    case FloatModuleType::kConv2d:
      return "Conv2d";
    case FloatModuleType::kConvReLU2d:
      return "ConvReLU2d";
    case FloatModuleType::kQatConv2d:
      return "QatConv2d";
    case FloatModuleType::kQatConvBn2d:
      return "QatConvBn2d";
  }
  LOG(FATAL) << "unknown float module type: "
             << static_cast<int>(type);
  return "";
}

std::ostream &operator<<(std::ostream &out, FloatModuleType type) {
  return out << NameOf(type);
}

namespace {
struct Observers {
  std::shared_ptr<calibration::Observer> weight;
  std::shared_ptr<calibration::Observer> activation;
};

expected<void, Error> CheckFloatTensors(const FloatConv2d &module) {
  auto valid = module.config.CheckValid();
  if (!valid) return valid;

  if (module.weight.dtype() != dty::DataType::FP32) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "float weight must be FP32, got " +
                         string(dty::NameOf(module.weight.dtype())));
  }
  const Dimension weight_dims(module.config.WeightDims());
  if (module.weight.dimension() != weight_dims) {
    return MakeError(ErrorCode::kTypeMismatch,
                     "float weight shape " + module.weight.dimension().str() +
                         " does not fit config, expected " +
                         weight_dims.str());
  }
  if (module.bias.has_value()) {
    if (module.bias->dtype() != dty::DataType::FP32) {
      return MakeError(ErrorCode::kUnsupportedDtype,
                       "float bias must be FP32, got " +
                           string(dty::NameOf(module.bias->dtype())));
    }
    const Dimension bias_dims(std::vector<size_t>{
        static_cast<size_t>(module.config.out_channels())});
    if (module.bias->dimension() != bias_dims) {
      return MakeError(ErrorCode::kTypeMismatch,
                       "float bias shape " + module.bias->dimension().str() +
                           " does not fit config, expected " +
                           bias_dims.str());
    }
  }
  return {};
}

// Fake-quantized modules bring trained observers; a batch norm still
// attached is folded into the weights first.
expected<Observers, Error> ResolveQat(FloatConv2d &module,
                                      const QatSource &source) {
  if (module.type != FloatModuleType::kQatConv2d &&
      module.type != FloatModuleType::kQatConvBn2d) {
    return MakeError(ErrorCode::kTypeMismatch,
                     string("fake quantization attached to a ") +
                         NameOf(module.type) + " module");
  }
  const bool has_norm = source.fused_norm.has_value();
  if (has_norm != (module.type == FloatModuleType::kQatConvBn2d)) {
    return MakeError(ErrorCode::kTypeMismatch,
                     string(NameOf(module.type)) +
                         (has_norm ? " must not carry" : " must carry") +
                         " batch norm parameters");
  }
  if (source.weight_fake_quant == nullptr) {
    return MakeError(ErrorCode::kConfigError,
                     "QAT module has no weight fake quantizer");
  }
  if (source.activation_observer == nullptr) {
    return MakeError(ErrorCode::kConfigError,
                     "QAT module must have an activation observer attached");
  }

  if (has_norm) {
    auto fused = fusion::FuseConvBnWeights(module.weight, module.bias,
                                           source.fused_norm.value());
    if (!fused) return make_unexpected(fused.error());
    module.weight = std::move(fused->weight);
    module.bias = std::move(fused->bias);
    module.config.bias(true);
    LOG(INFO) << "Folded batch norm into convolution weights";
  }
  return Observers{source.weight_fake_quant, source.activation_observer};
}

expected<Observers, Error> ResolvePostTraining(
    const FloatConv2d &module, const PostTrainingSource &source,
    const ConversionOptions &options) {
  if (module.type != options.float_module_type &&
      module.type != FloatModuleType::kConvReLU2d) {
    return MakeError(ErrorCode::kTypeMismatch,
                     string("post-training conversion expects ") +
                         NameOf(options.float_module_type) + ", got " +
                         NameOf(module.type));
  }
  if (source.qconfig == nullptr || !source.qconfig->weight) {
    return MakeError(ErrorCode::kConfigError,
                     "float module must have a qconfig defined");
  }
  if (source.activation_observer == nullptr) {
    return MakeError(ErrorCode::kConfigError,
                     "float module must have an activation observer attached");
  }

  std::shared_ptr<calibration::Observer> weight_observer =
      source.qconfig->weight();
  if (weight_observer == nullptr) {
    return MakeError(ErrorCode::kConfigError,
                     "qconfig did not create a weight observer");
  }
  auto collected = weight_observer->Collect(module.weight);
  if (!collected) return make_unexpected(collected.error());

  return Observers{weight_observer, source.activation_observer};
}
}  // namespace

expected<nn::QuantizedConv2d, Error> FromFloat(
    FloatConv2d module, const ConversionOptions &options) {
  LOG(INFO) << "Started conversion of " << NameOf(module.type);

  if (std::holds_alternative<std::monostate>(module.calibration)) {
    return MakeError(ErrorCode::kConfigError,
                     string(NameOf(module.type)) +
                         " has no calibration attached");
  }
  auto valid = CheckFloatTensors(module);
  if (!valid) return make_unexpected(valid.error());

  expected<Observers, Error> observers =
      std::holds_alternative<QatSource>(module.calibration)
          ? ResolveQat(module, std::get<QatSource>(module.calibration))
          : ResolvePostTraining(
                module, std::get<PostTrainingSource>(module.calibration),
                options);
  if (!observers) return make_unexpected(observers.error());

  auto act_qparams = observers->activation->CalculateQParams();
  if (!act_qparams) return make_unexpected(act_qparams.error());

  if (observers->weight->dtype() != dty::DataType::INT8) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "weight observer must have a dtype of QINT8, got " +
                         string(dty::NameOf(observers->weight->dtype())));
  }
  if (observers->weight->qscheme() !=
      quantization::QScheme::kPerTensorSymmetric) {
    std::ostringstream ss;
    ss << "weight observer must be per_tensor_symmetric, got "
       << observers->weight->qscheme();
    return MakeError(ErrorCode::kConfigError, ss.str());
  }
  auto wt_qparams = observers->weight->CalculateQParams();
  if (!wt_qparams) return make_unexpected(wt_qparams.error());
  if (wt_qparams->zero_point() != 0) {
    return MakeError(ErrorCode::kConfigError,
                     "weight zero_point must be 0, got " +
                         std::to_string(wt_qparams->zero_point()));
  }

  const double bias_scale = act_qparams->scale() / kBiasScaleDivisor;

  auto qweight = quantization::Quantize(module.weight, wt_qparams->scale(), 0,
                                        dty::DataType::INT8);
  if (!qweight) return make_unexpected(qweight.error());

  auto backend = backends::CreateConvBackend(options.backend);
  if (!backend) return make_unexpected(backend.error());

  module.config.bias(module.bias.has_value());
  auto qconv = nn::QuantizedConv2d::Create(module.config, backend.value());
  if (!qconv) return make_unexpected(qconv.error());

  auto result = qconv->SetWeight(qweight.value());
  if (!result) return make_unexpected(result.error());

  optional<quantization::QuantizedTensor> qbias;
  if (module.bias.has_value()) {
    auto quantized = quantization::Quantize(module.bias.value(), bias_scale, 0,
                                            dty::DataType::INT32);
    if (!quantized) return make_unexpected(quantized.error());
    qbias = std::move(quantized.value());
  }
  result = qconv->SetBias(std::move(qbias));
  if (!result) return make_unexpected(result.error());

  result = qconv->SetOutputQParams(act_qparams->scale(),
                                   act_qparams->zero_point());
  if (!result) return make_unexpected(result.error());

  LOG(INFO) << "Finished conversion: " << qconv->ExtraRepr();
  return qconv;
}

}  // namespace conversion
}  // namespace qconv
