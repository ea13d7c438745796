#ifndef CONVERSION_FROM_FLOAT_HPP
#define CONVERSION_FROM_FLOAT_HPP

#include <memory>
#include <string>

#include "backends/conv_backend.hpp"
#include "conversion/float_conv2d.hpp"
#include "enums/error.hpp"
#include "nn/quantized_conv2d.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace conversion {

struct ConversionOptions {
  // Module type accepted on the post-training path. kConvReLU2d is always
  // accepted there as well.
  FloatModuleType float_module_type = FloatModuleType::kConv2d;
  std::string backend = backends::ConvBackend::kDefaultBackend;
};

// Bias is stored at activation_scale / kBiasScaleDivisor, about 24 bits of
// precision relative to the accumulator.
constexpr double kBiasScaleDivisor = 65536.0;

// Converts a calibrated float convolution into a quantized one. Errors:
//   kTypeMismatch     module type does not fit the calibration source, or
//                     the weight does not fit the config
//   kConfigError      calibration attachments missing or empty
//   kUnsupportedDtype weight observer is not QINT8
tl::expected<nn::QuantizedConv2d, Error> FromFloat(
    FloatConv2d module, const ConversionOptions &options = ConversionOptions());

}  // namespace conversion
}  // namespace qconv

#endif  // CONVERSION_FROM_FLOAT_HPP
