#ifndef CALIBRATION_QCONFIG_HPP
#define CALIBRATION_QCONFIG_HPP

#include <functional>
#include <memory>
#include <string>

#include "calibration/observer.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace calibration {

// Pair of observer factories attached to a float module before calibration.
// Each call creates a fresh observer.
struct QConfig {
  std::function<std::unique_ptr<Observer>()> weight;
  std::function<std::unique_ptr<Observer>()> activation;
};

// Weights: symmetric QINT8 min/max. Activations: affine QUINT8 min/max.
QConfig GetDefaultQConfig();

// Builds a QConfig from registered observer names. Unknown names are a
// kConfigError.
tl::expected<QConfig, Error> MakeQConfig(
    const std::string &weight_observer, dty::DataType weight_dtype,
    quantization::QScheme weight_qscheme,
    const std::string &activation_observer, dty::DataType activation_dtype,
    quantization::QScheme activation_qscheme, bool reduce_range = false);

}  // namespace calibration
}  // namespace qconv

#endif  // CALIBRATION_QCONFIG_HPP
