#include "calibration/qconfig.hpp"

#include <memory>
#include <string>
using std::string;

#include "calibration/min_max_observer.hpp"
#include "calibration/observer.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "factory.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace calibration {

QConfig GetDefaultQConfig() {
  QConfig qconfig;
  qconfig.weight = []() -> std::unique_ptr<Observer> {
    return std::make_unique<MinMaxObserver>(
        dty::DataType::INT8, quantization::QScheme::kPerTensorSymmetric);
  };
  qconfig.activation = []() -> std::unique_ptr<Observer> {
    return std::make_unique<MinMaxObserver>(
        dty::DataType::UINT8, quantization::QScheme::kPerTensorAffine);
  };
  return qconfig;
}

tl::expected<QConfig, Error> MakeQConfig(
    const string &weight_observer, dty::DataType weight_dtype,
    quantization::QScheme weight_qscheme, const string &activation_observer,
    dty::DataType activation_dtype, quantization::QScheme activation_qscheme,
    bool reduce_range) {
  const auto &observers = ObserverFactory<Observer>::GetFactoryMap();
  for (const auto &name : {weight_observer, activation_observer}) {
    if (observers.find(name) == observers.end()) {
      return MakeError(ErrorCode::kConfigError,
                       "observer `" + name + "` is not registered");
    }
  }

  QConfig qconfig;
  qconfig.weight = [=]() {
    return ObserverFactory<Observer>::CreateInstance(
        weight_observer, weight_dtype, weight_qscheme);
  };
  qconfig.activation = [=]() {
    return ObserverFactory<Observer>::CreateInstance(
        activation_observer, activation_dtype, activation_qscheme,
        reduce_range);
  };
  return qconfig;
}

}  // namespace calibration
}  // namespace qconv
