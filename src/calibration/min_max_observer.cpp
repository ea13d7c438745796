#include "calibration/min_max_observer.hpp"

#define BASE Observer
#define NAME min_max
#define CLASS MinMaxObserver
#define SCOPE CLASS
#define STR(x) #x
#define GET_STR(x) STR(x)

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "factory.hpp"
#include "glog/logging.h"
#include "network/tensor.hpp"
#include "quantization/quant_math.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace calibration {
static bool kRegistered = ObserverFactory<BASE>::RegisterCreateFunction(
    GET_STR(NAME), CLASS::CreateInstance);

std::unique_ptr<BASE> SCOPE::CreateInstance(dty::DataType dtype,
                                            quantization::QScheme qscheme,
                                            bool reduce_range) {
  return std::make_unique<CLASS>(dtype, qscheme, reduce_range);
}

SCOPE::MinMaxObserver(dty::DataType dtype, quantization::QScheme qscheme,
                      bool reduce_range)
    : dtype_(dtype),
      qscheme_(qscheme),
      reduce_range_(reduce_range),
      has_statistics_(false),
      min_(std::numeric_limits<float>::max()),
      max_(std::numeric_limits<float>::lowest()) {}

tl::expected<void, Error> SCOPE::Collect(const Tensor &tensor) {
  auto dtype = tensor.dtype();
  auto size = tensor.numel();
  if (size == 0) {
    LOG(WARNING) << "empty tensor ignored by observer";
    return {};
  }

  auto is_finite = [](auto value) { return std::isfinite(value); };
  bool finite = false;
  float min, max;

  switch (dtype) {
    case dty::DataType::FP32: {
      const float *data = tensor.data<float>();
      finite = std::all_of(data, data + size, is_finite);
      min = *std::min_element(data, data + size);
      max = *std::max_element(data, data + size);
      break;
    }
    case dty::DataType::FP64: {
      const double *data = tensor.data<double>();
      finite = std::all_of(data, data + size, is_finite);
      min = static_cast<float>(*std::min_element(data, data + size));
      max = static_cast<float>(*std::max_element(data, data + size));
      break;
    }
    default: {
      return MakeError(
          ErrorCode::kUnsupportedDtype,
          "`" + dty::NameOf(dtype) + "` is not supported for calibration");
    }
  }

  // also catches doubles beyond the float range
  if (!finite || !std::isfinite(min) || !std::isfinite(max)) {
    return MakeError(ErrorCode::kConfigError,
                     "observer cannot collect NaN or infinite values");
  }

  min_ = std::min(min, min_);
  max_ = std::max(max, max_);
  has_statistics_ = true;

  return {};
}

tl::expected<quantization::QuantParams, Error> SCOPE::CalculateQParams()
    const {
  if (!has_statistics_) {
    return MakeError(ErrorCode::kConfigError,
                     "observer has not collected any statistics");
  }
  return quantization::ComputeQParams(min_, max_, dtype_, qscheme_,
                                      reduce_range_);
}
}  // namespace calibration
}  // namespace qconv
