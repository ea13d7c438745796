#include "quantization/quant_math.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "glog/logging.h"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"
using tl::expected;

namespace qconv {
namespace quantization {

namespace {
template <typename RType, typename QType>
void QuantizeBuffer(const RType *src, QType *dst, size_t count, double scale,
                    int64_t zero_point) {
  int64_t qmin, qmax;
  dty::GetDataTypeMinMax(dty::GetDataType<QType>(), qmin, qmax);
#pragma omp parallel for simd schedule(static) default(shared)
  for (size_t i = 0; i < count; ++i) {
    dst[i] = static_cast<QType>(
        QuantizeValue(static_cast<double>(src[i]), scale, zero_point, qmin,
                      qmax));
  }
}

template <typename RType>
bool AllFinite(const Tensor &real) {
  const RType *src = real.data<RType>();
  return std::all_of(src, src + real.numel(),
                     [](RType value) { return std::isfinite(value); });
}

template <typename RType>
void QuantizeTo(const Tensor &real, Tensor &out, double scale,
                int64_t zero_point) {
  const RType *src = real.data<RType>();
  const size_t count = real.numel();
  switch (out.dtype()) {
    case dty::DataType::UINT8:
      QuantizeBuffer(src, out.data<uint8_t>(), count, scale, zero_point);
      break;
    case dty::DataType::INT8:
      QuantizeBuffer(src, out.data<int8_t>(), count, scale, zero_point);
      break;
    case dty::DataType::INT32:
      QuantizeBuffer(src, out.data<int32_t>(), count, scale, zero_point);
      break;
    default:
      LOG(FATAL) << "quantize is not implemented for: "
                 << dty::NameOf(out.dtype());
  }
}

template <typename QType>
void DequantizeBuffer(const QType *src, float *dst, size_t count,
                      double scale, int64_t zero_point) {
#pragma omp parallel for simd schedule(static) default(shared)
  for (size_t i = 0; i < count; ++i) {
    dst[i] = static_cast<float>(
        scale * static_cast<double>(static_cast<int64_t>(src[i]) - zero_point));
  }
}
}  // namespace

int64_t QuantizeValue(double value, double scale, int64_t zero_point,
                      int64_t qmin, int64_t qmax) {
  double q = std::nearbyint(value / scale) + static_cast<double>(zero_point);
  // fmax maps NaN to qmin
  q = std::fmin(std::fmax(q, static_cast<double>(qmin)),
                static_cast<double>(qmax));
  return static_cast<int64_t>(q);
}

expected<QuantParams, Error> ComputeQParams(float min_val, float max_val,
                                            dty::DataType dtype,
                                            QScheme qscheme,
                                            bool reduce_range) {
  if (!dty::IsQuantized(dtype)) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "cannot compute qparams for `" + dty::NameOf(dtype) + "`");
  }
  if (!std::isfinite(min_val) || !std::isfinite(max_val)) {
    std::ostringstream ss;
    ss << "range [" << min_val << ", " << max_val << "] is not finite";
    return MakeError(ErrorCode::kConfigError, ss.str());
  }
  if (!(min_val <= max_val)) {
    std::ostringstream ss;
    ss << "min=" << min_val << " is greater than max=" << max_val;
    return MakeError(ErrorCode::kConfigError, ss.str());
  }

  int64_t qmin, qmax;
  dty::GetDataTypeMinMax(dtype, qmin, qmax, reduce_range);

  // the range always contains zero so that zero padding is exact
  const double min_v = std::min(0.0, static_cast<double>(min_val));
  double max_v = std::max(0.0, static_cast<double>(max_val));

  if (max_v == min_v) {
    return QuantParams::Create(1.0, 0, dtype);
  }

  const double eps = std::numeric_limits<float>::epsilon();
  double scale;
  int64_t zero_point;
  if (qscheme == QScheme::kPerTensorSymmetric) {
    max_v = std::max(-min_v, max_v);
    scale = max_v / (static_cast<double>(qmax - qmin) / 2);
    scale = std::max(scale, eps);
    zero_point = dtype == dty::DataType::UINT8 ? 128 : 0;
  } else {
    scale = (max_v - min_v) / static_cast<double>(qmax - qmin);
    scale = std::max(scale, eps);
    zero_point = qmin - static_cast<int64_t>(std::nearbyint(min_v / scale));
    zero_point = std::max(qmin, zero_point);
    zero_point = std::min(qmax, zero_point);
  }
  VLOG(2) << "qparams for [" << min_val << ", " << max_val << "] "
          << dty::NameOf(dtype) << " " << qscheme << ": scale=" << scale
          << ", zero_point=" << zero_point;
  return QuantParams::Create(scale, zero_point, dtype);
}

expected<QuantizedTensor, Error> Quantize(const Tensor &real, double scale,
                                          int64_t zero_point,
                                          dty::DataType dtype) {
  auto qparams = QuantParams::Create(scale, zero_point, dtype);
  if (!qparams) return tl::make_unexpected(qparams.error());

  bool finite = true;
  if (real.dtype() == dty::DataType::FP32) {
    finite = AllFinite<float>(real);
  } else if (real.dtype() == dty::DataType::FP64) {
    finite = AllFinite<double>(real);
  }
  if (!finite) {
    return MakeError(ErrorCode::kConfigError,
                     "cannot quantize a tensor holding NaN or infinity");
  }

  Tensor out(real.dimension().dims(), dtype);
  switch (real.dtype()) {
    case dty::DataType::FP32:
      QuantizeTo<float>(real, out, scale, zero_point);
      break;
    case dty::DataType::FP64:
      QuantizeTo<double>(real, out, scale, zero_point);
      break;
    default:
      return MakeError(ErrorCode::kUnsupportedDtype,
                       "`" + dty::NameOf(real.dtype()) +
                           "` is not supported for quantization");
  }
  return QuantizedTensor::Create(std::move(out), qparams.value());
}

Tensor Dequantize(const QuantizedTensor &qtensor) {
  Tensor out(qtensor.dimension().dims(), dty::DataType::FP32);
  float *dst = out.data<float>();
  const size_t count = qtensor.numel();
  const double scale = qtensor.scale();
  const int64_t zero_point = qtensor.zero_point();
  switch (qtensor.dtype()) {
    case dty::DataType::UINT8:
      DequantizeBuffer(qtensor.data<uint8_t>(), dst, count, scale, zero_point);
      break;
    case dty::DataType::INT8:
      DequantizeBuffer(qtensor.data<int8_t>(), dst, count, scale, zero_point);
      break;
    case dty::DataType::INT32:
      DequantizeBuffer(qtensor.data<int32_t>(), dst, count, scale, zero_point);
      break;
    default:
      LOG(FATAL) << "dequantize is not implemented for: "
                 << dty::NameOf(qtensor.dtype());
  }
  return out;
}

}  // namespace quantization
}  // namespace qconv
