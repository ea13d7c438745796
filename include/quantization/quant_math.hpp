#ifndef QUANTIZATION_QUANT_MATH_HPP
#define QUANTIZATION_QUANT_MATH_HPP

#include <cstdint>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace quantization {

// Derives scale/zero_point so that [min_val, max_val] (widened to contain 0)
// is representable in dtype. Symmetric schemes give zero_point 0 for signed
// types and 128 for QUINT8.
tl::expected<QuantParams, Error> ComputeQParams(float min_val, float max_val,
                                                dty::DataType dtype,
                                                QScheme qscheme,
                                                bool reduce_range = false);

// clamp(nearbyint(x / scale) + zero_point) elementwise. `real` must be FP32
// or FP64, `dtype` one of the quantized types.
tl::expected<QuantizedTensor, Error> Quantize(const Tensor &real, double scale,
                                              int64_t zero_point,
                                              dty::DataType dtype);

// scale * (q - zero_point) as FP32.
Tensor Dequantize(const QuantizedTensor &qtensor);

// Rounds half to even, then saturates into [qmin, qmax].
int64_t QuantizeValue(double value, double scale, int64_t zero_point,
                      int64_t qmin, int64_t qmax);

}  // namespace quantization
}  // namespace qconv

#endif  // QUANTIZATION_QUANT_MATH_HPP
