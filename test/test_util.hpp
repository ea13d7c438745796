#ifndef TEST_TEST_UTIL_HPP
#define TEST_TEST_UTIL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "datatype.hpp"
#include "network/descriptor.hpp"
#include "network/tensor.hpp"
#include "quantization/quantized_tensor.hpp"

namespace qconv {
namespace test {

// FP32 tensor holding `values` in row-major order.
Tensor MakeTensor(std::vector<size_t> dims, const std::vector<float> &values);

// FP32 tensor of the given shape filled with the same value.
Tensor MakeFilled(std::vector<size_t> dims, float value);

// Quantized tensor whose integer representation is `values`. Aborts the
// calling test on invalid qparams.
quantization::QuantizedTensor MakeQuantized(std::vector<size_t> dims,
                                            dty::DataType dtype,
                                            const std::vector<int64_t> &values,
                                            double scale, int64_t zero_point);

// Deterministic integers in [lo, hi], stable across platforms.
std::vector<int64_t> PseudoRandomInts(size_t count, int64_t lo, int64_t hi,
                                      uint32_t seed);
std::vector<float> PseudoRandomFloats(size_t count, float lo, float hi,
                                      uint32_t seed);

std::vector<int64_t> IntValues(const quantization::QuantizedTensor &tensor);
std::vector<float> FloatValues(const Tensor &tensor);

// Direct-loop quantized convolution used to check the packed kernel.
std::vector<int64_t> ReferenceConv(
    const quantization::QuantizedTensor &input,
    const quantization::QuantizedTensor &weight,
    const std::optional<quantization::QuantizedTensor> &bias,
    const ConvDescriptor &descriptor, double out_scale,
    int64_t out_zero_point);

// Unique path under the system temp directory for the running test.
std::string TempFilePath(const std::string &suffix);

}  // namespace test
}  // namespace qconv

#endif  // TEST_TEST_UTIL_HPP
