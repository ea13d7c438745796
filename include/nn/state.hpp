#ifndef NN_STATE_HPP
#define NN_STATE_HPP

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "quantization/quantized_tensor.hpp"

namespace qconv {
namespace nn {

// Named, portable module state. An absent bias is stored as monostate so
// that the key is still present.
using StateValue = std::variant<std::monostate, quantization::QuantizedTensor,
                                double, int64_t>;
using StateDict = std::map<std::string, StateValue>;

// Positional state of a quantized convolution. Member order is the
// persisted order and must not change.
struct ConvState {
  int64_t in_channels;
  int64_t out_channels;
  std::array<int64_t, 2> kernel_size;
  std::array<int64_t, 2> stride;
  std::array<int64_t, 2> padding;
  std::array<int64_t, 2> dilation;
  bool transposed;
  std::array<int64_t, 2> output_padding;
  int64_t groups;
  std::string padding_mode;
  quantization::QuantizedTensor weight;
  std::optional<quantization::QuantizedTensor> bias;
  double scale;
  int64_t zero_point;
};

}  // namespace nn
}  // namespace qconv

#endif  // NN_STATE_HPP
