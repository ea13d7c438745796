#ifndef QUANTIZATION_QUANTIZED_TENSOR_HPP
#define QUANTIZATION_QUANTIZED_TENSOR_HPP

#include <cstdint>
#include <vector>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "network/dimension.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace quantization {

// Integer tensor together with the affine parameters that map it to reals.
// There are no mutating accessors: once produced it never changes.
class QuantizedTensor {
 public:
  static tl::expected<QuantizedTensor, Error> Create(Tensor int_repr,
                                                     QuantParams qparams);

  // Zero-filled tensor, used as a placeholder before real values are set.
  static tl::expected<QuantizedTensor, Error> Zeros(std::vector<size_t> dims,
                                                    dty::DataType dtype,
                                                    double scale,
                                                    int64_t zero_point);

  const Tensor &int_repr() const { return int_repr_; }
  const QuantParams &qparams() const { return qparams_; }
  double scale() const { return qparams_.scale(); }
  int64_t zero_point() const { return qparams_.zero_point(); }
  dty::DataType dtype() const { return int_repr_.dtype(); }
  const Dimension &dimension() const { return int_repr_.dimension(); }
  size_t rank() const { return int_repr_.rank(); }
  size_t numel() const { return int_repr_.numel(); }

  template <typename Type>
  const Type *data() const {
    return int_repr_.data<Type>();
  }

  // Values, dims, dtype and qparams all bit-exact.
  bool operator==(const QuantizedTensor &rhs) const;
  bool operator!=(const QuantizedTensor &rhs) const { return !(*this == rhs); }

 private:
  QuantizedTensor(Tensor int_repr, QuantParams qparams)
      : int_repr_(std::move(int_repr)), qparams_(qparams) {}

  Tensor int_repr_;
  QuantParams qparams_;
};

}  // namespace quantization
}  // namespace qconv

#endif  // QUANTIZATION_QUANTIZED_TENSOR_HPP
