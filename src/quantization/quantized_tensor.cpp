#include "quantization/quantized_tensor.hpp"

#define SCOPE QuantizedTensor

#include <cstdint>
#include <vector>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "tl/expected.hpp"
using tl::expected;

namespace qconv {
namespace quantization {

expected<QuantizedTensor, Error> SCOPE::Create(Tensor int_repr,
                                               QuantParams qparams) {
  // revalidate against the storage type, qparams may come from another dtype
  auto checked = QuantParams::Create(qparams.scale(), qparams.zero_point(),
                                     int_repr.dtype());
  if (!checked) return tl::make_unexpected(checked.error());
  return QuantizedTensor(std::move(int_repr), checked.value());
}

expected<QuantizedTensor, Error> SCOPE::Zeros(std::vector<size_t> dims,
                                              dty::DataType dtype,
                                              double scale,
                                              int64_t zero_point) {
  auto qparams = QuantParams::Create(scale, zero_point, dtype);
  if (!qparams) return tl::make_unexpected(qparams.error());
  return QuantizedTensor(Tensor(std::move(dims), dtype), qparams.value());
}

bool SCOPE::operator==(const QuantizedTensor &rhs) const {
  return qparams_ == rhs.qparams_ && int_repr_ == rhs.int_repr_;
}

}  // namespace quantization
}  // namespace qconv
