#ifndef QUANTIZATION_QPARAMS_HPP
#define QUANTIZATION_QPARAMS_HPP

#include <cstdint>
#include <string>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace quantization {

// Affine map between integer storage and real values:
//   real_value = scale * (quantized_value - zero_point)
class QuantParams {
 public:
  // scale must be finite and positive, zero_point inside the range of dtype.
  static tl::expected<QuantParams, Error> Create(double scale,
                                                 int64_t zero_point,
                                                 dty::DataType dtype);

  double scale() const { return scale_; }
  int64_t zero_point() const { return zero_point_; }

  std::string str() const;

  bool operator==(const QuantParams &rhs) const {
    return scale_ == rhs.scale_ && zero_point_ == rhs.zero_point_;
  }
  bool operator!=(const QuantParams &rhs) const { return !(*this == rhs); }

 private:
  QuantParams(double scale, int64_t zero_point)
      : scale_(scale), zero_point_(zero_point) {}

  double scale_;
  int64_t zero_point_;
};

}  // namespace quantization
}  // namespace qconv

#endif  // QUANTIZATION_QPARAMS_HPP
