#include "quantization/qparams.hpp"

#define SCOPE QuantParams

#include <cmath>
#include <cstdint>
#include <sstream>
#include <string>
using std::string;
using std::to_string;

#include "datatype.hpp"
#include "enums/error.hpp"
#include "tl/expected.hpp"
using tl::expected;

namespace qconv {
namespace quantization {

expected<QuantParams, Error> SCOPE::Create(double scale, int64_t zero_point,
                                           dty::DataType dtype) {
  if (!std::isfinite(scale) || scale <= 0) {
    std::ostringstream ss;
    ss << "scale=" << scale << " must be a finite positive number";
    return MakeError(ErrorCode::kConfigError, ss.str());
  }
  if (!dty::IsQuantized(dtype)) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "`" + dty::NameOf(dtype) + "` is not a quantized type");
  }

  int64_t qmin, qmax;
  dty::GetDataTypeMinMax(dtype, qmin, qmax);
  if (zero_point < qmin || zero_point > qmax) {
    return MakeError(ErrorCode::kConfigError,
                     "zero_point=" + to_string(zero_point) + " is outside [" +
                         to_string(qmin) + ", " + to_string(qmax) + "] of " +
                         dty::NameOf(dtype));
  }
  return QuantParams(scale, zero_point);
}

string SCOPE::str() const {
  std::ostringstream ss;
  ss << "scale=" << scale_ << ", zero_point=" << zero_point_;
  return ss.str();
}

}  // namespace quantization
}  // namespace qconv
