#ifndef CALIBRATION_OBSERVER_HPP
#define CALIBRATION_OBSERVER_HPP

#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace calibration {

// Accumulates statistics over the tensors it sees and turns them into
// quantization parameters for its target dtype.
class Observer {
 public:
  virtual ~Observer() {}

  virtual tl::expected<void, Error> Collect(const Tensor &tensor) = 0;
  virtual tl::expected<quantization::QuantParams, Error> CalculateQParams()
      const = 0;
  virtual dty::DataType dtype() const = 0;
  virtual quantization::QScheme qscheme() const = 0;
};

}  // namespace calibration
}  // namespace qconv

#endif  // CALIBRATION_OBSERVER_HPP
