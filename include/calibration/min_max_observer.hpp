#ifndef CALIBRATION_MIN_MAX_OBSERVER_HPP
#define CALIBRATION_MIN_MAX_OBSERVER_HPP

#include <memory>

#include "calibration/observer.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "enums/qscheme.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace calibration {
class MinMaxObserver final : public Observer {
 public:
  MinMaxObserver(dty::DataType dtype, quantization::QScheme qscheme,
                 bool reduce_range = false);
  ~MinMaxObserver() {}
  static std::unique_ptr<Observer> CreateInstance(
      dty::DataType dtype, quantization::QScheme qscheme, bool reduce_range);

  tl::expected<void, Error> Collect(const Tensor &tensor) override;
  tl::expected<quantization::QuantParams, Error> CalculateQParams()
      const override;
  dty::DataType dtype() const override { return dtype_; }
  quantization::QScheme qscheme() const override { return qscheme_; }

  bool HasStatistics() const { return has_statistics_; }
  float min() const { return min_; }
  float max() const { return max_; }

 private:
  dty::DataType dtype_;
  quantization::QScheme qscheme_;
  bool reduce_range_;
  bool has_statistics_;
  float min_;
  float max_;
};
}  // namespace calibration
}  // namespace qconv

#endif  // CALIBRATION_MIN_MAX_OBSERVER_HPP
