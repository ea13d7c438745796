#ifndef BACKENDS_CPU_CPU_CONV_BACKEND_HPP
#define BACKENDS_CPU_CPU_CONV_BACKEND_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backends/conv_backend.hpp"
#include "backends/packed_weight.hpp"
#include "enums/error.hpp"
#include "network/descriptor.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace backends {

// Weight stored output-channel major with channels innermost (OHWI), which
// is the order the reference kernel walks it in.
class CpuPackedWeight : public PackedWeight {
 public:
  CpuPackedWeight(Tensor ohwi, std::vector<size_t> oihw_dims,
                  quantization::QuantParams qparams,
                  ConvDescriptor descriptor);

  const std::string &backend_name() const override;
  const Tensor &ohwi() const { return ohwi_; }
  const std::vector<size_t> &oihw_dims() const { return oihw_dims_; }
  const quantization::QuantParams &qparams() const { return qparams_; }
  const ConvDescriptor &descriptor() const { return descriptor_; }
  size_t out_channels() const { return oihw_dims_[0]; }
  size_t in_channels_per_group() const { return oihw_dims_[1]; }
  size_t kernel_height() const { return oihw_dims_[2]; }
  size_t kernel_width() const { return oihw_dims_[3]; }

 private:
  Tensor ohwi_;
  std::vector<size_t> oihw_dims_;
  quantization::QuantParams qparams_;
  ConvDescriptor descriptor_;
};

class CpuConvBackend : public ConvBackend {
 public:
  static std::unique_ptr<ConvBackend> Create();

  const std::string &name() const override;
  tl::expected<std::unique_ptr<PackedWeight>, Error> Pack(
      const quantization::QuantizedTensor &weight,
      const ConvDescriptor &descriptor) const override;
  tl::expected<quantization::QuantizedTensor, Error> Unpack(
      const PackedWeight &packed) const override;
  tl::expected<quantization::QuantizedTensor, Error> Forward(
      const quantization::QuantizedTensor &input, const PackedWeight &packed,
      const std::optional<quantization::QuantizedTensor> &bias,
      const ConvDescriptor &descriptor, double out_scale,
      int64_t out_zero_point) const override;

 private:
  tl::expected<const CpuPackedWeight *, Error> Downcast(
      const PackedWeight &packed) const;
  template <typename IType>
  void OperationForward(const quantization::QuantizedTensor &input,
                        const CpuPackedWeight &weight, const int32_t *bias,
                        const ConvDescriptor &descriptor, double out_scale,
                        int64_t out_zero_point, Tensor &output) const;
};

}  // namespace backends
}  // namespace qconv

#endif  // BACKENDS_CPU_CPU_CONV_BACKEND_HPP
