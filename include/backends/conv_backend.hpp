#ifndef BACKENDS_CONV_BACKEND_HPP
#define BACKENDS_CONV_BACKEND_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "backends/packed_weight.hpp"
#include "enums/error.hpp"
#include "network/descriptor.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace backends {

class ConvBackend {
 public:
  static constexpr const char *const kDefaultBackend = "cpu";

  virtual ~ConvBackend() {}

  virtual const std::string &name() const = 0;

  // Rearranges an OIHW QINT8 weight into the backend layout with the
  // structural parameters baked in. Unpack(Pack(w)) == w, bit for bit.
  virtual tl::expected<std::unique_ptr<PackedWeight>, Error> Pack(
      const quantization::QuantizedTensor &weight,
      const ConvDescriptor &descriptor) const = 0;

  virtual tl::expected<quantization::QuantizedTensor, Error> Unpack(
      const PackedWeight &packed) const = 0;

  // NCHW quantized convolution. `bias`, when present, is QINT32 with scale
  // input.scale * weight.scale and zero point 0. The result is quantized to
  // (out_scale, out_zero_point) in the input's dtype.
  virtual tl::expected<quantization::QuantizedTensor, Error> Forward(
      const quantization::QuantizedTensor &input, const PackedWeight &packed,
      const std::optional<quantization::QuantizedTensor> &bias,
      const ConvDescriptor &descriptor, double out_scale,
      int64_t out_zero_point) const = 0;
};

// Looks the backend up in the registry; an unknown name is kBackendError.
tl::expected<std::shared_ptr<const ConvBackend>, Error> CreateConvBackend(
    const std::string &name);

}  // namespace backends
}  // namespace qconv

#endif  // BACKENDS_CONV_BACKEND_HPP
