#include "backends/cpu/cpu_conv_backend.hpp"

#define BASE ConvBackend
#define NAME cpu
#define CLASS CpuConvBackend
#define SCOPE CLASS
#define STR(x) #x
#define GET_STR(x) STR(x)

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cpu/common/im2col.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "factory.hpp"
#include "glog/logging.h"
#include "network/descriptor.hpp"
#include "network/dimension.hpp"
#include "network/tensor.hpp"
#include "quantization/qparams.hpp"
#include "quantization/quant_math.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"
using tl::expected;
using tl::make_unexpected;

namespace qconv {
namespace backends {

using quantization::QuantizedTensor;
using quantization::QuantParams;

static bool kRegistered =
    Factory<BASE>::RegisterCreateFunction(GET_STR(NAME), CLASS::Create);

static const std::string kCpuBackendName = GET_STR(NAME);

CpuPackedWeight::CpuPackedWeight(Tensor ohwi, std::vector<size_t> oihw_dims,
                                 QuantParams qparams, ConvDescriptor descriptor)
    : ohwi_(std::move(ohwi)),
      oihw_dims_(std::move(oihw_dims)),
      qparams_(qparams),
      descriptor_(descriptor) {}

const std::string &CpuPackedWeight::backend_name() const {
  return kCpuBackendName;
}

std::unique_ptr<BASE> SCOPE::Create() { return std::make_unique<CLASS>(); }

const std::string &SCOPE::name() const { return kCpuBackendName; }

expected<std::unique_ptr<PackedWeight>, Error> SCOPE::Pack(
    const QuantizedTensor &weight, const ConvDescriptor &descriptor) const {
  if (weight.dtype() != dty::DataType::INT8) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "packed weight must be QINT8, got " +
                         std::string(dty::NameOf(weight.dtype())));
  }
  if (weight.rank() != 4) {
    return MakeError(ErrorCode::kShapeError,
                     "packed weight must be rank 4 (OIHW), got " +
                         weight.dimension().str());
  }

  const auto &dims = weight.dimension().dims();
  const size_t oc = dims[0];
  const size_t ic = dims[1];
  const size_t kh = dims[2];
  const size_t kw = dims[3];

  Tensor ohwi({oc, kh, kw, ic}, dty::DataType::INT8);
  const int8_t *src = weight.data<int8_t>();
  int8_t *dst = ohwi.data<int8_t>();

#pragma omp parallel for schedule(static) default(shared) collapse(2)
  for (size_t o = 0; o < oc; ++o) {
    for (size_t i = 0; i < ic; ++i) {
      for (size_t y = 0; y < kh; ++y) {
        for (size_t x = 0; x < kw; ++x) {
          dst[((o * kh + y) * kw + x) * ic + i] =
              src[((o * ic + i) * kh + y) * kw + x];
        }
      }
    }
  }

  DLOG(INFO) << "packed weight " << weight.dimension().str() << " with "
             << descriptor.str();
  return std::make_unique<CpuPackedWeight>(std::move(ohwi), dims,
                                           weight.qparams(), descriptor);
}

expected<const CpuPackedWeight *, Error> SCOPE::Downcast(
    const PackedWeight &packed) const {
  const auto *p_packed = dynamic_cast<const CpuPackedWeight *>(&packed);
  if (p_packed == nullptr) {
    return MakeError(ErrorCode::kBackendError,
                     "packed weight was produced by backend " +
                         packed.backend_name() + ", not " + name());
  }
  return p_packed;
}

expected<QuantizedTensor, Error> SCOPE::Unpack(
    const PackedWeight &packed) const {
  auto p_packed = Downcast(packed);
  if (!p_packed) return make_unexpected(p_packed.error());
  const CpuPackedWeight &weight = *p_packed.value();

  const size_t oc = weight.out_channels();
  const size_t ic = weight.in_channels_per_group();
  const size_t kh = weight.kernel_height();
  const size_t kw = weight.kernel_width();

  Tensor oihw(weight.oihw_dims(), dty::DataType::INT8);
  const int8_t *src = weight.ohwi().data<int8_t>();
  int8_t *dst = oihw.data<int8_t>();

#pragma omp parallel for schedule(static) default(shared) collapse(2)
  for (size_t o = 0; o < oc; ++o) {
    for (size_t y = 0; y < kh; ++y) {
      for (size_t x = 0; x < kw; ++x) {
        for (size_t i = 0; i < ic; ++i) {
          dst[((o * ic + i) * kh + y) * kw + x] =
              src[((o * kh + y) * kw + x) * ic + i];
        }
      }
    }
  }

  return QuantizedTensor::Create(std::move(oihw), weight.qparams());
}

expected<QuantizedTensor, Error> SCOPE::Forward(
    const QuantizedTensor &input, const PackedWeight &packed,
    const std::optional<QuantizedTensor> &bias,
    const ConvDescriptor &descriptor, double out_scale,
    int64_t out_zero_point) const {
  auto p_packed = Downcast(packed);
  if (!p_packed) return make_unexpected(p_packed.error());
  const CpuPackedWeight &weight = *p_packed.value();

  if (weight.descriptor() != descriptor) {
    return MakeError(ErrorCode::kConfigError,
                     "weight was packed with " + weight.descriptor().str() +
                         " but forward requested " + descriptor.str());
  }
  if (input.rank() != 4) {
    return MakeError(ErrorCode::kShapeError,
                     "input must be rank 4 (NCHW), got " +
                         input.dimension().str());
  }
  const size_t groups = static_cast<size_t>(descriptor.groups());
  if (input.dimension().c() != weight.in_channels_per_group() * groups) {
    return MakeError(ErrorCode::kShapeError,
                     "input channels of " + input.dimension().str() +
                         " do not match weight");
  }
  const dty::DataType itype = input.dtype();
  if (itype != dty::DataType::UINT8 && itype != dty::DataType::INT8) {
    return MakeError(ErrorCode::kUnsupportedDtype,
                     "input must be QUINT8 or QINT8, got " +
                         std::string(dty::NameOf(itype)));
  }

  const int32_t *bias_data = nullptr;
  if (bias.has_value()) {
    if (bias->dtype() != dty::DataType::INT32 ||
        bias->numel() != weight.out_channels()) {
      return MakeError(ErrorCode::kShapeError,
                       "bias must be QINT32 with one value per output "
                       "channel, got " +
                           bias->dimension().str());
    }
    bias_data = bias->data<int32_t>();
  }

  const int64_t oh =
      descriptor.OutputHeight(static_cast<int64_t>(input.dimension().h()),
                              static_cast<int64_t>(weight.kernel_height()));
  const int64_t ow =
      descriptor.OutputWidth(static_cast<int64_t>(input.dimension().w()),
                             static_cast<int64_t>(weight.kernel_width()));
  if (oh <= 0 || ow <= 0) {
    return MakeError(ErrorCode::kShapeError,
                     "kernel does not fit into input " +
                         input.dimension().str());
  }

  auto out_qparams = QuantParams::Create(out_scale, out_zero_point, itype);
  if (!out_qparams) return make_unexpected(out_qparams.error());

  const std::vector<size_t> output_dims{input.dimension().n(),
                                        weight.out_channels(),
                                        static_cast<size_t>(oh),
                                        static_cast<size_t>(ow)};
  const std::vector<size_t> workspace_dims{
      weight.in_channels_per_group(), weight.kernel_height(),
      weight.kernel_width(), static_cast<size_t>(oh), static_cast<size_t>(ow)};
  size_t count = 0;
  if (!CheckedElementCount(output_dims, dty::SizeOf(itype), count) ||
      !CheckedElementCount(workspace_dims, dty::SizeOf(itype), count)) {
    return MakeError(ErrorCode::kShapeError,
                     "output of shape " + Dimension(output_dims).str() +
                         " is too large");
  }

  Tensor output(output_dims, itype);

  if (itype == dty::DataType::UINT8) {
    OperationForward<uint8_t>(input, weight, bias_data, descriptor, out_scale,
                              out_zero_point, output);
  } else {
    OperationForward<int8_t>(input, weight, bias_data, descriptor, out_scale,
                             out_zero_point, output);
  }

  return QuantizedTensor::Create(std::move(output), out_qparams.value());
}

template <typename IType>
void SCOPE::OperationForward(const QuantizedTensor &input,
                             const CpuPackedWeight &weight,
                             const int32_t *bias,
                             const ConvDescriptor &descriptor,
                             double out_scale, int64_t out_zero_point,
                             Tensor &output) const {
  const size_t groups = static_cast<size_t>(descriptor.groups());
  const size_t in_c = input.dimension().c();
  const size_t in_h = input.dimension().h();
  const size_t in_w = input.dimension().w();
  const size_t cpg = weight.in_channels_per_group();
  const size_t kh = weight.kernel_height();
  const size_t kw = weight.kernel_width();
  const size_t m = weight.out_channels() / groups;
  const size_t spatial_size = output.h() * output.w();
  const size_t filter_size = cpg * kh * kw;

  const int64_t x_zp = input.zero_point();
  const int64_t w_zp = weight.qparams().zero_point();
  const double acc_scale = input.scale() * weight.qparams().scale();

  int64_t qmin, qmax;
  dty::GetDataTypeMinMax(output.dtype(), qmin, qmax);

  Tensor workspace(filter_size * spatial_size, input.dtype());
  IType *col = workspace.data<IType>();
  const IType *input_data = input.data<IType>();
  const int8_t *filter_data = weight.ohwi().data<int8_t>();
  IType *output_data = output.data<IType>();

  for (size_t i = 0; i < input.dimension().n(); ++i) {
    for (size_t g = 0; g < groups; ++g) {
      const IType *im = input_data + (i * in_c + g * cpg) * in_h * in_w;
      cpu::im2col_cpu<IType>(
          im, static_cast<int>(cpg), static_cast<int>(in_h),
          static_cast<int>(in_w), static_cast<int>(kh), static_cast<int>(kw),
          static_cast<int>(descriptor.padding_height()),
          static_cast<int>(descriptor.padding_width()),
          static_cast<int>(descriptor.stride_height()),
          static_cast<int>(descriptor.stride_width()),
          static_cast<int>(descriptor.dilation_height()),
          static_cast<int>(descriptor.dilation_width()),
          static_cast<IType>(x_zp), col);

#pragma omp parallel for schedule(static) default(shared)
      for (size_t oc = g * m; oc < (g + 1) * m; ++oc) {
        const int8_t *filter = filter_data + oc * filter_size;
        IType *out = output_data + (i * output.c() + oc) * spatial_size;
        for (size_t s = 0; s < spatial_size; ++s) {
          int64_t acc = bias == nullptr ? 0 : bias[oc];
          // column rows are ordered (c, y, x), the packed filter (y, x, c)
          for (size_t c = 0; c < cpg; ++c) {
            for (size_t y = 0; y < kh; ++y) {
              for (size_t x = 0; x < kw; ++x) {
                const int64_t xv =
                    static_cast<int64_t>(
                        col[((c * kh + y) * kw + x) * spatial_size + s]) -
                    x_zp;
                const int64_t wv =
                    static_cast<int64_t>(filter[(y * kw + x) * cpg + c]) -
                    w_zp;
                acc += xv * wv;
              }
            }
          }
          out[s] = static_cast<IType>(quantization::QuantizeValue(
              static_cast<double>(acc) * acc_scale, out_scale, out_zero_point,
              qmin, qmax));
        }
      }
    }
  }
}

}  // namespace backends
}  // namespace qconv
