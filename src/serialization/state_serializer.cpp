#include "serialization/state_serializer.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <iterator>
using std::fstream;
using std::ios;

#include <optional>
#include <string>
using std::string;
using std::to_string;

#include <vector>
using std::vector;

#include "datatype.hpp"
#include "enums/error.hpp"
#include "glog/logging.h"
#include "network/dimension.hpp"
#include "network/tensor.hpp"
#include "nn/state.hpp"
#include "qconv_state.pb.h"
#include "quantization/qparams.hpp"
#include "quantization/quantized_tensor.hpp"
#include "tl/expected.hpp"
using tl::expected;
using tl::make_unexpected;

using qconv::proto::ConvStateProto;
using qconv::proto::QuantizedDataType;
using qconv::proto::QuantizedTensorProto;

namespace qconv {
namespace serialization {

using quantization::QuantizedTensor;
using quantization::QuantParams;

namespace {
template <typename Type>
void CopyValuesTo(const QuantizedTensor &tensor, QuantizedTensorProto &msg) {
  const Type *data = tensor.data<Type>();
  auto *values = msg.mutable_values();
  values->Reserve(static_cast<int>(tensor.numel()));
  for (size_t i = 0; i < tensor.numel(); ++i) {
    values->Add(static_cast<int32_t>(data[i]));
  }
}

template <typename Type>
void CopyValuesFrom(const QuantizedTensorProto &msg, Tensor &tensor) {
  Type *data = tensor.data<Type>();
  for (int i = 0; i < msg.values_size(); ++i) {
    data[i] = static_cast<Type>(msg.values(i));
  }
}

expected<void, Error> ToProto(const QuantizedTensor &tensor,
                              QuantizedTensorProto &msg) {
  for (size_t dim : tensor.dimension().dims()) msg.add_dims(dim);
  msg.set_scale(tensor.scale());
  msg.set_zero_point(tensor.zero_point());

  switch (tensor.dtype()) {
    case dty::DataType::UINT8:
      msg.set_dtype(proto::QUINT8);
      CopyValuesTo<uint8_t>(tensor, msg);
      break;
    case dty::DataType::INT8:
      msg.set_dtype(proto::QINT8);
      CopyValuesTo<int8_t>(tensor, msg);
      break;
    case dty::DataType::INT32:
      msg.set_dtype(proto::QINT32);
      CopyValuesTo<int32_t>(tensor, msg);
      break;
    default:
      return MakeError(ErrorCode::kUnsupportedDtype,
                       "cannot serialize tensor of dtype " +
                           string(dty::NameOf(tensor.dtype())));
  }
  return {};
}

expected<QuantizedTensor, Error> FromProto(const QuantizedTensorProto &msg,
                                           const string &field) {
  dty::DataType dtype;
  switch (msg.dtype()) {
    case proto::QUINT8:
      dtype = dty::DataType::UINT8;
      break;
    case proto::QINT8:
      dtype = dty::DataType::INT8;
      break;
    case proto::QINT32:
      dtype = dty::DataType::INT32;
      break;
    default:
      return MakeError(ErrorCode::kStateError,
                       field + " has no valid dtype: " +
                           to_string(static_cast<int>(msg.dtype())));
  }

  vector<size_t> dims(msg.dims().begin(), msg.dims().end());
  size_t numel = 0;
  if (!CheckedElementCount(dims, dty::SizeOf(dtype), numel) ||
      numel != static_cast<size_t>(msg.values_size())) {
    return MakeError(ErrorCode::kStateError,
                     field + " holds " + to_string(msg.values_size()) +
                         " values for shape " + Dimension(dims).str());
  }
  int64_t qmin, qmax;
  dty::GetDataTypeMinMax(dtype, qmin, qmax);
  for (int32_t value : msg.values()) {
    if (value < qmin || value > qmax) {
      return MakeError(ErrorCode::kStateError,
                       field + " value " + to_string(value) +
                           " is out of range for " + dty::NameOf(dtype));
    }
  }
  Tensor tensor(dims, dtype);
  if (dtype == dty::DataType::UINT8) {
    CopyValuesFrom<uint8_t>(msg, tensor);
  } else if (dtype == dty::DataType::INT8) {
    CopyValuesFrom<int8_t>(msg, tensor);
  } else {
    CopyValuesFrom<int32_t>(msg, tensor);
  }

  auto qparams = QuantParams::Create(msg.scale(), msg.zero_point(), dtype);
  if (!qparams) {
    return MakeError(ErrorCode::kStateError,
                     field + " has invalid qparams: " +
                         qparams.error().message);
  }
  return QuantizedTensor::Create(std::move(tensor), qparams.value());
}

template <typename Repeated>
expected<std::array<int64_t, 2>, Error> ToPair(const Repeated &values,
                                               const string &field) {
  if (values.size() != 2) {
    return MakeError(ErrorCode::kStateError,
                     field + " must hold 2 values, got " +
                         to_string(values.size()));
  }
  return std::array<int64_t, 2>{values.Get(0), values.Get(1)};
}

void SetPair(const std::array<int64_t, 2> &pair,
             google::protobuf::RepeatedField<int64_t> *values) {
  values->Add(pair[0]);
  values->Add(pair[1]);
}
}  // namespace

expected<string, Error> SerializeState(const nn::ConvState &state) {
  ConvStateProto msg;
  msg.set_in_channels(state.in_channels);
  msg.set_out_channels(state.out_channels);
  SetPair(state.kernel_size, msg.mutable_kernel_size());
  SetPair(state.stride, msg.mutable_stride());
  SetPair(state.padding, msg.mutable_padding());
  SetPair(state.dilation, msg.mutable_dilation());
  msg.set_transposed(state.transposed);
  SetPair(state.output_padding, msg.mutable_output_padding());
  msg.set_groups(state.groups);
  msg.set_padding_mode(state.padding_mode);

  auto result = ToProto(state.weight, *msg.mutable_weight());
  if (!result) return make_unexpected(result.error());
  if (state.bias.has_value()) {
    result = ToProto(state.bias.value(), *msg.mutable_bias());
    if (!result) return make_unexpected(result.error());
  }
  msg.set_scale(state.scale);
  msg.set_zero_point(state.zero_point);

  string bytes;
  if (!msg.SerializeToString(&bytes)) {
    return MakeError(ErrorCode::kStateError, "Failed to serialize state");
  }
  return bytes;
}

expected<nn::ConvState, Error> ParseState(const string &bytes) {
  ConvStateProto msg;
  if (!msg.ParseFromString(bytes)) {
    return MakeError(ErrorCode::kStateError,
                     "Failed to parse state: not a valid ConvStateProto");
  }

  if (!msg.has_weight()) {
    return MakeError(ErrorCode::kStateError, "state has no weight");
  }
  if (!msg.has_scale()) {
    return MakeError(ErrorCode::kStateError, "state has no scale");
  }
  if (!msg.has_zero_point()) {
    return MakeError(ErrorCode::kStateError, "state has no zero_point");
  }

  auto kernel_size = ToPair(msg.kernel_size(), "kernel_size");
  if (!kernel_size) return make_unexpected(kernel_size.error());
  auto stride = ToPair(msg.stride(), "stride");
  if (!stride) return make_unexpected(stride.error());
  auto padding = ToPair(msg.padding(), "padding");
  if (!padding) return make_unexpected(padding.error());
  auto dilation = ToPair(msg.dilation(), "dilation");
  if (!dilation) return make_unexpected(dilation.error());
  auto output_padding = ToPair(msg.output_padding(), "output_padding");
  if (!output_padding) return make_unexpected(output_padding.error());

  auto weight = FromProto(msg.weight(), "weight");
  if (!weight) return make_unexpected(weight.error());
  std::optional<QuantizedTensor> bias;
  if (msg.has_bias()) {
    auto parsed = FromProto(msg.bias(), "bias");
    if (!parsed) return make_unexpected(parsed.error());
    bias = std::move(parsed.value());
  }

  return nn::ConvState{msg.in_channels(),
                       msg.out_channels(),
                       kernel_size.value(),
                       stride.value(),
                       padding.value(),
                       dilation.value(),
                       msg.transposed(),
                       output_padding.value(),
                       msg.groups(),
                       msg.padding_mode(),
                       std::move(weight.value()),
                       std::move(bias),
                       msg.scale(),
                       msg.zero_point()};
}

expected<void, Error> WriteStateFile(const nn::ConvState &state,
                                     const string &path) {
  auto bytes = SerializeState(state);
  if (!bytes) return make_unexpected(bytes.error());

  fstream fs(path.c_str(), ios::out | ios::binary | ios::trunc);
  if (!fs) {
    return MakeError(ErrorCode::kFileWriteError,
                     "Failed to open file: `" + path + "`");
  }
  fs.write(bytes->data(), static_cast<std::streamsize>(bytes->size()));
  if (!fs) {
    return MakeError(ErrorCode::kFileWriteError,
                     "Failed to write state: `" + path + "`");
  }
  LOG(INFO) << "Wrote state to " << path;
  return {};
}

expected<nn::ConvState, Error> ReadStateFile(const string &path) {
  fstream fs(path.c_str(), ios::in | ios::binary);
  if (!fs) {
    return MakeError(ErrorCode::kFileReadError,
                     "Failed to open file: `" + path + "`");
  }
  const string bytes((std::istreambuf_iterator<char>(fs)),
                     std::istreambuf_iterator<char>());
  if (fs.bad()) {
    return MakeError(ErrorCode::kFileReadError,
                     "Failed to read state: `" + path + "`");
  }
  return ParseState(bytes);
}

}  // namespace serialization
}  // namespace qconv
