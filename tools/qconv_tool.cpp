#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>
using std::cerr;
using std::cout;
using std::string;

#include "argparse.hpp"
#include "glog/logging.h"
#include "tl/expected.hpp"
using tl::expected;
using tl::make_unexpected;

#include "arguments.hpp"
#include "backends/conv_backend.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "network/tensor.hpp"
#include "nn/quantized_conv2d.hpp"
#include "quantization/qparams.hpp"
#include "quantization/quantized_tensor.hpp"
#include "serialization/state_serializer.hpp"
#include "utility.hpp"

using qconv::Arguments;
using qconv::Error;
using qconv::ErrorCode;

expected<void, Error> ParseArguments(int, char **, Arguments &);
expected<void, Error> Run(const Arguments &);

int main(int argc, char **argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_colorlogtostderr = true;
  FLAGS_logtostderr = true;

  Arguments args;

  auto result = ParseArguments(argc, argv, args);
  if (!result) {
    LOG(ERROR) << "Argument parsing failed";
    cerr << "Usage: qconv_tool --help" << '\n';
    return 1;
  }

  result = Run(args);
  if (!result) {
    LOG(ERROR) << "qconv_tool failed: " << result.error();
    return 1;
  }

  return 0;
}

expected<void, Error> ParseArguments(int argc, char **argv, Arguments &args) {
  argparse::ArgumentParser program("qconv_tool", "1.0.0");

  // required
  program.add_argument("--state-path", "-s")
      .required()
      .help("set persisted quantized conv2d state path");

  // optional
  program.add_argument("--backend", "-b")
      .default_value(string("cpu"))
      .help("set compute backend (cpu)");
  program.add_argument("--dump-path", "-o")
      .help("re-serialize the loaded module to this path");

  // forward
  program.add_argument("--run")
      .default_value(false)
      .implicit_value(true)
      .help("run forward on a deterministic ramp input");
  program.add_argument("--input-shape")
      .help("set input shape as N,C,H,W");
  program.add_argument("--input-dtype")
      .default_value(string("quint8"))
      .help("set input dtype (quint8 | qint8)");
  program.add_argument("--input-scale")
      .default_value(1.0)
      .scan<'g', double>()
      .help("set input quantization scale");
  program.add_argument("--input-zero-point")
      .default_value(0)
      .scan<'d', int>()
      .help("set input quantization zero point");

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error &err) {
    return qconv::MakeError(ErrorCode::kArgumentsParsingError, err.what());
  }

  args.state_path(program.get<string>("--state-path"));
  args.backend(program.get<string>("--backend"));
  args.do_run(program.get<bool>("--run"));
  args.input_dtype(program.get<string>("--input-dtype"));
  args.input_scale(program.get<double>("--input-scale"));
  args.input_zero_point(program.get<int>("--input-zero-point"));

  if (program.is_used("--input-shape")) {
    auto shape = qconv::ParseShape(program.get<string>("--input-shape"));
    if (!shape) return make_unexpected(shape.error());
    args.input_shape(shape.value());
  } else {
    args.input_shape(std::nullopt);
  }

  if (program.is_used("--dump-path")) {
    args.dump_path(program.get<string>("--dump-path"));
  } else {
    args.dump_path(std::nullopt);
  }

  return args.CheckArguments();
}

namespace {
template <typename Type>
void FillRamp(qconv::Tensor &tensor) {
  int64_t qmin, qmax;
  qconv::dty::GetDataTypeMinMax(tensor.dtype(), qmin, qmax);
  const int64_t range = qmax - qmin + 1;
  Type *data = tensor.data<Type>();
  for (size_t i = 0; i < tensor.numel(); ++i) {
    data[i] = static_cast<Type>(qmin + static_cast<int64_t>(i) % range);
  }
}

template <typename Type>
void LogValueRange(const string &name, const qconv::Tensor &tensor) {
  const Type *data = tensor.data<Type>();
  const auto minmax = std::minmax_element(data, data + tensor.numel());
  LOG(INFO) << name << " " << tensor.dimension().str() << " "
            << tensor.dtype() << " range=["
            << static_cast<int64_t>(*minmax.first) << ", "
            << static_cast<int64_t>(*minmax.second) << "]";
}

expected<void, Error> RunForward(const qconv::nn::QuantizedConv2d &module,
                                 const Arguments &args) {
  const auto dtype = args.input_dtype() == "quint8"
                         ? qconv::dty::DataType::UINT8
                         : qconv::dty::DataType::INT8;
  qconv::Tensor int_repr(args.input_shape().value(), dtype);
  if (dtype == qconv::dty::DataType::UINT8) {
    FillRamp<uint8_t>(int_repr);
  } else {
    FillRamp<int8_t>(int_repr);
  }

  auto params = qconv::quantization::QuantParams::Create(
      args.input_scale(), args.input_zero_point(), dtype);
  if (!params) return make_unexpected(params.error());
  auto input = qconv::quantization::QuantizedTensor::Create(
      std::move(int_repr), params.value());
  if (!input) return make_unexpected(input.error());

  auto output = module.Forward(input.value());
  if (!output) return make_unexpected(output.error());

  if (output->dtype() == qconv::dty::DataType::UINT8) {
    LogValueRange<uint8_t>("output", output->int_repr());
  } else {
    LogValueRange<int8_t>("output", output->int_repr());
  }
  cout << "output shape: " << output->dimension().str()
       << ", scale=" << output->scale()
       << ", zero_point=" << output->zero_point() << '\n';
  return {};
}
}  // namespace

expected<void, Error> Run(const Arguments &args) {
  LOG(INFO) << "Started loading " << args.state_path();
  auto state = qconv::serialization::ReadStateFile(args.state_path());
  if (!state) return make_unexpected(state.error());

  auto backend = qconv::backends::CreateConvBackend(args.backend());
  if (!backend) return make_unexpected(backend.error());

  auto module =
      qconv::nn::QuantizedConv2d::FromState(state.value(), backend.value());
  if (!module) return make_unexpected(module.error());
  LOG(INFO) << "QuantizedConv2d(" << module->ExtraRepr() << ")";

  auto weight = module->weight();
  if (!weight) return make_unexpected(weight.error());
  LogValueRange<int8_t>("weight", weight->int_repr());
  LOG(INFO) << "weight " << weight->qparams().str();

  if (args.do_run()) {
    auto result = RunForward(module.value(), args);
    if (!result) return result;
  }

  if (args.dump_path().has_value()) {
    auto current = module->GetState();
    if (!current) return make_unexpected(current.error());
    auto result = qconv::serialization::WriteStateFile(
        current.value(), args.dump_path().value());
    if (!result) return result;
  }

  LOG(INFO) << "Finished";
  return {};
}
