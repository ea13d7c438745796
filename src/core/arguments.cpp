#include "arguments.hpp"

#define SCOPE Arguments

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
using std::optional;
#include <sstream>
#include <string>
using std::string;
#include <vector>
using std::vector;

#include "glog/logging.h"
#include "tl/expected.hpp"
using tl::expected;

#include "datatype.hpp"
#include "enums/error.hpp"
#include "network/dimension.hpp"
#include "utility.hpp"

namespace qconv {

expected<void, Error> SCOPE::CheckArguments() {
  expected<void, Error> result;

  // state-path
  result = CheckStringFilePathReadable("--state-path", state_path_);
  if (!result) return result;

  // backend
  const vector<string> backend_options{"cpu"};
  result = CheckArgInList("--backend", backend_, backend_options);
  if (!result) return result;

  if (do_run_) {
    result = CheckRunArguments();
    if (!result) return result;
  } else {
    const string error_msg = " is ignored: --run=false";
    if (input_shape_.has_value()) {
      LOG(WARNING) << "--input-shape" << error_msg;
    }
  }

  // dump-path
  if (dump_path_.has_value()) {
    result = CheckStringFilePathWritable("--dump-path", dump_path_.value());
    if (!result) return result;
  }
  return {};
}

expected<void, Error> SCOPE::CheckRunArguments() {
  auto result = CheckArgExist("--input-shape", input_shape_,
                              "required from --run");
  if (!result) return result;
  if (input_shape_->size() != 4) {
    return MakeError(ErrorCode::kArgumentsParsingError,
                     "--input-shape must have 4 dimensions (N,C,H,W), got " +
                         std::to_string(input_shape_->size()));
  }
  size_t numel = 0;
  if (!CheckedElementCount(input_shape_.value(), 1, numel)) {
    return MakeError(ErrorCode::kArgumentsParsingError,
                     "--input-shape " + Dimension(input_shape_.value()).str() +
                         " is too large");
  }

  const vector<string> dtype_options{"quint8", "qint8"};
  result = CheckArgInList("--input-dtype", input_dtype_, dtype_options);
  if (!result) return result;

  if (!std::isfinite(input_scale_) || input_scale_ <= 0.0) {
    std::ostringstream ss;
    ss << "Invalid value for --input-scale: " << input_scale_;
    return MakeError(ErrorCode::kArgumentsParsingError, ss.str());
  }

  int64_t qmin, qmax;
  dty::GetDataTypeMinMax(input_dtype_ == "quint8" ? dty::DataType::UINT8
                                                  : dty::DataType::INT8,
                         qmin, qmax);
  if (input_zero_point_ < qmin || input_zero_point_ > qmax) {
    return MakeError(ErrorCode::kArgumentsParsingError,
                     "Invalid value for --input-zero-point: " +
                         std::to_string(input_zero_point_) + " not in [" +
                         std::to_string(qmin) + ", " + std::to_string(qmax) +
                         "]");
  }
  return {};
}

template <typename T>
expected<void, Error> SCOPE::CheckArgExist(const string &option_name,
                                           const optional<T> &argument,
                                           const string &msg) {
  if (argument.has_value()) {
    return {};
  }
  return MakeError(ErrorCode::kArgumentsParsingError,
                   "No value for " + option_name + " was given: " + msg);
}

template <typename T>
expected<void, Error> SCOPE::CheckArgInList(const string &option_name,
                                            const T &argument,
                                            const vector<T> &valid_args) {
  if (std::find(valid_args.begin(), valid_args.end(), argument) !=
      valid_args.end()) {
    return {};
  }
  std::ostringstream ss;
  ss << "Invalid value for " << option_name << ": " << argument;
  return MakeError(ErrorCode::kArgumentsParsingError, ss.str());
}

expected<void, Error> SCOPE::CheckStringFilePathReadable(
    const string &option_name, const string &path) {
  if (!CheckFilePathReadable(path)) {
    return MakeError(ErrorCode::kArgumentsParsingError,
                     "Invalid file path for " + option_name + ": " + path);
  }
  return {};
}

expected<void, Error> SCOPE::CheckStringFilePathWritable(
    const string &option_name, const string &path) {
  if (!CheckFilePathWritable(path)) {
    return MakeError(ErrorCode::kArgumentsParsingError,
                     "Invalid file path for " + option_name + ": " + path);
  }
  return {};
}

}  // namespace qconv
