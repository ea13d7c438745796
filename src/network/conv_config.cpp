#include "network/conv_config.hpp"

#define SCOPE ConvConfig

#include <cstdint>
#include <string>
using std::string;
using std::to_string;
#include <utility>
#include <vector>
using std::vector;

#include "enums/error.hpp"
#include "network/dimension.hpp"
#include "tl/expected.hpp"
using tl::expected;

namespace qconv {

SCOPE::ConvConfig() : ConvConfig(1, 1, 1, 1) {}

SCOPE::ConvConfig(int64_t in_channels, int64_t out_channels,
                  int64_t kernel_height, int64_t kernel_width)
    : in_channels_(in_channels),
      out_channels_(out_channels),
      kernel_height_(kernel_height),
      kernel_width_(kernel_width),
      bias_(true),
      padding_mode_(kZerosPaddingMode) {}

vector<size_t> SCOPE::WeightDims() const {
  return {static_cast<size_t>(out_channels_),
          static_cast<size_t>(in_channels_ / groups()),
          static_cast<size_t>(kernel_height_),
          static_cast<size_t>(kernel_width_)};
}

expected<void, Error> SCOPE::CheckValid() const {
  if (padding_mode_ != kZerosPaddingMode) {
    return MakeError(ErrorCode::kConfigError,
                     "padding_mode=" + padding_mode_ +
                         " is not supported, only zero padding is");
  }

  const vector<std::pair<string, int64_t>> positive_fields{
      {"in_channels", in_channels_},
      {"out_channels", out_channels_},
      {"kernel_height", kernel_height_},
      {"kernel_width", kernel_width_},
      {"stride_height", descriptor_.stride_height()},
      {"stride_width", descriptor_.stride_width()},
      {"dilation_height", descriptor_.dilation_height()},
      {"dilation_width", descriptor_.dilation_width()},
      {"groups", descriptor_.groups()}};
  for (const auto &field : positive_fields) {
    if (field.second <= 0) {
      return MakeError(ErrorCode::kConfigError,
                       field.first + "=" + to_string(field.second) +
                           " must be positive");
    }
  }
  if (descriptor_.padding_height() < 0 || descriptor_.padding_width() < 0) {
    return MakeError(ErrorCode::kConfigError,
                     "padding=(" + to_string(descriptor_.padding_height()) +
                         ", " + to_string(descriptor_.padding_width()) +
                         ") must not be negative");
  }

  const int64_t groups = descriptor_.groups();
  if (in_channels_ % groups != 0) {
    return MakeError(ErrorCode::kConfigError,
                     "in_channels=" + to_string(in_channels_) +
                         " not divisible by groups=" + to_string(groups));
  }
  if (out_channels_ % groups != 0) {
    return MakeError(ErrorCode::kConfigError,
                     "out_channels=" + to_string(out_channels_) +
                         " not divisible by groups=" + to_string(groups));
  }

  size_t count = 0;
  if (!CheckedElementCount(WeightDims(), 1, count)) {
    return MakeError(ErrorCode::kConfigError,
                     "weight of shape " + Dimension(WeightDims()).str() +
                         " is too large");
  }
  if (bias_ && !CheckedElementCount({static_cast<size_t>(out_channels_)},
                                    sizeof(int32_t), count)) {
    return MakeError(ErrorCode::kConfigError,
                     "bias of " + to_string(out_channels_) +
                         " elements is too large");
  }
  return {};
}

}  // namespace qconv
