#include "network/descriptor.hpp"

#define SCOPE ConvDescriptor

#include <cstdint>
#include <sstream>
#include <string>

namespace qconv {

namespace {
int64_t OutputExtent(int64_t input, int64_t kernel, int64_t padding,
                     int64_t stride, int64_t dilation) {
  const int64_t span = input + 2 * padding - dilation * (kernel - 1) - 1;
  if (span < 0) return 0;
  return span / stride + 1;
}
}  // namespace

SCOPE::ConvDescriptor() : ConvDescriptor(1, 1, 0, 0, 1, 1, 1) {}

SCOPE::ConvDescriptor(int64_t stride_height, int64_t stride_width,
                      int64_t padding_height, int64_t padding_width,
                      int64_t dilation_height, int64_t dilation_width,
                      int64_t groups)
    : stride_height_(stride_height),
      stride_width_(stride_width),
      padding_height_(padding_height),
      padding_width_(padding_width),
      dilation_height_(dilation_height),
      dilation_width_(dilation_width),
      groups_(groups) {}

int64_t SCOPE::OutputHeight(int64_t input_height,
                            int64_t kernel_height) const {
  return OutputExtent(input_height, kernel_height, padding_height_,
                      stride_height_, dilation_height_);
}

int64_t SCOPE::OutputWidth(int64_t input_width, int64_t kernel_width) const {
  return OutputExtent(input_width, kernel_width, padding_width_,
                      stride_width_, dilation_width_);
}

std::string SCOPE::str() const {
  std::ostringstream ss;
  ss << "stride=(" << stride_height_ << ", " << stride_width_ << ")"
     << ", padding=(" << padding_height_ << ", " << padding_width_ << ")"
     << ", dilation=(" << dilation_height_ << ", " << dilation_width_ << ")"
     << ", groups=" << groups_;
  return ss.str();
}

bool SCOPE::operator==(const ConvDescriptor &rhs) const {
  return stride_height_ == rhs.stride_height_ &&
         stride_width_ == rhs.stride_width_ &&
         padding_height_ == rhs.padding_height_ &&
         padding_width_ == rhs.padding_width_ &&
         dilation_height_ == rhs.dilation_height_ &&
         dilation_width_ == rhs.dilation_width_ && groups_ == rhs.groups_;
}

}  // namespace qconv
