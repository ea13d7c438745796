#ifndef NETWORK_CONV_CONFIG_HPP
#define NETWORK_CONV_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "enums/error.hpp"
#include "network/descriptor.hpp"
#include "tl/expected.hpp"

namespace qconv {

class ConvConfig {
 public:
  static constexpr const char *const kZerosPaddingMode = "zeros";

  ConvConfig();
  ConvConfig(int64_t in_channels, int64_t out_channels, int64_t kernel_height,
             int64_t kernel_width);

  int64_t in_channels() const { return in_channels_; }
  void in_channels(int64_t value) { in_channels_ = value; }

  int64_t out_channels() const { return out_channels_; }
  void out_channels(int64_t value) { out_channels_ = value; }

  int64_t kernel_height() const { return kernel_height_; }
  void kernel_height(int64_t value) { kernel_height_ = value; }

  int64_t kernel_width() const { return kernel_width_; }
  void kernel_width(int64_t value) { kernel_width_ = value; }

  const ConvDescriptor &descriptor() const { return descriptor_; }
  ConvDescriptor &descriptor() { return descriptor_; }
  void descriptor(const ConvDescriptor &value) { descriptor_ = value; }

  int64_t groups() const { return descriptor_.groups(); }
  void groups(int64_t value) { descriptor_.groups(value); }

  bool bias() const { return bias_; }
  void bias(bool value) { bias_ = value; }

  const std::string &padding_mode() const { return padding_mode_; }
  void padding_mode(const std::string &value) { padding_mode_ = value; }

  // [out_channels, in_channels / groups, kernel_height, kernel_width]
  std::vector<size_t> WeightDims() const;

  // Rejects non-positive extents, padding modes other than zero padding and
  // channel counts not divisible by groups. Nothing is allocated here, so
  // callers validate before building any tensor.
  tl::expected<void, Error> CheckValid() const;

 private:
  int64_t in_channels_;
  int64_t out_channels_;
  int64_t kernel_height_;
  int64_t kernel_width_;
  ConvDescriptor descriptor_;
  bool bias_;
  std::string padding_mode_;
};

}  // namespace qconv

#endif  // NETWORK_CONV_CONFIG_HPP
