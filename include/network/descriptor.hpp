#ifndef NETWORK_DESCRIPTOR_HPP
#define NETWORK_DESCRIPTOR_HPP

#include <cstdint>
#include <string>

namespace qconv {

// Structural parameters of a 2-D convolution that a packed weight is baked
// against. Padding is symmetric: padding_height rows are added both above and
// below the input.
class ConvDescriptor {
 public:
  ConvDescriptor();
  ConvDescriptor(int64_t stride_height, int64_t stride_width,
                 int64_t padding_height, int64_t padding_width,
                 int64_t dilation_height, int64_t dilation_width,
                 int64_t groups);

  int64_t stride_height() const { return stride_height_; }
  void stride_height(int64_t value) { stride_height_ = value; }
  int64_t stride_width() const { return stride_width_; }
  void stride_width(int64_t value) { stride_width_ = value; }
  int64_t padding_height() const { return padding_height_; }
  void padding_height(int64_t value) { padding_height_ = value; }
  int64_t padding_width() const { return padding_width_; }
  void padding_width(int64_t value) { padding_width_ = value; }
  int64_t dilation_height() const { return dilation_height_; }
  void dilation_height(int64_t value) { dilation_height_ = value; }
  int64_t dilation_width() const { return dilation_width_; }
  void dilation_width(int64_t value) { dilation_width_ = value; }
  int64_t groups() const { return groups_; }
  void groups(int64_t value) { groups_ = value; }

  // Standard convolution output extent for one spatial axis. 0 when
  // the dilated kernel does not fit into the padded input.
  int64_t OutputHeight(int64_t input_height, int64_t kernel_height) const;
  int64_t OutputWidth(int64_t input_width, int64_t kernel_width) const;

  std::string str() const;

  bool operator==(const ConvDescriptor &rhs) const;
  bool operator!=(const ConvDescriptor &rhs) const { return !(*this == rhs); }

 private:
  int64_t stride_height_;
  int64_t stride_width_;
  int64_t padding_height_;
  int64_t padding_width_;
  int64_t dilation_height_;
  int64_t dilation_width_;
  int64_t groups_;
};

}  // namespace qconv

#endif  // NETWORK_DESCRIPTOR_HPP
