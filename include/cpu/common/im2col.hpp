#ifndef CPU_COMMON_IM2COL_HPP
#define CPU_COMMON_IM2COL_HPP

#include <cstddef>
#include <cstdint>

namespace qconv {
namespace cpu {

inline bool is_a_ge_zero_and_a_lt_b(int a, int b) {
  return static_cast<unsigned>(a) < static_cast<unsigned>(b);
}

// From Berkeley Vision's Caffe!
// https://github.com/BVLC/caffe/blob/master/LICENSE
//
// Unfolds one image (CHW) into a [channels * kernel_h * kernel_w, out_h *
// out_w] column matrix. Out-of-bounds taps take `pad_value`, which for a
// quantized input is its zero point so that padding stays real zero.
template <typename Type>
void im2col_cpu(const Type* data_im, int channels, int height, int width,
                int kernel_h, int kernel_w, int pad_h, int pad_w, int stride_h,
                int stride_w, int dilation_h, int dilation_w, Type pad_value,
                Type* data_col) {
  const int output_h =
      (height + 2 * pad_h - (dilation_h * (kernel_h - 1) + 1)) / stride_h + 1;
  const int output_w =
      (width + 2 * pad_w - (dilation_w * (kernel_w - 1) + 1)) / stride_w + 1;
  const int channel_size = height * width;
  for (int channel = channels; channel > 0; channel--) {
    for (int kernel_row = 0; kernel_row < kernel_h; kernel_row++) {
      for (int kernel_col = 0; kernel_col < kernel_w; kernel_col++) {
        int input_row = -pad_h + kernel_row * dilation_h;
        for (int output_rows = output_h; output_rows; output_rows--) {
          if (!is_a_ge_zero_and_a_lt_b(input_row, height)) {
            for (int output_col = output_w; output_col; output_col--) {
              *(data_col++) = pad_value;
            }
          } else {
            int input_col = -pad_w + kernel_col * dilation_w;
            for (int output_col = output_w; output_col; output_col--) {
              if (is_a_ge_zero_and_a_lt_b(input_col, width)) {
                *(data_col++) = data_im[input_row * width + input_col];
              } else {
                *(data_col++) = pad_value;
              }
              input_col += stride_w;
            }
          }
          input_row += stride_h;
        }
      }
    }
    data_im += channel_size;
  }
}
}  // namespace cpu
}  // namespace qconv

#endif  // CPU_COMMON_IM2COL_HPP
