#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "enums/error.hpp"
#include "network/conv_config.hpp"
#include "network/descriptor.hpp"

namespace qconv {
namespace {

TEST(ConvConfigTest, DefaultsAreValid) {
  ConvConfig config(3, 8, 3, 3);
  EXPECT_TRUE(config.CheckValid().has_value());
  EXPECT_TRUE(config.bias());
  EXPECT_EQ(config.padding_mode(), "zeros");
  EXPECT_EQ(config.descriptor(), ConvDescriptor());
  EXPECT_EQ(config.WeightDims(), (std::vector<size_t>{8, 3, 3, 3}));
}

TEST(ConvConfigTest, WeightDimsDivideInputChannelsByGroups) {
  ConvConfig config(4, 6, 3, 1);
  config.groups(2);
  EXPECT_EQ(config.WeightDims(), (std::vector<size_t>{6, 2, 3, 1}));
}

TEST(ConvConfigTest, InputChannelsMustDivideByGroups) {
  ConvConfig config(10, 6, 3, 3);
  config.groups(3);
  auto result = config.CheckValid();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kConfigError);
  EXPECT_NE(result.error().message.find("in_channels=10"), std::string::npos);
  EXPECT_NE(result.error().message.find("groups=3"), std::string::npos);
}

TEST(ConvConfigTest, OutputChannelsMustDivideByGroups) {
  ConvConfig config(6, 4, 3, 3);
  config.groups(3);
  auto result = config.CheckValid();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kConfigError);
  EXPECT_NE(result.error().message.find("out_channels=4"), std::string::npos);
}

TEST(ConvConfigTest, OnlyZeroPaddingIsSupported) {
  ConvConfig config(3, 3, 3, 3);
  config.padding_mode("reflect");
  auto result = config.CheckValid();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kConfigError);
  EXPECT_NE(result.error().message.find("reflect"), std::string::npos);
}

TEST(ConvConfigTest, RejectsNonPositiveExtents) {
  ConvConfig zero_kernel(3, 3, 0, 3);
  EXPECT_EQ(zero_kernel.CheckValid().error().code, ErrorCode::kConfigError);

  ConvConfig zero_stride(3, 3, 3, 3);
  zero_stride.descriptor().stride_width(0);
  EXPECT_EQ(zero_stride.CheckValid().error().code, ErrorCode::kConfigError);

  ConvConfig negative_padding(3, 3, 3, 3);
  negative_padding.descriptor().padding_height(-1);
  EXPECT_EQ(negative_padding.CheckValid().error().code,
            ErrorCode::kConfigError);
}

TEST(ConvConfigTest, RejectsWeightTooLargeToAllocate) {
  // 4 * 2^62 wraps to 0 in size_t
  ConvConfig wrapping(4, int64_t{1} << 62, 1, 1);
  auto result = wrapping.CheckValid();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kConfigError);
  EXPECT_NE(result.error().message.find("too large"), std::string::npos);

  ConvConfig huge(1 << 20, 1 << 20, 3, 3);
  EXPECT_EQ(huge.CheckValid().error().code, ErrorCode::kConfigError);
}

}  // namespace
}  // namespace qconv
