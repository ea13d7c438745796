#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "datatype.hpp"
#include "enums/error.hpp"
#include "fusion/conv_bn_fusion.hpp"
#include "network/tensor.hpp"
#include "test_util.hpp"

namespace qconv {
namespace fusion {
namespace {

class ConvBnFusionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    weight_values_ = test::PseudoRandomFloats(2 * 3 * 3 * 3, -1.f, 1.f, 3);
  }

  Tensor Weight() const {
    return test::MakeTensor({2, 3, 3, 3}, weight_values_);
  }

  static BatchNormParams Identity(double eps) {
    return BatchNormParams{
        test::MakeFilled({2}, 0.f),
        test::MakeFilled({2}, static_cast<float>(1.0 - eps)),
        test::MakeFilled({2}, 1.f), test::MakeFilled({2}, 0.f), eps};
  }

  std::vector<float> weight_values_;
};

TEST_F(ConvBnFusionTest, IdentityNormalizationKeepsWeights) {
  Tensor bias = test::MakeTensor({2}, {0.25f, -1.5f});
  auto fused = FuseConvBnWeights(Weight(), bias, Identity(0.25));
  ASSERT_TRUE(fused.has_value());
  EXPECT_EQ(test::FloatValues(fused->weight), weight_values_);
  EXPECT_EQ(test::FloatValues(fused->bias), test::FloatValues(bias));
}

TEST_F(ConvBnFusionTest, IdentityNormalizationWithSmallEps) {
  Tensor bias = test::MakeTensor({2}, {0.25f, -1.5f});
  auto fused = FuseConvBnWeights(Weight(), bias, Identity(1e-5));
  ASSERT_TRUE(fused.has_value());
  const auto weight = test::FloatValues(fused->weight);
  for (size_t i = 0; i < weight.size(); ++i) {
    EXPECT_FLOAT_EQ(weight[i], weight_values_[i]);
  }
  const auto fused_bias = test::FloatValues(fused->bias);
  EXPECT_FLOAT_EQ(fused_bias[0], 0.25f);
  EXPECT_FLOAT_EQ(fused_bias[1], -1.5f);
}

TEST_F(ConvBnFusionTest, FoldsScaleAndShift) {
  // scale = gamma / sqrt(var + eps) = 1 / sqrt(3 + 1) = 0.5
  BatchNormParams bn{test::MakeFilled({1}, 1.f), test::MakeFilled({1}, 3.f),
                     test::MakeFilled({1}, 1.f), test::MakeFilled({1}, 0.25f),
                     1.0};
  Tensor weight = test::MakeTensor({1, 1, 2, 1}, {2.f, -4.f});
  Tensor bias = test::MakeTensor({1}, {3.f});

  auto fused = FuseConvBnWeights(weight, bias, bn);
  ASSERT_TRUE(fused.has_value());
  EXPECT_EQ(test::FloatValues(fused->weight), (std::vector<float>{1.f, -2.f}));
  EXPECT_EQ(test::FloatValues(fused->bias), (std::vector<float>{1.25f}));
  EXPECT_EQ(fused->weight.dimension(), weight.dimension());
}

TEST_F(ConvBnFusionTest, MissingBiasCountsAsZero) {
  BatchNormParams bn{test::MakeFilled({1}, 1.f), test::MakeFilled({1}, 3.f),
                     test::MakeFilled({1}, 1.f), test::MakeFilled({1}, 0.25f),
                     1.0};
  auto fused = FuseConvBnWeights(test::MakeTensor({1, 1, 1, 1}, {2.f}),
                                 std::nullopt, bn);
  ASSERT_TRUE(fused.has_value());
  EXPECT_EQ(test::FloatValues(fused->bias), (std::vector<float>{-0.25f}));
}

TEST_F(ConvBnFusionTest, RejectsChannelMismatch) {
  BatchNormParams bn = Identity(1e-5);
  bn.gamma = test::MakeFilled({3}, 1.f);
  auto fused = FuseConvBnWeights(Weight(), std::nullopt, bn);
  ASSERT_FALSE(fused.has_value());
  EXPECT_EQ(fused.error().code, ErrorCode::kShapeError);
  EXPECT_NE(fused.error().message.find("gamma"), std::string::npos);

  auto bad_bias =
      FuseConvBnWeights(Weight(), test::MakeFilled({5}, 0.f), Identity(1e-5));
  ASSERT_FALSE(bad_bias.has_value());
  EXPECT_EQ(bad_bias.error().code, ErrorCode::kShapeError);
}

TEST_F(ConvBnFusionTest, RejectsQuantizedWeight) {
  Tensor weight({2, 3, 3, 3}, dty::DataType::INT8);
  auto fused = FuseConvBnWeights(weight, std::nullopt, Identity(1e-5));
  ASSERT_FALSE(fused.has_value());
  EXPECT_EQ(fused.error().code, ErrorCode::kUnsupportedDtype);
}

TEST_F(ConvBnFusionTest, RejectsNonPositiveVariance) {
  BatchNormParams bn = Identity(0.0);
  bn.running_var = test::MakeFilled({2}, 0.f);
  auto fused = FuseConvBnWeights(Weight(), std::nullopt, bn);
  ASSERT_FALSE(fused.has_value());
  EXPECT_EQ(fused.error().code, ErrorCode::kConfigError);
}

}  // namespace
}  // namespace fusion
}  // namespace qconv
