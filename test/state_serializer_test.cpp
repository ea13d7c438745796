#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "backends/conv_backend.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "network/conv_config.hpp"
#include "network/descriptor.hpp"
#include "nn/quantized_conv2d.hpp"
#include "nn/state.hpp"
#include "qconv_state.pb.h"
#include "quantization/quantized_tensor.hpp"
#include "serialization/state_serializer.hpp"
#include "test_util.hpp"

namespace qconv {
namespace serialization {
namespace {

using dty::DataType;
using quantization::QuantizedTensor;

class StateSerializerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ConvConfig config(4, 4, 3, 2);
    config.descriptor(ConvDescriptor(2, 1, 1, 1, 1, 2, 2));
    auto module = nn::QuantizedConv2d::Create(config);
    ASSERT_TRUE(module.has_value());
    ASSERT_TRUE(module
                    ->SetWeight(test::MakeQuantized(
                        config.WeightDims(), DataType::INT8,
                        test::PseudoRandomInts(48, -128, 127, 5), 0.03, -2))
                    .has_value());
    ASSERT_TRUE(module
                    ->SetBias(test::MakeQuantized(
                        {4}, DataType::INT32,
                        {-2147483648LL, -1, 0, 2147483647LL}, 1e-6, 0))
                    .has_value());
    ASSERT_TRUE(module->SetOutputQParams(0.125, 17).has_value());
    module_ = std::make_unique<nn::QuantizedConv2d>(std::move(module.value()));
  }

  void TearDown() override {
    for (const auto &path : temp_paths_) std::remove(path.c_str());
  }

  std::string TempPath(const std::string &suffix) {
    temp_paths_.push_back(test::TempFilePath(suffix));
    return temp_paths_.back();
  }

  nn::ConvState State() const { return module_->GetState().value(); }

  static void ExpectSameState(const nn::ConvState &actual,
                              const nn::ConvState &expected) {
    EXPECT_EQ(actual.in_channels, expected.in_channels);
    EXPECT_EQ(actual.out_channels, expected.out_channels);
    EXPECT_EQ(actual.kernel_size, expected.kernel_size);
    EXPECT_EQ(actual.stride, expected.stride);
    EXPECT_EQ(actual.padding, expected.padding);
    EXPECT_EQ(actual.dilation, expected.dilation);
    EXPECT_EQ(actual.transposed, expected.transposed);
    EXPECT_EQ(actual.output_padding, expected.output_padding);
    EXPECT_EQ(actual.groups, expected.groups);
    EXPECT_EQ(actual.padding_mode, expected.padding_mode);
    EXPECT_TRUE(actual.weight == expected.weight);
    ASSERT_EQ(actual.bias.has_value(), expected.bias.has_value());
    if (expected.bias.has_value()) {
      EXPECT_TRUE(actual.bias.value() == expected.bias.value());
    }
    EXPECT_EQ(actual.scale, expected.scale);
    EXPECT_EQ(actual.zero_point, expected.zero_point);
  }

  std::unique_ptr<nn::QuantizedConv2d> module_;
  std::vector<std::string> temp_paths_;
};

TEST_F(StateSerializerTest, RoundTripKeepsEveryField) {
  const nn::ConvState state = State();
  auto bytes = SerializeState(state);
  ASSERT_TRUE(bytes.has_value());
  auto parsed = ParseState(bytes.value());
  ASSERT_TRUE(parsed.has_value());
  ExpectSameState(parsed.value(), state);
}

TEST_F(StateSerializerTest, RoundTripWithoutBias) {
  ASSERT_TRUE(module_->SetBias(std::nullopt).has_value());
  const nn::ConvState state = State();
  auto parsed = ParseState(SerializeState(state).value());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(parsed->bias.has_value());
  ExpectSameState(parsed.value(), state);
}

TEST_F(StateSerializerTest, RestoredModuleComputesSameOutput) {
  auto parsed = ParseState(SerializeState(State()).value());
  ASSERT_TRUE(parsed.has_value());
  auto restored = nn::QuantizedConv2d::FromState(parsed.value());
  ASSERT_TRUE(restored.has_value());

  QuantizedTensor input = test::MakeQuantized(
      {2, 4, 7, 5}, DataType::QINT8,
      test::PseudoRandomInts(2 * 4 * 7 * 5, -128, 127, 9), 0.02, 3);
  auto expected_output = module_->Forward(input);
  auto actual_output = restored->Forward(input);
  ASSERT_TRUE(expected_output.has_value());
  ASSERT_TRUE(actual_output.has_value());
  EXPECT_TRUE(actual_output.value() == expected_output.value());
}

TEST_F(StateSerializerTest, GarbageBytesAreStateError) {
  auto parsed = ParseState(std::string("\xff\xff\xff\xff garbage", 12));
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);
}

TEST_F(StateSerializerTest, MissingFieldsAreStateError) {
  proto::ConvStateProto msg;
  ASSERT_TRUE(msg.ParseFromString(SerializeState(State()).value()));

  proto::ConvStateProto no_scale = msg;
  no_scale.clear_scale();
  auto parsed = ParseState(no_scale.SerializeAsString());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);
  EXPECT_NE(parsed.error().message.find("scale"), std::string::npos);

  proto::ConvStateProto no_zero_point = msg;
  no_zero_point.clear_zero_point();
  parsed = ParseState(no_zero_point.SerializeAsString());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);

  proto::ConvStateProto no_weight = msg;
  no_weight.clear_weight();
  parsed = ParseState(no_weight.SerializeAsString());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);
  EXPECT_NE(parsed.error().message.find("weight"), std::string::npos);
}

TEST_F(StateSerializerTest, MalformedTensorsAreStateError) {
  proto::ConvStateProto msg;
  ASSERT_TRUE(msg.ParseFromString(SerializeState(State()).value()));

  proto::ConvStateProto short_values = msg;
  short_values.mutable_weight()->mutable_values()->RemoveLast();
  EXPECT_EQ(ParseState(short_values.SerializeAsString()).error().code,
            ErrorCode::kStateError);

  proto::ConvStateProto no_dtype = msg;
  no_dtype.mutable_bias()->set_dtype(proto::DTYPE_UNSPECIFIED);
  EXPECT_EQ(ParseState(no_dtype.SerializeAsString()).error().code,
            ErrorCode::kStateError);

  proto::ConvStateProto out_of_range = msg;
  out_of_range.mutable_weight()->set_values(0, 200);
  EXPECT_EQ(ParseState(out_of_range.SerializeAsString()).error().code,
            ErrorCode::kStateError);

  proto::ConvStateProto bad_scale = msg;
  bad_scale.mutable_weight()->set_scale(0.0);
  EXPECT_EQ(ParseState(bad_scale.SerializeAsString()).error().code,
            ErrorCode::kStateError);

  proto::ConvStateProto bad_pair = msg;
  bad_pair.add_stride(1);
  auto parsed = ParseState(bad_pair.SerializeAsString());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);
  EXPECT_NE(parsed.error().message.find("stride"), std::string::npos);
}

TEST_F(StateSerializerTest, OversizedShapeIsRejectedBeforeAllocation) {
  proto::ConvStateProto msg;
  ASSERT_TRUE(msg.ParseFromString(SerializeState(State()).value()));

  proto::ConvStateProto huge = msg;
  huge.mutable_weight()->clear_dims();
  huge.mutable_weight()->add_dims(uint64_t{1} << 40);
  huge.mutable_weight()->clear_values();
  auto parsed = ParseState(huge.SerializeAsString());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);
  EXPECT_NE(parsed.error().message.find("weight"), std::string::npos);

  // element count wraps to 0 and would match an empty value list
  proto::ConvStateProto wrapping = msg;
  wrapping.mutable_bias()->clear_dims();
  wrapping.mutable_bias()->add_dims(4);
  wrapping.mutable_bias()->add_dims(uint64_t{1} << 62);
  wrapping.mutable_bias()->clear_values();
  parsed = ParseState(wrapping.SerializeAsString());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kStateError);
}

TEST_F(StateSerializerTest, FileRoundTrip) {
  const nn::ConvState state = State();
  const std::string path = TempPath(".qconv");
  ASSERT_TRUE(WriteStateFile(state, path).has_value());
  auto parsed = ReadStateFile(path);
  ASSERT_TRUE(parsed.has_value());
  ExpectSameState(parsed.value(), state);
}

TEST_F(StateSerializerTest, MissingFileIsFileReadError) {
  auto parsed = ReadStateFile(TempPath(".missing"));
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, ErrorCode::kFileReadError);
}

TEST_F(StateSerializerTest, UnwritablePathIsFileWriteError) {
  const std::string path = TempPath(".dir") + "/nested/state.qconv";
  auto result = WriteStateFile(State(), path);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kFileWriteError);
}

}  // namespace
}  // namespace serialization
}  // namespace qconv
