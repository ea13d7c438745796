#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backends/conv_backend.hpp"
#include "backends/cpu/cpu_conv_backend.hpp"
#include "backends/packed_weight.hpp"
#include "datatype.hpp"
#include "enums/error.hpp"
#include "network/descriptor.hpp"
#include "quantization/quantized_tensor.hpp"
#include "test_util.hpp"

namespace qconv {
namespace backends {
namespace {

using dty::DataType;
using quantization::QuantizedTensor;

class ForeignPackedWeight : public PackedWeight {
 public:
  const std::string &backend_name() const override { return name_; }

 private:
  std::string name_ = "foreign";
};

struct ConvCase {
  std::vector<size_t> input_dims;
  std::vector<size_t> weight_dims;
  ConvDescriptor descriptor;
};

class CpuConvBackendTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto backend = CreateConvBackend("cpu");
    ASSERT_TRUE(backend.has_value());
    backend_ = backend.value();
  }

  static QuantizedTensor RandomWeight(const std::vector<size_t> &dims,
                                      int64_t zero_point, uint32_t seed) {
    size_t count = 1;
    for (size_t dim : dims) count *= dim;
    return test::MakeQuantized(dims, DataType::INT8,
                               test::PseudoRandomInts(count, -128, 127, seed),
                               0.02, zero_point);
  }

  static QuantizedTensor RandomInput(const std::vector<size_t> &dims,
                                     DataType dtype, int64_t zero_point,
                                     uint32_t seed) {
    size_t count = 1;
    for (size_t dim : dims) count *= dim;
    int64_t qmin, qmax;
    dty::GetDataTypeMinMax(dtype, qmin, qmax);
    return test::MakeQuantized(dims, dtype,
                               test::PseudoRandomInts(count, qmin, qmax, seed),
                               0.05, zero_point);
  }

  std::shared_ptr<const ConvBackend> backend_;
};

TEST_F(CpuConvBackendTest, RegisteredUnderCpu) {
  EXPECT_EQ(backend_->name(), "cpu");
  auto missing = CreateConvBackend("gpu");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::kBackendError);
}

TEST_F(CpuConvBackendTest, UnpackRestoresPackedWeight) {
  const std::vector<ConvCase> cases{
      {{}, {8, 3, 3, 3}, ConvDescriptor()},
      {{}, {4, 2, 1, 5}, ConvDescriptor(2, 1, 0, 2, 1, 1, 2)},
      {{}, {6, 1, 3, 3}, ConvDescriptor(1, 1, 1, 1, 2, 2, 6)},
      {{}, {1, 1, 1, 1}, ConvDescriptor()}};
  uint32_t seed = 1;
  for (const auto &conv : cases) {
    for (int64_t zero_point : {0, -3}) {
      QuantizedTensor weight = RandomWeight(conv.weight_dims, zero_point,
                                            seed++);
      auto packed = backend_->Pack(weight, conv.descriptor);
      ASSERT_TRUE(packed.has_value());
      EXPECT_EQ(packed.value()->backend_name(), "cpu");

      auto unpacked = backend_->Unpack(*packed.value());
      ASSERT_TRUE(unpacked.has_value());
      EXPECT_TRUE(unpacked.value() == weight)
          << "weight " << weight.dimension().str() << " with "
          << conv.descriptor.str();
    }
  }
}

TEST_F(CpuConvBackendTest, PackRejectsNonWeightTensors) {
  auto uint8_weight =
      test::MakeQuantized({1, 1, 1, 1}, DataType::UINT8, {3}, 1.0, 0);
  auto result = backend_->Pack(uint8_weight, ConvDescriptor());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kUnsupportedDtype);

  auto flat = test::MakeQuantized({4}, DataType::INT8, {1, 2, 3, 4}, 1.0, 0);
  result = backend_->Pack(flat, ConvDescriptor());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kShapeError);
}

TEST_F(CpuConvBackendTest, UnpackRejectsForeignWeight) {
  ForeignPackedWeight foreign;
  auto result = backend_->Unpack(foreign);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kBackendError);
}

TEST_F(CpuConvBackendTest, ForwardSumsWindow) {
  auto input = test::MakeQuantized({1, 1, 3, 3}, DataType::UINT8,
                                   {1, 2, 3, 4, 5, 6, 7, 8, 9}, 1.0, 0);
  auto weight = test::MakeQuantized({1, 1, 2, 2}, DataType::INT8,
                                    {1, 1, 1, 1}, 1.0, 0);
  auto packed = backend_->Pack(weight, ConvDescriptor());
  ASSERT_TRUE(packed.has_value());

  auto output = backend_->Forward(input, *packed.value(), std::nullopt,
                                  ConvDescriptor(), 1.0, 0);
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->dimension(), Dimension(1, 1, 2, 2));
  EXPECT_EQ(output->dtype(), DataType::UINT8);
  EXPECT_EQ(test::IntValues(output.value()),
            (std::vector<int64_t>{12, 16, 24, 28}));
}

TEST_F(CpuConvBackendTest, ForwardAddsBiasAndRequantizes) {
  auto input = test::MakeQuantized({1, 1, 1, 2}, DataType::UINT8, {14, 6},
                                   0.5, 10);
  auto weight =
      test::MakeQuantized({2, 1, 1, 1}, DataType::INT8, {4, -2}, 0.25, 0);
  // accumulator scale is 0.5 * 0.25 = 0.125
  auto bias = test::MakeQuantized({2}, DataType::INT32, {8, 0}, 0.125, 0);
  auto packed = backend_->Pack(weight, ConvDescriptor());
  ASSERT_TRUE(packed.has_value());

  auto output = backend_->Forward(input, *packed.value(), bias,
                                  ConvDescriptor(), 0.25, 100);
  ASSERT_TRUE(output.has_value());
  // channel 0: (4 * 4 + 8) * 0.125 = 3.0, (-4 * 4 + 8) * 0.125 = -1.0
  // channel 1: (4 * -2) * 0.125 = -1.0, (-4 * -2) * 0.125 = 1.0
  EXPECT_EQ(test::IntValues(output.value()),
            (std::vector<int64_t>{112, 96, 96, 104}));
  EXPECT_EQ(output->scale(), 0.25);
  EXPECT_EQ(output->zero_point(), 100);
}

TEST_F(CpuConvBackendTest, PaddingUsesInputZeroPoint) {
  // every input value is the zero point, i.e. real zero, so padding must
  // not contribute either
  auto input = test::MakeQuantized({1, 2, 3, 3}, DataType::UINT8,
                                   std::vector<int64_t>(18, 37), 0.1, 37);
  QuantizedTensor weight = RandomWeight({3, 2, 3, 3}, 0, 5);
  const ConvDescriptor descriptor(1, 1, 2, 2, 1, 1, 1);
  auto packed = backend_->Pack(weight, descriptor);
  ASSERT_TRUE(packed.has_value());

  auto output = backend_->Forward(input, *packed.value(), std::nullopt,
                                  descriptor, 0.1, 50);
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->dimension(), Dimension(1, 3, 5, 5));
  for (int64_t value : test::IntValues(output.value())) {
    EXPECT_EQ(value, 50);
  }
}

TEST_F(CpuConvBackendTest, ForwardMatchesDirectConvolution) {
  const std::vector<ConvCase> cases{
      {{2, 3, 7, 6}, {4, 3, 3, 3}, ConvDescriptor()},
      {{1, 4, 9, 9}, {6, 2, 3, 2}, ConvDescriptor(2, 1, 1, 0, 1, 1, 2)},
      {{1, 4, 8, 8}, {4, 1, 3, 3}, ConvDescriptor(1, 2, 2, 1, 2, 1, 4)},
      {{3, 2, 5, 5}, {2, 2, 1, 1}, ConvDescriptor(1, 1, 1, 1, 1, 1, 1)}};
  uint32_t seed = 100;
  for (const auto &conv : cases) {
    for (DataType dtype : {DataType::UINT8, DataType::INT8}) {
      const int64_t input_zp = dtype == DataType::UINT8 ? 120 : -7;
      QuantizedTensor input =
          RandomInput(conv.input_dims, dtype, input_zp, seed++);
      QuantizedTensor weight = RandomWeight(conv.weight_dims, 2, seed++);
      const size_t out_channels = conv.weight_dims[0];
      QuantizedTensor bias = test::MakeQuantized(
          {out_channels}, DataType::INT32,
          test::PseudoRandomInts(out_channels, -5000, 5000, seed++),
          input.scale() * weight.scale(), 0);
      const int64_t out_zp = dtype == DataType::UINT8 ? 128 : 0;

      auto packed = backend_->Pack(weight, conv.descriptor);
      ASSERT_TRUE(packed.has_value());
      auto output = backend_->Forward(input, *packed.value(), bias,
                                      conv.descriptor, 0.4, out_zp);
      ASSERT_TRUE(output.has_value());
      EXPECT_EQ(output->dtype(), dtype);
      EXPECT_EQ(test::IntValues(output.value()),
                test::ReferenceConv(input, weight, bias, conv.descriptor,
                                    0.4, out_zp))
          << "input " << input.dimension().str() << " weight "
          << weight.dimension().str() << " " << conv.descriptor.str();
    }
  }
}

TEST_F(CpuConvBackendTest, ForwardRejectsDescriptorMismatch) {
  QuantizedTensor weight = RandomWeight({2, 2, 3, 3}, 0, 9);
  auto packed = backend_->Pack(weight, ConvDescriptor());
  ASSERT_TRUE(packed.has_value());
  QuantizedTensor input = RandomInput({1, 2, 5, 5}, DataType::UINT8, 0, 10);

  auto output = backend_->Forward(input, *packed.value(), std::nullopt,
                                  ConvDescriptor(2, 2, 0, 0, 1, 1, 1), 1.0, 0);
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(output.error().code, ErrorCode::kConfigError);
}

TEST_F(CpuConvBackendTest, ForwardRejectsBadShapes) {
  QuantizedTensor weight = RandomWeight({2, 2, 3, 3}, 0, 9);
  auto packed = backend_->Pack(weight, ConvDescriptor());
  ASSERT_TRUE(packed.has_value());

  QuantizedTensor wrong_channels =
      RandomInput({1, 3, 5, 5}, DataType::UINT8, 0, 10);
  EXPECT_EQ(backend_
                ->Forward(wrong_channels, *packed.value(), std::nullopt,
                          ConvDescriptor(), 1.0, 0)
                .error()
                .code,
            ErrorCode::kShapeError);

  QuantizedTensor too_small = RandomInput({1, 2, 2, 2}, DataType::UINT8, 0, 11);
  EXPECT_EQ(backend_
                ->Forward(too_small, *packed.value(), std::nullopt,
                          ConvDescriptor(), 1.0, 0)
                .error()
                .code,
            ErrorCode::kShapeError);

  QuantizedTensor input = RandomInput({1, 2, 5, 5}, DataType::UINT8, 0, 12);
  auto short_bias = test::MakeQuantized({1}, DataType::INT32, {0}, 1.0, 0);
  EXPECT_EQ(backend_
                ->Forward(input, *packed.value(), short_bias,
                          ConvDescriptor(), 1.0, 0)
                .error()
                .code,
            ErrorCode::kShapeError);
}

}  // namespace
}  // namespace backends
}  // namespace qconv
