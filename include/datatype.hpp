#ifndef DATATYPE_HPP
#define DATATYPE_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace qconv {
namespace dty {

enum class DataType {
  FP32 = 0,
  FP64 = 1,

  UINT8 = 3,
  QUINT8 = UINT8,

  INT8 = 4,
  QINT8 = INT8,

  INT32 = 6,
  QINT32 = INT32,
};

size_t SizeOf(DataType dtype);
std::string NameOf(DataType dtype);

// true for the integer types a quantized tensor can be stored in
bool IsQuantized(DataType dtype);

// Representable integer range of a quantized dtype. With reduce_range the
// range is one bit narrower, which keeps int16 accumulation from overflowing
// on some backends.
void GetDataTypeMinMax(DataType dtype, int64_t &min, int64_t &max,
                       bool reduce_range = false);

template <typename Type>
DataType GetDataType();

template <>
DataType GetDataType<double>();
template <>
DataType GetDataType<float>();
template <>
DataType GetDataType<int8_t>();
template <>
DataType GetDataType<uint8_t>();
template <>
DataType GetDataType<int32_t>();

std::ostream &operator<<(std::ostream &out, DataType dtype);

}  // namespace dty
}  // namespace qconv

#endif  // DATATYPE_HPP
