#include "datatype.hpp"

#include <cstdint>
#include <iostream>
#include <string>
using std::string;

#include "glog/logging.h"

namespace qconv {
namespace dty {

std::ostream &operator<<(std::ostream &out, DataType dtype) {
  return (out << NameOf(dtype));
}

size_t SizeOf(DataType dtype) {
  switch (dtype) {
    case DataType::FP32:
    case DataType::INT32:
      return 4;
    case DataType::FP64:
      return 8;
    case DataType::UINT8:
    case DataType::INT8:
      return 1;
  }
  LOG(FATAL) << "Undefined Data Type! : " << static_cast<int>(dtype);
  return 0;
}

string NameOf(DataType dtype) {
  switch (dtype) {
    case DataType::FP32:
      return "FP32";
    case DataType::FP64:
      return "FP64";
    case DataType::UINT8:
      return "QUINT8";
    case DataType::INT8:
      return "QINT8";
    case DataType::INT32:
      return "QINT32";
  }
  LOG(FATAL) << "Undefined Data Type! : " << static_cast<int>(dtype);
  return "";
}

bool IsQuantized(DataType dtype) {
  return dtype == DataType::UINT8 || dtype == DataType::INT8 ||
         dtype == DataType::INT32;
}

void GetDataTypeMinMax(DataType dtype, int64_t &min, int64_t &max,
                       bool reduce_range) {
  switch (dtype) {
    case DataType::UINT8:
      min = 0;
      max = reduce_range ? 127 : 255;
      return;
    case DataType::INT8:
      min = reduce_range ? -64 : -128;
      max = reduce_range ? 63 : 127;
      return;
    case DataType::INT32:
      min = INT32_MIN;
      max = INT32_MAX;
      return;
    default:
      LOG(FATAL) << "No integer range for data type: " << NameOf(dtype);
  }
}

template <>
DataType GetDataType<double>() {
  return DataType::FP64;
}

template <>
DataType GetDataType<float>() {
  return DataType::FP32;
}

template <>
DataType GetDataType<int8_t>() {
  return DataType::INT8;
}

template <>
DataType GetDataType<uint8_t>() {
  return DataType::UINT8;
}

template <>
DataType GetDataType<int32_t>() {
  return DataType::INT32;
}

}  // namespace dty
}  // namespace qconv
