#ifndef ENUMS_QSCHEME_HPP
#define ENUMS_QSCHEME_HPP

#include <iostream>

namespace qconv {
namespace quantization {
enum class QScheme { kPerTensorAffine = 0, kPerTensorSymmetric };

inline std::ostream& operator<<(std::ostream& os, QScheme qscheme) {
  switch (qscheme) {
    case QScheme::kPerTensorAffine:
      os << "per_tensor_affine";
      break;
    case QScheme::kPerTensorSymmetric:
      os << "per_tensor_symmetric";
      break;
    default:
      break;
  }
  return os;
}
}  // namespace quantization
}  // namespace qconv

#endif  // ENUMS_QSCHEME_HPP
