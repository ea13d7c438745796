#include "network/dimension.hpp"

#define SCOPE Dimension

#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace qconv {

bool CheckedElementCount(const std::vector<size_t> &dims, size_t element_size,
                         size_t &count) {
  count = dims.empty() ? 0 : 1;
  for (size_t dim : dims) {
    if (dim != 0 && count > std::numeric_limits<size_t>::max() / dim) {
      return false;
    }
    count *= dim;
  }
  if (element_size == 0) element_size = 1;
  return count <= kMaxTensorBytes / element_size;
}

SCOPE::Dimension() {}

SCOPE::Dimension(size_t n, size_t c, size_t h, size_t w)
    : dims_({n, c, h, w}) {}

SCOPE::Dimension(std::vector<size_t> dims) : dims_(std::move(dims)) {}

size_t SCOPE::AxisOrZero(size_t idx) const {
  if (dims_.size() != 4) return 0;
  return dims_[idx];
}

size_t SCOPE::n() const { return AxisOrZero(0); }

size_t SCOPE::c() const { return AxisOrZero(1); }

size_t SCOPE::h() const { return AxisOrZero(2); }

size_t SCOPE::w() const { return AxisOrZero(3); }

size_t SCOPE::rank() const { return dims_.size(); }

void SCOPE::dims(std::vector<size_t> dims) { dims_ = std::move(dims); }

const std::vector<size_t> &SCOPE::dims() const { return dims_; }

size_t SCOPE::dims(size_t idx) const { return dims_.at(idx); }

std::string SCOPE::str() const {
  std::string dimension = "[";
  for (size_t i = 0; i < dims_.size(); ++i) {
    if (i > 0) dimension += ", ";
    dimension += std::to_string(dims_[i]);
  }
  dimension += "]";
  return dimension;
}

size_t SCOPE::size() const {
  if (dims_.size() == 0) {
    return 0;
  }
  size_t size = 1;
  for (size_t index = 0; index < dims_.size(); index++) {
    const size_t dim = dims_[index];
    if (dim != 0 && size > std::numeric_limits<size_t>::max() / dim) {
      return std::numeric_limits<size_t>::max();
    }
    size *= dim;
  }
  return size;
}

}  // namespace qconv
