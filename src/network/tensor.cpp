#include "network/tensor.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <vector>

#include "datatype.hpp"
#include "glog/logging.h"
#include "network/dimension.hpp"

namespace qconv {

Tensor::Tensor(size_t n, size_t c, size_t h, size_t w, dty::DataType dtype)
    : dimension_(n, c, h, w), data_(nullptr), dtype_(dtype) {
  Allocate();
}

Tensor::Tensor(std::vector<size_t> dims, dty::DataType dtype)
    : dimension_(std::move(dims)), data_(nullptr), dtype_(dtype) {
  Allocate();
}

Tensor::Tensor(size_t size, dty::DataType dtype)
    : dimension_(std::vector<size_t>{size}), data_(nullptr), dtype_(dtype) {
  Allocate();
}

Tensor::Tensor(const Tensor &other)
    : dimension_(other.dimension_), data_(nullptr), dtype_(other.dtype_) {
  Allocate();
  if (other.data_ != nullptr && this->size() > 0) {
    std::memcpy(data_, other.data_, this->size());
  }
}

Tensor &Tensor::operator=(const Tensor &other) {
  if (this != &other) {
    Tensor copy(other);
    *this = std::move(copy);
  }
  return *this;
}

Tensor::Tensor(Tensor &&other) noexcept
    : dimension_(std::move(other.dimension_)),
      data_(other.data_),
      dtype_(other.dtype_) {
  other.data_ = nullptr;
}

Tensor &Tensor::operator=(Tensor &&other) noexcept {
  if (this != &other) {
    std::free(data_);
    dimension_ = std::move(other.dimension_);
    dtype_ = other.dtype_;
    data_ = other.data_;
    other.data_ = nullptr;
  }
  return *this;
}

Tensor::~Tensor() { std::free(data_); }

void Tensor::Allocate() {
  // calloc(0) may legally return nullptr, keep one byte so data() is valid
  const size_t bytes = this->size() > 0 ? this->size() : 1;
  data_ = std::calloc(bytes, 1);
  if (data_ == nullptr) {
    LOG(ERROR) << "Failed to allocate " << bytes << " bytes for tensor "
               << dimension_.str();
    throw std::bad_alloc();
  }
}

const Dimension &Tensor::dimension() const { return dimension_; }

void *Tensor::data() { return data_; }

const void *Tensor::data() const { return data_; }

size_t Tensor::n() const { return dimension_.n(); }

size_t Tensor::c() const { return dimension_.c(); }

size_t Tensor::h() const { return dimension_.h(); }

size_t Tensor::w() const { return dimension_.w(); }

size_t Tensor::rank() const { return dimension_.rank(); }

dty::DataType Tensor::dtype() const { return dtype_; }

size_t Tensor::size() const {
  const size_t numel = dimension_.size();
  const size_t element_size = dty::SizeOf(dtype_);
  if (numel > std::numeric_limits<size_t>::max() / element_size) {
    return std::numeric_limits<size_t>::max();
  }
  return numel * element_size;
}

size_t Tensor::numel() const { return dimension_.size(); }

bool Tensor::operator==(const Tensor &rhs) const {
  if (dtype_ != rhs.dtype_ || dimension_ != rhs.dimension_) return false;
  if (this->size() == 0) return true;
  return std::memcmp(data_, rhs.data_, this->size()) == 0;
}

}  // namespace qconv
