#ifndef NETWORK_DIMENSION_HPP
#define NETWORK_DIMENSION_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace qconv {

// Largest buffer a single tensor may own.
constexpr size_t kMaxTensorBytes = size_t{1} << 32;

// Element count of `dims` (0 for rank 0). false when the count overflows or
// the tensor would take more than kMaxTensorBytes at `element_size` bytes
// per element.
bool CheckedElementCount(const std::vector<size_t> &dims, size_t element_size,
                         size_t &count);

class Dimension {
 public:
  Dimension();
  Dimension(size_t n, size_t c, size_t h, size_t w);
  explicit Dimension(std::vector<size_t> dims);

  // n/c/h/w are only meaningful for rank 4, 0 otherwise
  size_t n() const;
  size_t c() const;
  size_t h() const;
  size_t w() const;

  size_t rank() const;
  std::string str() const;
  // element count, saturated at SIZE_MAX when the product overflows
  size_t size() const;

  void dims(std::vector<size_t> dims);
  const std::vector<size_t> &dims() const;
  size_t dims(size_t idx) const;

  bool operator==(const Dimension &rhs) const { return dims_ == rhs.dims_; }
  bool operator!=(const Dimension &rhs) const { return dims_ != rhs.dims_; }

 private:
  size_t AxisOrZero(size_t idx) const;
  std::vector<size_t> dims_;
};

}  // namespace qconv

#endif  // NETWORK_DIMENSION_HPP
