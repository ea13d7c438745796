#ifndef BACKENDS_PACKED_WEIGHT_HPP
#define BACKENDS_PACKED_WEIGHT_HPP

#include <string>

namespace qconv {
namespace backends {

// Opaque, backend specific weight layout. Only the backend that produced it
// can read it back, and it is never written to persistent state.
class PackedWeight {
 public:
  PackedWeight() = default;
  PackedWeight(const PackedWeight &) = delete;
  PackedWeight &operator=(const PackedWeight &) = delete;
  virtual ~PackedWeight() {}

  virtual const std::string &backend_name() const = 0;
};

}  // namespace backends
}  // namespace qconv

#endif  // BACKENDS_PACKED_WEIGHT_HPP
