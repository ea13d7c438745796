#include "backends/conv_backend.hpp"

#include <memory>
#include <string>

#include "enums/error.hpp"
#include "factory.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace backends {

tl::expected<std::shared_ptr<const ConvBackend>, Error> CreateConvBackend(
    const std::string &name) {
  std::shared_ptr<const ConvBackend> p_backend =
      Factory<ConvBackend>::CreateInstance(name);
  if (p_backend == nullptr) {
    return MakeError(ErrorCode::kBackendError,
                     "Failed to create backend: " + name);
  }
  return p_backend;
}

}  // namespace backends
}  // namespace qconv
