#ifndef ENUMS_ERROR_HPP
#define ENUMS_ERROR_HPP

#include <ostream>
#include <string>

#include "tl/expected.hpp"

namespace qconv {

enum class ErrorCode {
  kConfigError = 1,        // ConvConfig or calibration configuration is invalid
  kShapeError,             // Shape of tensor is invalid
  kUnsupportedDtype,       // Data type of tensor or observer is not supported
  kTypeMismatch,           // Float module does not match the expected type
  kStateError,             // Serialized state is missing or malformed
  kBackendError,           // Compute backend could not be created or failed
  kFileReadError,          // Failed to read file
  kFileWriteError,         // Failed to write file
  kArgumentsParsingError,  // Failed to parse Arguments, or is invalid
};

struct Error {
  ErrorCode code;
  std::string message;
};

const char *NameOf(ErrorCode code);

std::ostream &operator<<(std::ostream &out, const Error &error);

// Logs `message` and wraps it for returning from a tl::expected function.
tl::unexpected<Error> MakeError(ErrorCode code, const std::string &message);

}  // namespace qconv

#endif  // ENUMS_ERROR_HPP
