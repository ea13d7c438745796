#include "enums/error.hpp"

#include <ostream>
#include <string>
using std::string;

#include "glog/logging.h"
#include "tl/expected.hpp"

namespace qconv {

const char *NameOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::kConfigError:
      return "ConfigError";
    case ErrorCode::kShapeError:
      return "ShapeError";
    case ErrorCode::kUnsupportedDtype:
      return "UnsupportedDtype";
    case ErrorCode::kTypeMismatch:
      return "TypeMismatch";
    case ErrorCode::kStateError:
      return "StateError";
    case ErrorCode::kBackendError:
      return "BackendError";
    case ErrorCode::kFileReadError:
      return "FileReadError";
    case ErrorCode::kFileWriteError:
      return "FileWriteError";
    case ErrorCode::kArgumentsParsingError:
      return "ArgumentsParsingError";
  }
  LOG(FATAL) << "Undefined error code: " << static_cast<int>(code);
  return "";
}

std::ostream &operator<<(std::ostream &out, const Error &error) {
  return (out << NameOf(error.code) << ": " << error.message);
}

tl::unexpected<Error> MakeError(ErrorCode code, const string &message) {
  LOG(ERROR) << NameOf(code) << ": " << message;
  return tl::make_unexpected(Error{code, message});
}

}  // namespace qconv
