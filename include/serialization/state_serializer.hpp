#ifndef SERIALIZATION_STATE_SERIALIZER_HPP
#define SERIALIZATION_STATE_SERIALIZER_HPP

#include <string>

#include "enums/error.hpp"
#include "nn/state.hpp"
#include "tl/expected.hpp"

namespace qconv {
namespace serialization {

// Protobuf encoding of a ConvState (ConvStateProto). Only portable tensors
// are written; nothing backend specific ever reaches the bytes.
tl::expected<std::string, Error> SerializeState(const nn::ConvState &state);

// Missing weight, scale or zero_point, or malformed pairs, are kStateError.
tl::expected<nn::ConvState, Error> ParseState(const std::string &bytes);

tl::expected<void, Error> WriteStateFile(const nn::ConvState &state,
                                         const std::string &path);
tl::expected<nn::ConvState, Error> ReadStateFile(const std::string &path);

}  // namespace serialization
}  // namespace qconv

#endif  // SERIALIZATION_STATE_SERIALIZER_HPP
