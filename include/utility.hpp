#ifndef UTILITY_HPP
#define UTILITY_HPP

#include <string>
#include <vector>

#include "enums/error.hpp"
#include "tl/expected.hpp"

namespace qconv {

bool CheckFilePathReadable(const std::string &path);

bool CheckFilePathWritable(const std::string &path);

// "1,3,32,32" -> {1, 3, 32, 32}. Empty items, non-digits and zeros are
// rejected.
tl::expected<std::vector<size_t>, Error> ParseShape(const std::string &text);

}  // namespace qconv

#endif  // UTILITY_HPP
