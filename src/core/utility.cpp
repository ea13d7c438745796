#include "utility.hpp"

#include <cctype>
#include <filesystem>
using std::filesystem::current_path;
using std::filesystem::path;

#include <fstream>
using std::ifstream;
using std::ofstream;

#include <sstream>
#include <string>
using std::string;

#include <vector>
using std::vector;

#include "enums/error.hpp"
#include "tl/expected.hpp"
using tl::expected;

namespace qconv {

bool CheckFilePathReadable(const string &file_path) {
  path absolute_path = current_path() / file_path;
  ifstream file;
  file.open(absolute_path.string().c_str());
  if (file.fail()) {
    file.close();
    return false;
  } else {
    file.close();
    return true;
  }
}

bool CheckFilePathWritable(const string &file_path) {
  path absolute_path = current_path() / file_path;
  ofstream file;
  file.open(absolute_path.string().c_str(), std::ios::app);
  if (file.fail()) {
    file.close();
    return false;
  } else {
    file.close();
    return true;
  }
}

expected<vector<size_t>, Error> ParseShape(const string &text) {
  vector<size_t> dims;
  std::stringstream ss(text);
  string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty() || item.size() > 9) {
      return MakeError(ErrorCode::kArgumentsParsingError,
                       "Invalid shape item in `" + text + "`");
    }
    for (char ch : item) {
      if (!std::isdigit(static_cast<unsigned char>(ch))) {
        return MakeError(ErrorCode::kArgumentsParsingError,
                         "Invalid shape item in `" + text + "`: " + item);
      }
    }
    const size_t dim = std::stoul(item);
    if (dim == 0) {
      return MakeError(ErrorCode::kArgumentsParsingError,
                       "Shape `" + text + "` has a zero extent");
    }
    dims.push_back(dim);
  }
  if (dims.empty()) {
    return MakeError(ErrorCode::kArgumentsParsingError,
                     "Shape `" + text + "` is empty");
  }
  return dims;
}

}  // namespace qconv
