#ifndef ARGUMENTS_HPP
#define ARGUMENTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "enums/error.hpp"
#include "tl/expected.hpp"

namespace qconv {

class Arguments {
 public:
  tl::expected<void, Error> CheckArguments();

  void state_path(std::string value) { state_path_ = value; }
  const std::string &state_path() const { return state_path_; }
  void backend(std::string value) { backend_ = value; }
  const std::string &backend() const { return backend_; }
  void do_run(bool value) { do_run_ = value; }
  bool do_run() const { return do_run_; }
  void input_shape(std::optional<std::vector<size_t>> value) {
    input_shape_ = value;
  }
  const std::optional<std::vector<size_t>> &input_shape() const {
    return input_shape_;
  }
  void input_dtype(std::string value) { input_dtype_ = value; }
  const std::string &input_dtype() const { return input_dtype_; }
  void input_scale(double value) { input_scale_ = value; }
  double input_scale() const { return input_scale_; }
  void input_zero_point(int64_t value) { input_zero_point_ = value; }
  int64_t input_zero_point() const { return input_zero_point_; }
  void dump_path(std::optional<std::string> value) { dump_path_ = value; }
  const std::optional<std::string> &dump_path() const { return dump_path_; }

 private:
  tl::expected<void, Error> CheckRunArguments();
  template <typename T>
  tl::expected<void, Error> CheckArgExist(const std::string &option_name,
                                          const std::optional<T> &argument,
                                          const std::string &msg);
  template <typename T>
  tl::expected<void, Error> CheckArgInList(const std::string &option_name,
                                           const T &argument,
                                           const std::vector<T> &valid_args);
  tl::expected<void, Error> CheckStringFilePathReadable(
      const std::string &option_name, const std::string &path);
  tl::expected<void, Error> CheckStringFilePathWritable(
      const std::string &option_name, const std::string &path);

  std::string state_path_;
  std::string backend_ = "cpu";
  bool do_run_ = false;
  std::optional<std::vector<size_t>> input_shape_;
  std::string input_dtype_ = "quint8";
  double input_scale_ = 1.0;
  int64_t input_zero_point_ = 0;
  std::optional<std::string> dump_path_;
};

}  // namespace qconv

#endif  // ARGUMENTS_HPP
