#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sesh::store {

enum class error_e {
  ENCODING = 1,
  COLLISION = 2,
  BACKEND = 3,
  INVALID_ARGUMENT = 4,
};

struct error_s {
  error_e code;
  std::string message;
};

const char *error_to_string(error_e code);

//! \brief Value or error returned by every store operation
//! \note  "Not found" is never an error, it is an empty optional value
template <typename T> class result_c {
public:
  result_c(T value) : value_(std::move(value)) {}
  result_c(error_s error) : error_(std::move(error)) {}

  result_c(const result_c &) = default;
  result_c &operator=(const result_c &) = default;
  result_c(result_c &&) noexcept = default;
  result_c &operator=(result_c &&) noexcept = default;

  bool is_error() const { return error_.has_value(); }
  bool is_success() const { return !error_.has_value(); }
  const error_s &error() const { return error_.value(); }
  const T &value() const { return value_.value(); }
  T &value() { return value_.value(); }
  T take() { return std::move(value_.value()); }

private:
  std::optional<error_s> error_;
  std::optional<T> value_;
};

class status_c {
public:
  status_c() = default;
  status_c(error_s error) : error_(std::move(error)) {}

  bool is_error() const { return error_.has_value(); }
  bool is_success() const { return !error_.has_value(); }
  const error_s &error() const { return error_.value(); }

private:
  std::optional<error_s> error_;
};

} // namespace sesh::store
