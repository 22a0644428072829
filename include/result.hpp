#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace hookrelay {

struct Error {
  int code{0};
  std::string what;
  // HTTP status of the reply that produced the error, 0 when none.
  int http_status{0};
};

inline Error make_error(int code, std::string what, int http_status = 0) {
  Error err;
  err.code = code;
  err.what = std::move(what);
  err.http_status = http_status;
  return err;
}

inline std::ostream &operator<<(std::ostream &os, const Error &err) {
  os << "Error(" << err.code;
  if (err.http_status != 0) {
    os << ", http " << err.http_status;
  }
  os << "): " << err.what;
  return os;
}

template <typename T> class Result {
public:
  static Result Ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }
  static Result Err(Error error) {
    return Result(std::in_place_index<1>, std::move(error));
  }

  bool is_ok() const { return data_.index() == 0; }
  bool is_err() const { return data_.index() == 1; }

  T &value() { return std::get<0>(data_); }
  const T &value() const { return std::get<0>(data_); }
  Error &error() { return std::get<1>(data_); }
  const Error &error() const { return std::get<1>(data_); }

private:
  template <std::size_t I, typename Arg>
  Result(std::in_place_index_t<I> tag, Arg &&arg)
      : data_(tag, std::forward<Arg>(arg)) {}

  std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
  static Result Ok() { return Result(); }
  static Result Err(Error error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  bool is_ok() const { return !error_.has_value(); }
  bool is_err() const { return error_.has_value(); }

  Error &error() { return *error_; }
  const Error &error() const { return *error_; }

private:
  std::optional<Error> error_;
};

using VoidResult = Result<void>;

} // namespace hookrelay
