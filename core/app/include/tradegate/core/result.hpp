#pragma once

#include <string>
#include <utility>
#include <variant>

namespace tradegate {

// -----------------------------------------------------------------------------
// ErrorKind - failure taxonomy for broker capability calls
// -----------------------------------------------------------------------------
//
//   Connection  broker unreachable or not connected; never retried here.
//   Validation  request rejected before it reached the broker.
//   Execution   broker accepted the request but reported an error.
//   Data        missing or malformed market/account data.
//   Timeout     no reply within the configured request timeout.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Connection,
  Validation,
  Execution,
  Data,
  Timeout,
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Connection: return "ConnectionError";
    case ErrorKind::Validation: return "ValidationError";
    case ErrorKind::Execution:  return "ExecutionError";
    case ErrorKind::Data:       return "DataError";
    case ErrorKind::Timeout:    return "TimeoutError";
  }
  return "UnknownError";
}

struct Error {
  ErrorKind kind{ErrorKind::Execution};
  std::string message;
};

// -----------------------------------------------------------------------------
// Result<T> - tagged outcome of a capability call
// -----------------------------------------------------------------------------
//
// @brief  Holds either a value of type T or an Error. Callers check ok()
//         and decide their own fallback; nothing above the broker boundary
//         sees a raw library exception.
//
// @details
// Thin wrapper around std::variant<T, Error>. value() and error() throw
// std::bad_variant_access when called on the wrong alternative, so callers
// must branch on ok() first.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : data_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
  Result(Error error) : data_(std::move(error)) {}  // NOLINT(google-explicit-constructor)

  static Result failure(ErrorKind kind, std::string message) {
    return Result(Error{kind, std::move(message)});
  }

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<T>(data_); }
  T& value() { return std::get<T>(data_); }

  const Error& error() const { return std::get<Error>(data_); }

  T valueOr(T fallback) const {
    return ok() ? std::get<T>(data_) : std::move(fallback);
  }

 private:
  std::variant<T, Error> data_;
};

}  // namespace tradegate
