#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace warden::common {

enum class ErrorCode {
  None,
  PathTraversal,
  SymlinkEscape,
  NotFound,
  ReadBeforeWriteRequired,
  NoOpEdit,
  NoMatch,
  AmbiguousMatch,
  IntegrityError,
  BatchFailed,
  Disallowed,
  DestructiveRefused,
  TimedOut,
  NotText,
  CapExceeded,
  InvalidArgument,
  Io,
};

[[nodiscard]] std::string_view to_string(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::Io;
  std::string message;
  // AmbiguousMatch: number of candidate spans.
  std::size_t match_count = 0;
  // BatchFailed: 1-based position of the failing edit and its own cause.
  std::size_t batch_index = 0;
  ErrorCode inner = ErrorCode::None;
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message) {
  Error error;
  error.code = code;
  error.message = std::move(message);
  return error;
}

class Status {
public:
  static Status success() { return Status(true, Error{.code = ErrorCode::None}); }
  static Status error(std::string message) {
    return Status(false, make_error(ErrorCode::Io, std::move(message)));
  }
  static Status error(ErrorCode code, std::string message) {
    return Status(false, make_error(code, std::move(message)));
  }
  static Status error(Error error) { return Status(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }
  [[nodiscard]] const Error &detail() const { return error_; }

private:
  Status(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), Error{.code = ErrorCode::None});
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, make_error(ErrorCode::Io, std::move(message)));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(false, std::nullopt, make_error(code, std::move(message)));
  }
  static Result failure(Error error) { return Result(false, std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorCode code() const { return error_.code; }
  [[nodiscard]] const Error &detail() const { return error_; }

private:
  Result(bool ok, std::optional<T> value, Error error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  Error error_;
};

} // namespace warden::common
