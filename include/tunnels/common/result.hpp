#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tunnels::common {

enum class ErrorKind {
  None,
  Usage,
  Config,
  Spawn,
  Signal,
  Io,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Usage:
    return "usage";
  case ErrorKind::Config:
    return "config";
  case ErrorKind::Spawn:
    return "spawn";
  case ErrorKind::Signal:
    return "signal";
  case ErrorKind::Io:
    return "io";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message) { return Status(ErrorKind::Io, std::move(message)); }
  static Status error(ErrorKind kind, std::string message) {
    return Status(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorKind::Io, std::nullopt, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(kind, std::nullopt, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(status.kind(), std::nullopt, status.error());
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace tunnels::common
