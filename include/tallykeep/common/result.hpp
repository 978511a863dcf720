#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tallykeep::common {

class Status {
public:
  static Status success() { return Status(Code::Ok, ""); }
  static Status error(std::string message) { return Status(Code::Error, std::move(message)); }
  // Cooperative shutdown, reported apart from operational errors.
  static Status cancelled(std::string reason = "cancelled") {
    return Status(Code::Cancelled, std::move(reason));
  }

  [[nodiscard]] bool ok() const { return code_ == Code::Ok; }
  [[nodiscard]] bool is_cancelled() const { return code_ == Code::Cancelled; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  enum class Code { Ok, Error, Cancelled };

  Status(Code code, std::string error) : code_(code), error_(std::move(error)) {}

  Code code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(bool ok, std::optional<T> value, std::string error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, ""); }
  static Result failure(std::string message) { return Result(false, std::move(message)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  std::string error_;
};

} // namespace tallykeep::common
