#pragma once

// sextant/errors.hpp — Error taxonomy shared by orchestrator and workers.
//
// ERROR CLASSES:
//   transport     — connection/delivery/codec failures. The transport's own
//                   redelivery handles them; the core only logs.
//   resolution    — unresolved secret or service references. Fatal in strict
//                   mode, aggregated warning plus partial result otherwise.
//   stage         — anything thrown by a stage handler. Always caught at the
//                   endpoint loop and turned into a WorkerError result.
//   run_not_found — fatal for the single job, reported as a failure result.
//
// Exceptions carry an ErrorCode so logs and failure results can be grouped
// without parsing messages. Validation steps that may fail per item return
// Result<T> so callers handle both branches explicitly.

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace sextant {

enum class ErrorCode {
  none,
  run_not_found,
  hierarchy_not_found,
  environment_config_invalid,
  secret_unresolved,
  config_file_missing,
  transport_failed,
  codec_failed,
  stage_failed,
  cancelled,
};

std::string to_string(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class RunNotFoundError : public Error {
 public:
  explicit RunNotFoundError(const std::string& message)
      : Error(ErrorCode::run_not_found, message) {}
};

class EnvironmentConfigError : public Error {
 public:
  explicit EnvironmentConfigError(const std::string& message)
      : Error(ErrorCode::environment_config_invalid, message) {}
};

class SecretResolutionError : public Error {
 public:
  explicit SecretResolutionError(const std::string& message)
      : Error(ErrorCode::secret_unresolved, message) {}
};

class ConfigFileError : public Error {
 public:
  explicit ConfigFileError(const std::string& message)
      : Error(ErrorCode::config_file_missing, message) {}
};

class TransportError : public Error {
 public:
  explicit TransportError(const std::string& message, ErrorCode code = ErrorCode::transport_failed)
      : Error(code, message) {}
};

// ---------------------------------------------------------------------------
// Failure / Result<T>
// ---------------------------------------------------------------------------
// Structured diagnostic for per-item validation. Result<T> holds exactly one
// of a value or a Failure; accessing the wrong branch throws.
struct Failure {
  ErrorCode code{ErrorCode::none};
  std::string message;
};

template <typename T>
class Result {
 public:
  Result(T value) : v_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
  Result(Failure failure) : v_(std::move(failure)) {}  // NOLINT(google-explicit-constructor)

  static Result failure(ErrorCode code, std::string message) {
    return Result(Failure{code, std::move(message)});
  }

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& {
    if (!ok()) throw Error(error().code, error().message);
    return std::get<T>(v_);
  }
  T&& value() && {
    if (!ok()) throw Error(error().code, error().message);
    return std::get<T>(std::move(v_));
  }

  const Failure& error() const { return std::get<Failure>(v_); }

  // Chain a step that can itself fail; failures pass through untouched.
  template <typename F>
  auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
    if (!ok()) return error();
    return f(std::get<T>(v_));
  }

 private:
  std::variant<T, Failure> v_;
};

}  // namespace sextant
