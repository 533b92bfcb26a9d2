#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fdv {

// Error families reported by the engine.
enum class ErrorKind {
  Format,          // unreadable or malformed input
  Classification,  // ambiguous or inconsistent channel detection
  Validation,      // invalid field values, unknown channel references
  Geometry,        // malformed or solver-failing geometry descriptor
  IO,              // filesystem read/write failure
  Internal,        // anything else (should not happen)
};

enum class ErrorCode {
  EmptyOrMalformed,
  UnsupportedFormat,

  InconsistentInterval,
  AmbiguousColumns,

  EmptyField,
  InvalidTimestamp,
  InvalidTimeRange,
  UnknownChannel,
  NoRainfallData,
  NoFileLoaded,
  UnsupportedMonitorType,
  InvalidArgument,

  InvalidDescriptor,
  SolverFailed,

  ReadFailed,
  WriteFailed,
  OutputDirUnwritable,

  Internal,
};

const char* error_kind_name(ErrorKind kind);
const char* error_code_name(ErrorCode code);

// Base class of all exceptions thrown by the fdv library.
//
// what() returns the human-readable message; kind() and code() identify the
// failure for callers that need to branch on it.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, ErrorCode code, const std::string& message)
    : std::runtime_error(message), kind_(kind), code_(code) {}

  ErrorKind kind() const { return kind_; }
  ErrorCode code() const { return code_; }

private:
  ErrorKind kind_;
  ErrorCode code_;
};

class FormatError : public Error {
public:
  FormatError(ErrorCode code, const std::string& message)
    : Error(ErrorKind::Format, code, message) {}
};

class ClassificationError : public Error {
public:
  ClassificationError(ErrorCode code, const std::string& message)
    : Error(ErrorKind::Classification, code, message) {}
};

class ValidationError : public Error {
public:
  ValidationError(ErrorCode code, const std::string& message)
    : Error(ErrorKind::Validation, code, message) {}
};

class GeometryError : public Error {
public:
  GeometryError(ErrorCode code, const std::string& message)
    : Error(ErrorKind::Geometry, code, message) {}
};

class IOError : public Error {
public:
  IOError(ErrorCode code, const std::string& message)
    : Error(ErrorKind::IO, code, message) {}
};

// Plain-value description of a failure, used where exceptions must not cross
// (command surface results, batch summaries).
struct ErrorInfo {
  ErrorKind kind{ErrorKind::Internal};
  ErrorCode code{ErrorCode::Internal};
  std::string message;
};

ErrorInfo to_error_info(const Error& e);

// "Validation/UnknownChannel: message"
std::string describe_error(const ErrorInfo& e);

// Typed success-or-error result returned by fdv::Engine.
template <class T>
struct Result {
  bool ok{false};
  T value{};
  ErrorInfo error;

  static Result success(T v) {
    Result r;
    r.ok = true;
    r.value = std::move(v);
    return r;
  }

  static Result failure(ErrorInfo e) {
    Result r;
    r.ok = false;
    r.error = std::move(e);
    return r;
  }

  explicit operator bool() const { return ok; }
};

} // namespace fdv
