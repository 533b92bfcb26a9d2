#include "fdv/errors.hpp"

namespace fdv {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Format: return "FormatError";
    case ErrorKind::Classification: return "ClassificationError";
    case ErrorKind::Validation: return "ValidationError";
    case ErrorKind::Geometry: return "GeometryError";
    case ErrorKind::IO: return "IOError";
    case ErrorKind::Internal: return "InternalError";
  }
  return "InternalError";
}

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::EmptyOrMalformed: return "EmptyOrMalformed";
    case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
    case ErrorCode::InconsistentInterval: return "InconsistentInterval";
    case ErrorCode::AmbiguousColumns: return "AmbiguousColumns";
    case ErrorCode::EmptyField: return "EmptyField";
    case ErrorCode::InvalidTimestamp: return "InvalidTimestamp";
    case ErrorCode::InvalidTimeRange: return "InvalidTimeRange";
    case ErrorCode::UnknownChannel: return "UnknownChannel";
    case ErrorCode::NoRainfallData: return "NoRainfallData";
    case ErrorCode::NoFileLoaded: return "NoFileLoaded";
    case ErrorCode::UnsupportedMonitorType: return "UnsupportedMonitorType";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::InvalidDescriptor: return "InvalidDescriptor";
    case ErrorCode::SolverFailed: return "SolverFailed";
    case ErrorCode::ReadFailed: return "ReadFailed";
    case ErrorCode::WriteFailed: return "WriteFailed";
    case ErrorCode::OutputDirUnwritable: return "OutputDirUnwritable";
    case ErrorCode::Internal: return "Internal";
  }
  return "Internal";
}

ErrorInfo to_error_info(const Error& e) {
  ErrorInfo info;
  info.kind = e.kind();
  info.code = e.code();
  info.message = e.what();
  return info;
}

std::string describe_error(const ErrorInfo& e) {
  return std::string(error_kind_name(e.kind)) + "/" + error_code_name(e.code) + ": " + e.message;
}

} // namespace fdv
