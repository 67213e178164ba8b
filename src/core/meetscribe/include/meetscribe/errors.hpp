#pragma once

#include <string>

namespace meetscribe
{

enum class ErrorCode
{
  NONE,
  CAPABILITY_UNSUPPORTED,
  CAPACITY_EXCEEDED,
  INVALID_STATE_TRANSITION,
  SESSION_NOT_FOUND,
  SESSION_TERMINATED,
  SUBPROCESS_ERROR,
  NETWORK_ERROR,
  PROFILE_NOT_FOUND,
  INSUFFICIENT_ENROLLMENT,
  AUDIO_FORMAT_ERROR,
  INVALID_INPUT,
  PROTOCOL_VIOLATION,
  INTERNAL_ERROR
};

/// Stable machine-readable code, e.g. "CAPACITY_EXCEEDED"
std::string error_code_string(ErrorCode code);

struct Status
{
  bool ok = true;
  ErrorCode code = ErrorCode::NONE;
  std::string error;
  /// Diagnostics such as a captured stderr or an HTTP body. Only exposed to
  /// API clients when diagnostics are enabled.
  std::string details;
};

Status make_error(ErrorCode code, const std::string & message, const std::string & details = "");

/// Failure for an operation outside the provider's capability set
Status unsupported_operation(const std::string & provider, const std::string & operation);

}  // namespace meetscribe
