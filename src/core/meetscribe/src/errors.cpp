#include "meetscribe/errors.hpp"

using namespace std;


namespace meetscribe
{

string error_code_string(ErrorCode code)
{
  switch (code) {
    case ErrorCode::NONE:
      return "NONE";
    case ErrorCode::CAPABILITY_UNSUPPORTED:
      return "CAPABILITY_UNSUPPORTED";
    case ErrorCode::CAPACITY_EXCEEDED:
      return "CAPACITY_EXCEEDED";
    case ErrorCode::INVALID_STATE_TRANSITION:
      return "INVALID_STATE_TRANSITION";
    case ErrorCode::SESSION_NOT_FOUND:
      return "SESSION_NOT_FOUND";
    case ErrorCode::SESSION_TERMINATED:
      return "SESSION_TERMINATED";
    case ErrorCode::SUBPROCESS_ERROR:
      return "SUBPROCESS_ERROR";
    case ErrorCode::NETWORK_ERROR:
      return "NETWORK_ERROR";
    case ErrorCode::PROFILE_NOT_FOUND:
      return "PROFILE_NOT_FOUND";
    case ErrorCode::INSUFFICIENT_ENROLLMENT:
      return "INSUFFICIENT_ENROLLMENT";
    case ErrorCode::AUDIO_FORMAT_ERROR:
      return "AUDIO_FORMAT_ERROR";
    case ErrorCode::INVALID_INPUT:
      return "INVALID_INPUT";
    case ErrorCode::PROTOCOL_VIOLATION:
      return "PROTOCOL_VIOLATION";
    case ErrorCode::INTERNAL_ERROR:
      return "INTERNAL_ERROR";
    default:
      return "INTERNAL_ERROR";
  }
}

Status make_error(ErrorCode code, const string & message, const string & details)
{
  Status out;
  out.ok = false;
  out.code = code;
  out.error = message;
  out.details = details;
  return out;
}

Status unsupported_operation(const string & provider, const string & operation)
{
  return make_error(
    ErrorCode::CAPABILITY_UNSUPPORTED,
    provider + " does not support " + operation);
}

}  // namespace meetscribe
