#include "demo-microservice/result.h"

namespace demo {

std::string_view error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "success";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::ConfigNotFound:
    return "config_not_found";
  case ErrorCode::ConfigParseError:
    return "config_parse_error";
  case ErrorCode::SocketError:
    return "socket_error";
  case ErrorCode::BindError:
    return "bind_error";
  case ErrorCode::Unknown:
    break;
  }
  return "unknown";
}

} // namespace demo
