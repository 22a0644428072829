#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int UNAUTHORIZED = 5018;  // Unauthorized
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int JSON_PARSE_ERROR = 5021;  // JSON parse error
constexpr int FORBIDDEN = 5022;  // Forbidden
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_HANDSHAKE_ERROR = 5205;  // SSL handshake error
constexpr int PROXY_ERROR = 5206;  // Proxy tunnel refused
}  // namespace NETWORK

namespace LISTEN {  // Listen errors

constexpr int SOURCE_NOT_FOUND = 10000;  // Source missing and not creatable
constexpr int INVALID_SOURCE_NAME = 10001;  // Source name not allowed
constexpr int CONNECTION_AMBIGUOUS = 10002;  // --path with several connections
constexpr int API_ERROR = 10003;  // Non-2xx reply from the REST API
constexpr int SESSION_CREATE_FAILED = 10004;  // CLI session refused
constexpr int CONTROL_CHANNEL_FATAL = 10005;  // Reconnect attempts exhausted
}  // namespace LISTEN

// Configuration and argument errors terminate with exit status 2, every
// other startup failure with 1.
inline int exit_code_for(int code) {
  switch (code) {
  case GENERAL::INVALID_ARGUMENT:
  case GENERAL::SHOW_OPT_DESC:
  case LISTEN::SOURCE_NOT_FOUND:
  case LISTEN::INVALID_SOURCE_NAME:
  case LISTEN::CONNECTION_AMBIGUOUS:
    return 2;
  default:
    return 1;
  }
}

}  // namespace my_errors
