#include "rtk/error.h"

#include <utility>

namespace rtk {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Config: return "config";
    case ErrorKind::Auth: return "auth";
    case ErrorKind::Transient: return "transient";
    case ErrorKind::Api: return "api";
    case ErrorKind::Membership: return "membership";
    case ErrorKind::Output: return "output";
    case ErrorKind::Interrupted: return "interrupted";
  }
  return "unknown";
}

int exit_code_for(const RunError& error) {
  return error.ok() ? 0 : 2;
}

void set_error(RunError& error, ErrorKind kind, std::string message, int http_status) {
  error.kind = kind;
  error.message = std::move(message);
  error.http_status = http_status;
}

std::string describe(const RunError& error) {
  std::string out = std::string(error_kind_name(error.kind)) + " error: " + error.message;
  if (error.http_status != 0) {
    out += " (HTTP " + std::to_string(error.http_status) + ")";
  }
  return out;
}

} // namespace rtk
