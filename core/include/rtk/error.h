#pragma once

#include <string>

namespace rtk {

enum class ErrorKind {
  None,
  Config,
  Auth,
  Transient,
  Api,
  Membership,
  Output,
  Interrupted
};

// Single error-result filled by every fallible step of a run. Only the CLI
// turns it into a process exit code.
struct RunError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  int http_status = 0;

  bool ok() const { return kind == ErrorKind::None; }
};

const char* error_kind_name(ErrorKind kind);
int exit_code_for(const RunError& error);

void set_error(RunError& error, ErrorKind kind, std::string message, int http_status = 0);
std::string describe(const RunError& error);

} // namespace rtk
