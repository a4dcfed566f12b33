#ifndef CASE_ERROR_H
#define CASE_ERROR_H

#include <stdexcept>
#include <string>

enum class ErrorKind {
  None,
  Configuration,
  InvalidCase,
  IO,
  DuplicateJob,
  Launch,
  Decode,
  ProcessFailure,
  Cancelled,
};

// Error payload carried by result structs and out-parameters.
struct CaseError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  int exit_code = 0;  // Only meaningful for ProcessFailure.

  bool ok() const { return kind == ErrorKind::None; }
};

// Missing or conflicting service registration. Programming error, surfaced
// immediately at startup.
class ConfigurationError : public std::logic_error {
 public:
  explicit ConfigurationError(const std::string& message) : std::logic_error(message) {}
};

const char* ErrorKindToken(ErrorKind kind);
CaseError MakeError(ErrorKind kind, const std::string& message);
std::string DescribeError(const CaseError& error);

#endif  // CASE_ERROR_H
