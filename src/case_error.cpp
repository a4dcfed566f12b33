#include "case_error.h"

const char* ErrorKindToken(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "none";
    case ErrorKind::Configuration:
      return "configuration";
    case ErrorKind::InvalidCase:
      return "invalid_case";
    case ErrorKind::IO:
      return "io";
    case ErrorKind::DuplicateJob:
      return "duplicate_job";
    case ErrorKind::Launch:
      return "launch";
    case ErrorKind::Decode:
      return "decode";
    case ErrorKind::ProcessFailure:
      return "process_failure";
    case ErrorKind::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

CaseError MakeError(ErrorKind kind, const std::string& message) {
  CaseError error;
  error.kind = kind;
  error.message = message;
  return error;
}

std::string DescribeError(const CaseError& error) {
  if (error.ok()) {
    return "ok";
  }
  std::string text = std::string(ErrorKindToken(error.kind)) + ": " + error.message;
  if (error.kind == ErrorKind::ProcessFailure) {
    text += " (exit code " + std::to_string(error.exit_code) + ")";
  }
  return text;
}
