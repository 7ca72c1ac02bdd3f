#include "error.hpp"

namespace genrex {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidPattern: return "invalid pattern";
    case ErrorKind::InvalidConfig: return "invalid config";
    case ErrorKind::NoMatch: return "no match";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::UnsupportedFeature: return "unsupported feature";
    case ErrorKind::Backreference: return "backreference error";
    case ErrorKind::Internal: return "internal error";
  }
  return "unknown error";
}

static std::string with_kind(ErrorKind kind, const std::string& msg) {
  if (msg.empty()) return error_kind_name(kind);
  return std::string(error_kind_name(kind)) + ": " + msg;
}

GenrexError::GenrexError(ErrorKind kind, const std::string& msg, bool retryable)
    : std::runtime_error(with_kind(kind, msg)), kind_(kind), retryable_(retryable) {}

GenrexError GenrexError::invalid_pattern(const std::string& msg) {
  return GenrexError(ErrorKind::InvalidPattern, msg);
}

GenrexError GenrexError::invalid_config(const std::string& msg) {
  return GenrexError(ErrorKind::InvalidConfig, msg);
}

GenrexError GenrexError::no_match() {
  return GenrexError(ErrorKind::NoMatch, "no match found within constraints");
}

GenrexError GenrexError::timeout() {
  return GenrexError(ErrorKind::Timeout, "timeout reached during generation");
}

GenrexError GenrexError::unsupported(const std::string& what) {
  return GenrexError(ErrorKind::UnsupportedFeature, what);
}

GenrexError GenrexError::backreference(const std::string& msg, bool retryable) {
  return GenrexError(ErrorKind::Backreference, msg, retryable);
}

GenrexError GenrexError::internal(const std::string& msg) {
  return GenrexError(ErrorKind::Internal, msg);
}

}  // namespace genrex
