#pragma once

#include <stdexcept>
#include <string>

namespace genrex {

enum class ErrorKind {
  InvalidPattern,
  InvalidConfig,
  NoMatch,
  Timeout,
  UnsupportedFeature,
  Backreference,
  Internal,
};

const char* error_kind_name(ErrorKind kind);

// The only exception type thrown by the library. `retryable` tells the
// attempt loop whether another attempt could succeed where this one failed.
class GenrexError : public std::runtime_error {
 public:
  GenrexError(ErrorKind kind, const std::string& msg, bool retryable = false);

  ErrorKind kind() const { return kind_; }
  bool retryable() const { return retryable_; }

  static GenrexError invalid_pattern(const std::string& msg);
  static GenrexError invalid_config(const std::string& msg);
  static GenrexError no_match();
  static GenrexError timeout();
  static GenrexError unsupported(const std::string& what);
  static GenrexError backreference(const std::string& msg, bool retryable = false);
  static GenrexError internal(const std::string& msg);

 private:
  ErrorKind kind_;
  bool retryable_;
};

}  // namespace genrex
