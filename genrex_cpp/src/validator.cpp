#include "validator.hpp"

#include <re2/re2.h>

#include <chrono>
#include <utility>

#include "error.hpp"

namespace genrex {

Validator::Validator(std::unique_ptr<re2::RE2> re) : re_(std::move(re)) {}

Validator::Validator(Validator&&) noexcept = default;
Validator& Validator::operator=(Validator&&) noexcept = default;
Validator::~Validator() = default;

Validator Validator::compile(const std::string& pattern) {
  RE2::Options opts;
  opts.set_log_errors(false);
  auto re = std::make_unique<re2::RE2>(pattern, opts);
  if (!re->ok()) throw GenrexError::invalid_pattern(re->error());
  return Validator(std::move(re));
}

Validator Validator::accept_all() {
  return Validator(nullptr);
}

bool Validator::is_match(std::string_view candidate) const {
  const auto t0 = std::chrono::steady_clock::now();
  bool ok = true;
  if (re_) ok = RE2::PartialMatch(re2::StringPiece(candidate.data(), candidate.size()), *re_);
  stats_.total++;
  if (ok) {
    stats_.accepted++;
  } else {
    stats_.rejected++;
  }
  const auto t1 = std::chrono::steady_clock::now();
  stats_.seconds_total += std::chrono::duration<double>(t1 - t0).count();
  return ok;
}

}  // namespace genrex
