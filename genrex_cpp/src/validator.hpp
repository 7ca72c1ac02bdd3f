#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
}

namespace genrex {

// Membership oracle for generated candidates. Backed by RE2, or accepts
// everything when RE2 cannot compile the pattern and the caller tolerates that.
class Validator {
 public:
  struct Stats {
    uint64_t total = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    double seconds_total = 0.0;
  };

  // Throws GenrexError(InvalidPattern) carrying RE2's error text.
  static Validator compile(const std::string& pattern);
  static Validator accept_all();

  Validator(Validator&&) noexcept;
  Validator& operator=(Validator&&) noexcept;
  ~Validator();

  // Unanchored search; anchors in the pattern make it a full match.
  bool is_match(std::string_view candidate) const;

  bool permissive() const { return re_ == nullptr; }
  const Stats& stats() const { return stats_; }

 private:
  explicit Validator(std::unique_ptr<re2::RE2> re);

  std::unique_ptr<re2::RE2> re_;
  mutable Stats stats_;
};

}  // namespace genrex
