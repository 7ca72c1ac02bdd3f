#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "legacy_ast.hpp"
#include "token.hpp"
#include "token_context.hpp"
#include "tokenizer.hpp"
#include "validator.hpp"

namespace genrex {

struct GeneratorConfig {
  size_t min_len = 0;
  size_t max_len = 64;
  size_t max_attempts = 10000;
  std::optional<std::chrono::milliseconds> timeout;
  size_t max_repeat = kDefaultMaxRepeat;
  // Raise a retryable error when a back-reference names a group that
  // produced no text, instead of leaving it empty.
  bool strict_backrefs = false;
  bool verbose = false;

  // Throws GenrexError(InvalidConfig).
  void validate() const;
};

enum class Strategy { Auto, Token, Legacy, Rejection };

// Accepts "default", "auto", "token", "legacy", "rejection". Throws
// GenrexError(UnsupportedFeature) for anything else.
Strategy parse_strategy(std::string_view name);

class GeneratorBuilder;

// Samples strings for one pattern. generate_one walks the token tree and
// falls back to rejection sampling. The legacy tree is derived from the same
// token list, so it exists only when a token tree does; it runs only when
// forced through generate_with_strategy. Every candidate must fit
// [min_len, max_len] bytes and pass the validator. Not safe for concurrent use.
class RegexGenerator {
 public:
  static GeneratorBuilder builder(std::string pattern);

  // Throws GenrexError: NoMatch or Timeout when the budget runs out, or the
  // permanent node error that made the token tree unusable.
  std::string generate_one();
  std::vector<std::string> generate_n(size_t n);
  std::string generate_with_strategy(std::string_view name);
  std::string generate_with_strategy(Strategy strategy);

  RegexGenerator& set_min_len(size_t n);
  RegexGenerator& set_max_len(size_t n);
  RegexGenerator& set_max_attempts(size_t n);
  RegexGenerator& set_timeout(std::optional<std::chrono::milliseconds> t);
  RegexGenerator& set_max_repeat(size_t n);
  RegexGenerator& set_multiline(bool enabled);
  RegexGenerator& set_verbose(bool enabled);

  bool is_multiline() const { return multiline_; }
  const std::string& pattern() const { return pattern_; }
  const GeneratorConfig& config() const { return config_; }
  const std::vector<Node>& token_tree() const { return tokens_; }
  bool has_legacy_tree() const { return legacy_.has_value(); }
  const Validator& validator() const { return validator_; }
  const Validator::Stats& validator_stats() const { return validator_.stats(); }

 private:
  friend class GeneratorBuilder;

  // Attempt and wall-clock budget for one tactic; the deadline is shared by
  // every tactic of a call.
  struct Budget {
    size_t attempts = 0;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    bool timed_out = false;
  };

  RegexGenerator(std::string pattern,
                 GeneratorConfig config,
                 std::vector<Node> tokens,
                 std::optional<AstNode> legacy,
                 Validator validator,
                 std::mt19937_64 rng,
                 bool multiline);

  std::optional<std::chrono::steady_clock::time_point> start_deadline() const;
  bool next_attempt(Budget& budget) const;
  bool accept(const std::string& candidate, const char* tactic, size_t attempt);

  std::optional<std::string> run_token(Budget& budget);
  std::string run_legacy();
  std::optional<std::string> run_rejection(Budget& budget);
  [[noreturn]] void exhausted(const Budget& budget) const;

  std::string pattern_;
  GeneratorConfig config_;
  std::vector<Node> tokens_;
  std::optional<Node> tree_;
  std::optional<AstNode> legacy_;
  Validator validator_;
  std::mt19937_64 rng_;
  bool multiline_ = false;
};

class GeneratorBuilder {
 public:
  explicit GeneratorBuilder(std::string pattern) : pattern_(std::move(pattern)) {}

  GeneratorBuilder& config(GeneratorConfig c);
  GeneratorBuilder& seed(uint64_t s);
  GeneratorBuilder& rng(std::mt19937_64 r);
  GeneratorBuilder& multiline(bool enabled = true);
  // Falls back to an accept-all validator when RE2 refuses the pattern
  // (for example because it uses back-references).
  GeneratorBuilder& allow_backrefs(bool enabled = true);
  GeneratorBuilder& max_depth(size_t depth);

  // Throws GenrexError: InvalidPattern (validator or nesting budget) or
  // InvalidConfig.
  RegexGenerator build() const;

 private:
  std::string pattern_;
  GeneratorConfig config_;
  std::optional<std::mt19937_64> rng_;
  bool multiline_ = false;
  bool allow_backrefs_ = false;
  size_t max_depth_ = kDefaultMaxDepth;
};

}  // namespace genrex
