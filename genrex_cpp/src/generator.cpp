#include "generator.hpp"

#include <iostream>

#include "error.hpp"
#include "token_generator.hpp"
#include "util.hpp"

namespace genrex {

void GeneratorConfig::validate() const {
  if (min_len > max_len) {
    throw GenrexError::invalid_config("min_len " + std::to_string(min_len) + " > max_len " + std::to_string(max_len));
  }
  if (max_attempts < 1) throw GenrexError::invalid_config("max_attempts must be at least 1");
}

Strategy parse_strategy(std::string_view name) {
  if (name == "default" || name == "auto") return Strategy::Auto;
  if (name == "token") return Strategy::Token;
  if (name == "legacy") return Strategy::Legacy;
  if (name == "rejection") return Strategy::Rejection;
  throw GenrexError::unsupported("unknown strategy: " + std::string(name));
}

RegexGenerator::RegexGenerator(std::string pattern,
                               GeneratorConfig config,
                               std::vector<Node> tokens,
                               std::optional<AstNode> legacy,
                               Validator validator,
                               std::mt19937_64 rng,
                               bool multiline)
    : pattern_(std::move(pattern)),
      config_(std::move(config)),
      tokens_(std::move(tokens)),
      legacy_(std::move(legacy)),
      validator_(std::move(validator)),
      rng_(rng),
      multiline_(multiline) {
  if (!tokens_.empty()) tree_ = Node::concatenation(tokens_);
}

GeneratorBuilder RegexGenerator::builder(std::string pattern) {
  return GeneratorBuilder(std::move(pattern));
}

std::optional<std::chrono::steady_clock::time_point> RegexGenerator::start_deadline() const {
  if (!config_.timeout) return std::nullopt;
  return std::chrono::steady_clock::now() + *config_.timeout;
}

bool RegexGenerator::next_attempt(Budget& budget) const {
  if (budget.attempts >= config_.max_attempts) return false;
  if (budget.deadline && std::chrono::steady_clock::now() >= *budget.deadline) {
    budget.timed_out = true;
    return false;
  }
  budget.attempts++;
  return true;
}

bool RegexGenerator::accept(const std::string& candidate, const char* tactic, size_t attempt) {
  if (candidate.size() < config_.min_len || candidate.size() > config_.max_len) {
    if (config_.verbose) {
      std::cerr << "[DEBUG] " << tactic << " attempt " << attempt << " rejected: length out of range (len="
                << candidate.size() << ", want [" << config_.min_len << "," << config_.max_len << "]) '"
                << preview_for_log(candidate) << "'\n";
    }
    return false;
  }
  if (!validator_.is_match(candidate)) {
    if (config_.verbose) {
      std::cerr << "[DEBUG] " << tactic << " attempt " << attempt << " rejected: validator mismatch '"
                << preview_for_log(candidate) << "'\n";
    }
    return false;
  }
  return true;
}

std::optional<std::string> RegexGenerator::run_token(Budget& budget) {
  while (next_attempt(budget)) {
    GenerationContext ctx(config_.max_repeat);
    std::string candidate;
    try {
      candidate = generate(*tree_, rng_, ctx);
      auto missing = ctx.resolve(candidate);
      if (!missing.empty() && config_.strict_backrefs) {
        throw GenrexError::backreference("group " + std::to_string(missing.front()) + " produced no text", true);
      }
    } catch (const GenrexError& e) {
      if (!e.retryable()) {
        if (config_.verbose) std::cerr << "[DEBUG] token attempt " << budget.attempts << " failed permanently: " << e.what() << "\n";
        throw;
      }
      if (config_.verbose) std::cerr << "[DEBUG] token attempt " << budget.attempts << " discarded: " << e.what() << "\n";
      continue;
    }
    if (accept(candidate, "token", budget.attempts)) return candidate;
  }
  return std::nullopt;
}

std::string RegexGenerator::run_legacy() {
  std::string candidate = generate_legacy(*legacy_, rng_, config_.max_repeat);
  if (!accept(candidate, "legacy", 1)) throw GenrexError::no_match();
  return candidate;
}

std::optional<std::string> RegexGenerator::run_rejection(Budget& budget) {
  std::uniform_int_distribution<size_t> len_dist(config_.min_len, config_.max_len);
  std::uniform_int_distribution<size_t> ch_dist(0, kAlphanumeric.size() - 1);
  while (next_attempt(budget)) {
    size_t len = len_dist(rng_);
    std::string candidate;
    candidate.reserve(len);
    for (size_t i = 0; i < len; i++) candidate.push_back(kAlphanumeric[ch_dist(rng_)]);
    if (accept(candidate, "rejection", budget.attempts)) return candidate;
  }
  return std::nullopt;
}

void RegexGenerator::exhausted(const Budget& budget) const {
  if (config_.verbose) {
    std::cerr << "[DEBUG] gave up after " << budget.attempts << " attempt(s)" << (budget.timed_out ? " (timeout)" : "") << "\n";
  }
  if (budget.timed_out) throw GenrexError::timeout();
  throw GenrexError::no_match();
}

std::string RegexGenerator::generate_one() {
  config_.validate();
  const auto deadline = start_deadline();
  if (tree_) {
    Budget budget{0, deadline};
    if (auto s = run_token(budget)) return *s;
    if (budget.timed_out) exhausted(budget);
    if (config_.verbose) {
      std::cerr << "[DEBUG] token tactic exhausted after " << budget.attempts << " attempt(s); trying rejection sampling\n";
    }
  }
  Budget budget{0, deadline};
  if (auto s = run_rejection(budget)) return *s;
  exhausted(budget);
}

std::vector<std::string> RegexGenerator::generate_n(size_t n) {
  std::vector<std::string> out;
  out.reserve(n);
  for (size_t i = 0; i < n; i++) out.push_back(generate_one());
  return out;
}

std::string RegexGenerator::generate_with_strategy(std::string_view name) {
  return generate_with_strategy(parse_strategy(name));
}

std::string RegexGenerator::generate_with_strategy(Strategy strategy) {
  if (strategy == Strategy::Auto) return generate_one();
  config_.validate();
  Budget budget{0, start_deadline()};
  switch (strategy) {
    case Strategy::Token:
      if (!tree_) throw GenrexError::unsupported("pattern has no token tree");
      if (auto s = run_token(budget)) return *s;
      break;
    case Strategy::Legacy:
      if (!legacy_) throw GenrexError::unsupported("pattern has no legacy tree");
      return run_legacy();
    case Strategy::Rejection:
      if (auto s = run_rejection(budget)) return *s;
      break;
    case Strategy::Auto:
      break;
  }
  exhausted(budget);
}

RegexGenerator& RegexGenerator::set_min_len(size_t n) {
  config_.min_len = n;
  return *this;
}

RegexGenerator& RegexGenerator::set_max_len(size_t n) {
  config_.max_len = n;
  return *this;
}

RegexGenerator& RegexGenerator::set_max_attempts(size_t n) {
  config_.max_attempts = (n < 1) ? 1 : n;
  return *this;
}

RegexGenerator& RegexGenerator::set_timeout(std::optional<std::chrono::milliseconds> t) {
  config_.timeout = t;
  return *this;
}

RegexGenerator& RegexGenerator::set_max_repeat(size_t n) {
  config_.max_repeat = n;
  return *this;
}

RegexGenerator& RegexGenerator::set_multiline(bool enabled) {
  multiline_ = enabled;
  return *this;
}

RegexGenerator& RegexGenerator::set_verbose(bool enabled) {
  config_.verbose = enabled;
  return *this;
}

GeneratorBuilder& GeneratorBuilder::config(GeneratorConfig c) {
  config_ = std::move(c);
  return *this;
}

GeneratorBuilder& GeneratorBuilder::seed(uint64_t s) {
  rng_ = std::mt19937_64(s);
  return *this;
}

GeneratorBuilder& GeneratorBuilder::rng(std::mt19937_64 r) {
  rng_ = r;
  return *this;
}

GeneratorBuilder& GeneratorBuilder::multiline(bool enabled) {
  multiline_ = enabled;
  return *this;
}

GeneratorBuilder& GeneratorBuilder::allow_backrefs(bool enabled) {
  allow_backrefs_ = enabled;
  return *this;
}

GeneratorBuilder& GeneratorBuilder::max_depth(size_t depth) {
  max_depth_ = depth;
  return *this;
}

RegexGenerator GeneratorBuilder::build() const {
  GeneratorConfig cfg = config_;
  if (cfg.max_attempts < 1) cfg.max_attempts = 1;
  cfg.validate();

  size_t next_group = 1;
  std::vector<Node> tokens = tokenize(pattern_, next_group, max_depth_);
  std::optional<AstNode> legacy = parse_legacy(tokens);
  if (cfg.verbose) {
    std::cerr << "[DEBUG] Tokenized '" << preview_for_log(pattern_) << "': top-level nodes=" << tokens.size()
              << " groups=" << (next_group - 1) << "\n";
  }

  std::optional<Validator> validator;
  try {
    validator = Validator::compile(pattern_);
  } catch (const GenrexError& e) {
    if (!allow_backrefs_) throw;
    if (cfg.verbose) std::cerr << "[WARN] Validator cannot compile pattern (" << e.what() << "); accepting all candidates\n";
    validator = Validator::accept_all();
  }

  std::mt19937_64 rng = rng_ ? *rng_ : std::mt19937_64((uint64_t)std::random_device{}());
  return RegexGenerator(pattern_, cfg, std::move(tokens), std::move(legacy), std::move(*validator), rng, multiline_);
}

}  // namespace genrex
