#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace genrex {

constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

// Alphabet for wildcards and rejection sampling.
constexpr std::string_view kAlphanumeric =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// Class members and literals are single characters held as UTF-8 strings.
std::vector<std::string> digit_chars();
std::vector<std::string> word_chars();
std::vector<std::string> space_chars();

// One node of the token tree. Immutable once the tokenizer hands it out.
// Quantifier, Group and NonCapturingGroup keep the wrapped node in children[0].
struct Node {
  enum class Kind {
    Literal,
    Class,
    NegatedClass,
    Concatenation,
    Alternation,
    Quantifier,
    Group,
    NonCapturingGroup,
    Backreference,
    AnchorStart,
    AnchorEnd,
    WordBoundary,
    Wildcard,
  };

  Kind kind = Kind::Literal;
  std::string ch;
  std::vector<std::string> chars;
  std::vector<Node> children;
  size_t min = 0;
  size_t max = 0;
  bool greedy = true;
  size_t group = 0;  // Group identity, or the index a Backreference points at

  const Node& inner() const { return children.front(); }

  static Node literal(char c);
  static Node literal(std::string c);
  static Node char_class(std::vector<std::string> members);
  static Node negated_class(std::vector<std::string> excluded);
  static Node concatenation(std::vector<Node> items);
  static Node alternation(std::vector<Node> branches);
  static Node quantifier(Node wrapped, size_t min, size_t max, bool greedy = true);
  static Node capture_group(Node wrapped, size_t id);
  static Node non_capturing_group(Node wrapped);
  static Node backreference(size_t id);
  static Node anchor_start();
  static Node anchor_end();
  static Node word_boundary();
  static Node wildcard();
};

std::string describe(const Node& node);

}  // namespace genrex
