#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "token.hpp"

namespace genrex {

// Older whole-tree representation, kept as a fallback behind the token tree.
// Groups lose their identities here, so back-references cannot be honoured.
struct AstNode {
  enum class Kind {
    Sequence,
    Alternation,
    Repeat,
    Group,
    NonCapturingGroup,
    Backreference,
    Class,
    NegatedClass,
    Literal,
    AnchorStart,
    AnchorEnd,
    WordBoundary,
    Wildcard,
  };

  Kind kind = Kind::Sequence;
  std::vector<AstNode> children;
  std::vector<std::string> chars;
  std::string ch;
  size_t min = 0;
  size_t max = 0;
  bool greedy = true;
};

// Returns nullopt for an empty token list. Nested alternations are flattened
// into one n-way choice.
std::optional<AstNode> parse_legacy(const std::vector<Node>& tokens);

// One pass over the tree; repeat counts are drawn uniformly. Throws
// GenrexError(UnsupportedFeature) for back-references and negated classes.
std::string generate_legacy(const AstNode& ast, std::mt19937_64& rng, size_t max_repeat);

}  // namespace genrex
