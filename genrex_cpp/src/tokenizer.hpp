#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "token.hpp"

namespace genrex {

constexpr size_t kDefaultMaxDepth = 256;

// Single left-to-right scan of `pattern` into top-level nodes (an implicit
// concatenation). Capturing groups take identities from `next_group_id`,
// which is advanced in opening-parenthesis order. Malformed input degrades to
// literal characters; the only error is a GenrexError(InvalidPattern) when
// nesting goes past `max_depth`. Every group, every stacked quantifier and
// every '|' costs one level: alternation nests to the right, so a flat
// 300-way `a|b|...` needs a budget above 300.
// The scan is UTF-8 aware: a multibyte character is one literal, one class
// member or one quantified atom.
std::vector<Node> tokenize(std::string_view pattern, size_t& next_group_id, size_t max_depth = kDefaultMaxDepth);

// Same, numbering groups from 1.
std::vector<Node> tokenize(std::string_view pattern);

}  // namespace genrex
