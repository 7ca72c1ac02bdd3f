#pragma once

#include <random>
#include <string>

#include "token.hpp"
#include "token_context.hpp"

namespace genrex {

// Produces one candidate fragment for `node`. Throws GenrexError:
//   UnsupportedFeature  negated classes
//   Backreference       back-reference index 0
//   Internal            quantifier min > max, empty class or alternation
// None of these are retryable; the same tree fails the same way every time.
std::string generate(const Node& node, std::mt19937_64& rng, GenerationContext& ctx);

}  // namespace genrex
