#include "token_generator.hpp"

#include <algorithm>
#include <vector>

#include "error.hpp"

namespace genrex {

static size_t pick(size_t lo, size_t hi, std::mt19937_64& rng) {
  std::uniform_int_distribution<size_t> dist(lo, hi);
  return dist(rng);
}

static size_t repeat_count(const Node& q, std::mt19937_64& rng, const GenerationContext& ctx) {
  if (q.min > q.max) {
    throw GenrexError::internal("quantifier min " + std::to_string(q.min) + " > max " + std::to_string(q.max));
  }
  if (q.min == q.max) return q.min;
  size_t effective_max = q.max;
  if (q.max == kUnbounded) {
    effective_max = (ctx.max_repeat() > kUnbounded - q.min) ? kUnbounded : q.min + ctx.max_repeat();
  }
  // Two draws skew the count: the larger one for greedy, the smaller for lazy.
  size_t a = pick(q.min, effective_max, rng);
  size_t b = pick(q.min, effective_max, rng);
  return q.greedy ? std::max(a, b) : std::min(a, b);
}

std::string generate(const Node& node, std::mt19937_64& rng, GenerationContext& ctx) {
  switch (node.kind) {
    case Node::Kind::Literal:
      return node.ch;

    case Node::Kind::Class:
      if (node.chars.empty()) throw GenrexError::internal("empty class");
      return node.chars[pick(0, node.chars.size() - 1, rng)];

    case Node::Kind::NegatedClass:
      throw GenrexError::unsupported("negated class generation");

    case Node::Kind::Concatenation: {
      const size_t base = ctx.cursor();
      std::string out;
      for (const auto& child : node.children) {
        ctx.set_cursor(base + out.size());
        out += generate(child, rng, ctx);
      }
      return out;
    }

    case Node::Kind::Alternation:
      if (node.children.empty()) throw GenrexError::internal("empty alternation");
      return generate(node.children[pick(0, node.children.size() - 1, rng)], rng, ctx);

    case Node::Kind::Quantifier: {
      size_t count = repeat_count(node, rng, ctx);
      const size_t base = ctx.cursor();
      std::string out;
      for (size_t i = 0; i < count; i++) {
        ctx.set_cursor(base + out.size());
        out += generate(node.inner(), rng, ctx);
      }
      return out;
    }

    case Node::Kind::Group: {
      std::string s = generate(node.inner(), rng, ctx);
      ctx.record_capture(node.group, s);
      return s;
    }

    case Node::Kind::NonCapturingGroup:
      return generate(node.inner(), rng, ctx);

    case Node::Kind::Backreference: {
      if (node.group == 0) throw GenrexError::backreference("backreference index 0 is invalid");
      if (const std::string* cap = ctx.capture(node.group)) return *cap;
      // Forward reference: the resolution pass splices the text in later.
      ctx.add_unresolved(node.group);
      return std::string();
    }

    case Node::Kind::AnchorStart:
    case Node::Kind::AnchorEnd:
    case Node::Kind::WordBoundary:
      return std::string();

    case Node::Kind::Wildcard:
      return std::string(1, kAlphanumeric[pick(0, kAlphanumeric.size() - 1, rng)]);
  }
  throw GenrexError::internal("unknown node kind");
}

}  // namespace genrex
