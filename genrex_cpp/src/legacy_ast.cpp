#include "legacy_ast.hpp"

#include <utility>

#include "error.hpp"

namespace genrex {

static AstNode leaf(AstNode::Kind kind) {
  AstNode n;
  n.kind = kind;
  return n;
}

static AstNode wrap(AstNode::Kind kind, AstNode inner) {
  AstNode n = leaf(kind);
  n.children.push_back(std::move(inner));
  return n;
}

static AstNode convert(const Node& tok);

static AstNode convert_sequence(const std::vector<Node>& items) {
  if (items.size() == 1) return convert(items.front());
  AstNode seq = leaf(AstNode::Kind::Sequence);
  seq.children.reserve(items.size());
  for (const auto& t : items) seq.children.push_back(convert(t));
  return seq;
}

static AstNode convert(const Node& tok) {
  switch (tok.kind) {
    case Node::Kind::Literal: {
      AstNode n = leaf(AstNode::Kind::Literal);
      n.ch = tok.ch;
      return n;
    }
    case Node::Kind::Class: {
      AstNode n = leaf(AstNode::Kind::Class);
      n.chars = tok.chars;
      return n;
    }
    case Node::Kind::NegatedClass:
      return leaf(AstNode::Kind::NegatedClass);
    case Node::Kind::Concatenation:
      return convert_sequence(tok.children);
    case Node::Kind::Alternation: {
      AstNode alt = leaf(AstNode::Kind::Alternation);
      for (const auto& branch : tok.children) {
        AstNode b = convert(branch);
        if (b.kind == AstNode::Kind::Alternation) {
          for (auto& sub : b.children) alt.children.push_back(std::move(sub));
        } else {
          alt.children.push_back(std::move(b));
        }
      }
      return alt;
    }
    case Node::Kind::Quantifier: {
      AstNode n = wrap(AstNode::Kind::Repeat, convert(tok.inner()));
      n.min = tok.min;
      n.max = tok.max;
      n.greedy = tok.greedy;
      return n;
    }
    case Node::Kind::Group:
      return wrap(AstNode::Kind::Group, convert(tok.inner()));
    case Node::Kind::NonCapturingGroup:
      return wrap(AstNode::Kind::NonCapturingGroup, convert(tok.inner()));
    case Node::Kind::Backreference:
      return leaf(AstNode::Kind::Backreference);
    case Node::Kind::AnchorStart:
      return leaf(AstNode::Kind::AnchorStart);
    case Node::Kind::AnchorEnd:
      return leaf(AstNode::Kind::AnchorEnd);
    case Node::Kind::WordBoundary:
      return leaf(AstNode::Kind::WordBoundary);
    case Node::Kind::Wildcard:
      return leaf(AstNode::Kind::Wildcard);
  }
  throw GenrexError::internal("unknown token kind");
}

std::optional<AstNode> parse_legacy(const std::vector<Node>& tokens) {
  if (tokens.empty()) return std::nullopt;
  return convert_sequence(tokens);
}

static size_t pick(size_t lo, size_t hi, std::mt19937_64& rng) {
  std::uniform_int_distribution<size_t> dist(lo, hi);
  return dist(rng);
}

std::string generate_legacy(const AstNode& ast, std::mt19937_64& rng, size_t max_repeat) {
  switch (ast.kind) {
    case AstNode::Kind::Sequence: {
      std::string out;
      for (const auto& c : ast.children) out += generate_legacy(c, rng, max_repeat);
      return out;
    }
    case AstNode::Kind::Alternation:
      if (ast.children.empty()) throw GenrexError::internal("empty alternation");
      return generate_legacy(ast.children[pick(0, ast.children.size() - 1, rng)], rng, max_repeat);
    case AstNode::Kind::Repeat: {
      if (ast.min > ast.max) throw GenrexError::internal("repeat min > max");
      size_t hi = ast.max;
      if (hi == kUnbounded) hi = (max_repeat > kUnbounded - ast.min) ? kUnbounded : ast.min + max_repeat;
      size_t count = pick(ast.min, hi, rng);
      std::string out;
      for (size_t i = 0; i < count; i++) out += generate_legacy(ast.children.front(), rng, max_repeat);
      return out;
    }
    case AstNode::Kind::Group:
    case AstNode::Kind::NonCapturingGroup:
      return generate_legacy(ast.children.front(), rng, max_repeat);
    case AstNode::Kind::Backreference:
      throw GenrexError::unsupported("backreference in legacy generation");
    case AstNode::Kind::Class:
      if (ast.chars.empty()) throw GenrexError::internal("empty class");
      return ast.chars[pick(0, ast.chars.size() - 1, rng)];
    case AstNode::Kind::NegatedClass:
      throw GenrexError::unsupported("negated class generation");
    case AstNode::Kind::Literal:
      return ast.ch;
    case AstNode::Kind::AnchorStart:
    case AstNode::Kind::AnchorEnd:
    case AstNode::Kind::WordBoundary:
      return std::string();
    case AstNode::Kind::Wildcard:
      return std::string(1, kAlphanumeric[pick(0, kAlphanumeric.size() - 1, rng)]);
  }
  throw GenrexError::internal("unknown ast kind");
}

}  // namespace genrex
