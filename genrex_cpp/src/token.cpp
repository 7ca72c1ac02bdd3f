#include "token.hpp"

#include <utility>

namespace genrex {

static std::vector<std::string> singles(std::string_view chars) {
  std::vector<std::string> out;
  out.reserve(chars.size());
  for (char c : chars) out.emplace_back(1, c);
  return out;
}

std::vector<std::string> digit_chars() {
  return singles(kAlphanumeric.substr(52));
}

std::vector<std::string> word_chars() {
  std::vector<std::string> out = singles(kAlphanumeric);
  out.emplace_back("_");
  return out;
}

std::vector<std::string> space_chars() {
  return singles(" \t\n\r\f\v");
}

static Node make(Node::Kind kind) {
  Node n;
  n.kind = kind;
  return n;
}

Node Node::literal(char c) {
  return literal(std::string(1, c));
}

Node Node::literal(std::string c) {
  Node n = make(Kind::Literal);
  n.ch = std::move(c);
  return n;
}

Node Node::char_class(std::vector<std::string> members) {
  Node n = make(Kind::Class);
  n.chars = std::move(members);
  return n;
}

Node Node::negated_class(std::vector<std::string> excluded) {
  Node n = make(Kind::NegatedClass);
  n.chars = std::move(excluded);
  return n;
}

Node Node::concatenation(std::vector<Node> items) {
  Node n = make(Kind::Concatenation);
  n.children = std::move(items);
  return n;
}

Node Node::alternation(std::vector<Node> branches) {
  Node n = make(Kind::Alternation);
  n.children = std::move(branches);
  return n;
}

Node Node::quantifier(Node wrapped, size_t min, size_t max, bool greedy) {
  Node n = make(Kind::Quantifier);
  n.children.push_back(std::move(wrapped));
  n.min = min;
  n.max = max;
  n.greedy = greedy;
  return n;
}

Node Node::capture_group(Node wrapped, size_t id) {
  Node n = make(Kind::Group);
  n.children.push_back(std::move(wrapped));
  n.group = id;
  return n;
}

Node Node::non_capturing_group(Node wrapped) {
  Node n = make(Kind::NonCapturingGroup);
  n.children.push_back(std::move(wrapped));
  return n;
}

Node Node::backreference(size_t id) {
  Node n = make(Kind::Backreference);
  n.group = id;
  return n;
}

Node Node::anchor_start() { return make(Kind::AnchorStart); }
Node Node::anchor_end() { return make(Kind::AnchorEnd); }
Node Node::word_boundary() { return make(Kind::WordBoundary); }
Node Node::wildcard() { return make(Kind::Wildcard); }

static std::string join(const std::vector<std::string>& members) {
  std::string out;
  for (const auto& m : members) out += m;
  return out;
}

static std::string bound_str(size_t v) {
  return v == kUnbounded ? std::string("inf") : std::to_string(v);
}

std::string describe(const Node& node) {
  switch (node.kind) {
    case Node::Kind::Literal:
      return "Literal('" + node.ch + "')";
    case Node::Kind::Class:
      return "Class[" + join(node.chars) + "]";
    case Node::Kind::NegatedClass:
      return "NegatedClass[" + join(node.chars) + "]";
    case Node::Kind::Concatenation:
      return "Concat(" + std::to_string(node.children.size()) + ")";
    case Node::Kind::Alternation:
      return "Alt(" + std::to_string(node.children.size()) + ")";
    case Node::Kind::Quantifier:
      return "Quantifier{" + bound_str(node.min) + "," + bound_str(node.max) + "}" + (node.greedy ? "" : "?");
    case Node::Kind::Group:
      return "Group(" + std::to_string(node.group) + ")";
    case Node::Kind::NonCapturingGroup:
      return "NonCapturingGroup";
    case Node::Kind::Backreference:
      return "Backreference(" + std::to_string(node.group) + ")";
    case Node::Kind::AnchorStart:
      return "AnchorStart";
    case Node::Kind::AnchorEnd:
      return "AnchorEnd";
    case Node::Kind::WordBoundary:
      return "WordBoundary";
    case Node::Kind::Wildcard:
      return "Wildcard";
  }
  return "Unknown";
}

}  // namespace genrex
