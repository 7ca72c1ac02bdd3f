#include "tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"
#include "util.hpp"

namespace genrex {

namespace {

constexpr size_t kNpos = std::string_view::npos;

struct Bounds {
  size_t min = 0;
  size_t max = 0;
  size_t end = 0;  // index of the closing '}'
};

void add_unique(std::vector<std::string>& set, std::string_view c) {
  if (std::find(set.begin(), set.end(), c) == set.end()) set.emplace_back(c);
}

void add_all(std::vector<std::string>& set, const std::vector<std::string>& members) {
  for (const auto& c : members) add_unique(set, c);
}

// Index of the ']' closing the bracket class opened at `open`, or npos when
// the class runs to the end of the pattern. A ']' right after '[' or '[^' is a
// member when a later ']' closes the class; otherwise it closes an empty one.
size_t find_class_end(std::string_view pat, size_t open) {
  size_t j = open + 1;
  if (j < pat.size() && pat[j] == '^') j++;
  size_t first = j;
  if (j < pat.size() && pat[j] == ']') j++;
  for (; j < pat.size(); j++) {
    if (pat[j] == '\\') {
      j++;
    } else if (pat[j] == ']') {
      return j;
    }
  }
  return (first < pat.size() && pat[first] == ']') ? first : kNpos;
}

// Index of the ')' closing the group opened at `open`, or npos when unbalanced.
size_t find_group_end(std::string_view pat, size_t open) {
  int depth = 0;
  for (size_t i = open; i < pat.size(); i++) {
    char c = pat[i];
    if (c == '\\') {
      i++;
    } else if (c == '[') {
      i = find_class_end(pat, i);
      if (i == kNpos) return kNpos;
    } else if (c == '(') {
      depth++;
    } else if (c == ')') {
      if (--depth == 0) return i;
    }
  }
  return kNpos;
}

std::optional<size_t> parse_count(std::string_view digits) {
  if (digits.empty() || digits.size() > 9) return std::nullopt;
  size_t v = 0;
  for (char c : digits) {
    if (!std::isdigit((unsigned char)c)) return std::nullopt;
    v = v * 10 + (size_t)(c - '0');
  }
  return v;
}

// Parses `{m}`, `{m,}` or `{m,n}` starting at the '{' at `open`.
std::optional<Bounds> parse_braces(std::string_view pat, size_t open) {
  size_t close = pat.find('}', open);
  if (close == kNpos) return std::nullopt;
  std::string_view body = pat.substr(open + 1, close - open - 1);
  size_t comma = body.find(',');
  Bounds b;
  b.end = close;
  if (comma == kNpos) {
    auto m = parse_count(body);
    if (!m) return std::nullopt;
    b.min = b.max = *m;
    return b;
  }
  auto m = parse_count(body.substr(0, comma));
  if (!m) return std::nullopt;
  b.min = *m;
  std::string_view upper = body.substr(comma + 1);
  if (upper.empty()) {
    b.max = kUnbounded;
    return b;
  }
  auto n = parse_count(upper);
  if (!n || *n < *m) return std::nullopt;
  b.max = *n;
  return b;
}

class Tokenizer {
 public:
  Tokenizer(size_t& next_group, size_t max_depth) : next_group_(next_group), max_depth_(max_depth) {}

  std::vector<Node> run(std::string_view pat, size_t depth) {
    check_depth(depth);
    std::vector<Node> nodes;
    size_t stacked = 0;  // quantifiers already wrapped around nodes.back()

    auto push = [&](Node n) {
      nodes.push_back(std::move(n));
      stacked = 0;
    };

    // Consumes a trailing '?' that marks the quantifier at `i` lazy.
    auto consume_lazy = [&](size_t& i) -> bool {
      if (i + 1 < pat.size() && pat[i + 1] == '?') {
        i++;
        return true;
      }
      return false;
    };

    auto rewrap = [&](size_t min, size_t max, bool greedy) {
      stacked++;
      check_depth(depth + stacked);
      Node last = std::move(nodes.back());
      nodes.back() = Node::quantifier(std::move(last), min, max, greedy);
    };

    for (size_t i = 0; i < pat.size(); i++) {
      char c = pat[i];
      switch (c) {
        case '[': {
          size_t close = find_class_end(pat, i);
          size_t end = (close == kNpos) ? pat.size() : close;
          size_t j = i + 1;
          bool negated = (j < end && pat[j] == '^');
          if (negated) j++;
          std::vector<std::string> members;
          while (j < end) {
            if (pat[j] == '\\' && j + 1 < end) {
              j++;
              size_t len = utf8_char_len(pat, j);
              add_escaped_member(members, pat.substr(j, len));
              j += len;
            } else {
              size_t len = utf8_char_len(pat, j);
              add_unique(members, pat.substr(j, len));
              j += len;
            }
          }
          if (members.empty()) {
            // "[]", "[^]" or a bare '[' at the end: no class, just text.
            size_t stop = (close == kNpos) ? end : close + 1;
            for (size_t k = i; k < stop; k++) push(Node::literal(pat[k]));
            i = stop - 1;
            break;
          }
          i = end;  // closing ']' or end of pattern
          push(negated ? Node::negated_class(std::move(members)) : Node::char_class(std::move(members)));
          break;
        }
        case '.':
          push(Node::wildcard());
          break;
        case '^':
          push(Node::anchor_start());
          break;
        case '$':
          push(Node::anchor_end());
          break;
        case '\\':
          if (i + 1 >= pat.size()) {
            push(Node::literal('\\'));
          } else {
            size_t len = utf8_char_len(pat, i + 1);
            push(escape(pat.substr(i + 1, len)));
            i += len;
          }
          break;
        case '(': {
          size_t close = find_group_end(pat, i);
          size_t end = (close == kNpos) ? pat.size() : close;
          if (pat.substr(i, 3) == "(?:") {
            std::string_view body = pat.substr(std::min(i + 3, end), end - std::min(i + 3, end));
            push(Node::non_capturing_group(Node::concatenation(run(body, depth + 1))));
          } else {
            size_t id = next_group_++;
            std::string_view body = pat.substr(i + 1, end - i - 1);
            push(Node::capture_group(Node::concatenation(run(body, depth + 1)), id));
          }
          i = end;
          break;
        }
        case '?':
        case '*':
        case '+': {
          if (nodes.empty()) {
            push(Node::literal(c));
            break;
          }
          size_t min = (c == '+') ? 1 : 0;
          size_t max = (c == '?') ? 1 : kUnbounded;
          bool lazy = consume_lazy(i);
          rewrap(min, max, !lazy);
          break;
        }
        case '{': {
          std::optional<Bounds> bounds;
          if (!nodes.empty()) bounds = parse_braces(pat, i);
          if (!bounds) {
            push(Node::literal('{'));
            break;
          }
          i = bounds->end;
          bool lazy = consume_lazy(i);
          rewrap(bounds->min, bounds->max, !lazy);
          break;
        }
        case '|': {
          Node left = Node::concatenation(std::move(nodes));
          Node right = Node::concatenation(run(pat.substr(i + 1), depth + 1));
          std::vector<Node> branches;
          branches.push_back(std::move(left));
          branches.push_back(std::move(right));
          std::vector<Node> out;
          out.push_back(Node::alternation(std::move(branches)));
          return out;
        }
        default: {
          size_t len = utf8_char_len(pat, i);
          push(Node::literal(std::string(pat.substr(i, len))));
          i += len - 1;
          break;
        }
      }
    }
    return nodes;
  }

 private:
  void check_depth(size_t depth) const {
    if (depth > max_depth_) {
      throw GenrexError::invalid_pattern("pattern nesting exceeds depth limit " + std::to_string(max_depth_));
    }
  }

  static Node escape(std::string_view cp) {
    if (cp.size() > 1) return Node::literal(std::string(cp));
    char e = cp[0];
    switch (e) {
      case 'b': return Node::word_boundary();
      case 'd': return Node::char_class(digit_chars());
      case 'D': return Node::negated_class(digit_chars());
      case 'w': return Node::char_class(word_chars());
      case 'W': return Node::negated_class(word_chars());
      case 's': return Node::char_class(space_chars());
      case 'S': return Node::negated_class(space_chars());
      case 'n': return Node::literal('\n');
      case 't': return Node::literal('\t');
      case 'r': return Node::literal('\r');
      case 'f': return Node::literal('\f');
      case 'v': return Node::literal('\v');
      default: break;
    }
    if (e >= '1' && e <= '9') return Node::backreference((size_t)(e - '0'));
    return Node::literal(e);
  }

  static void add_escaped_member(std::vector<std::string>& members, std::string_view cp) {
    if (cp.size() > 1) {
      add_unique(members, cp);
      return;
    }
    switch (cp[0]) {
      case 'd': add_all(members, digit_chars()); return;
      case 'w': add_all(members, word_chars()); return;
      case 's': add_all(members, space_chars()); return;
      case 'n': add_unique(members, "\n"); return;
      case 't': add_unique(members, "\t"); return;
      case 'r': add_unique(members, "\r"); return;
      case 'f': add_unique(members, "\f"); return;
      case 'v': add_unique(members, "\v"); return;
      default: add_unique(members, cp); return;
    }
  }

  size_t& next_group_;
  size_t max_depth_;
};

}  // namespace

std::vector<Node> tokenize(std::string_view pattern, size_t& next_group_id, size_t max_depth) {
  Tokenizer t(next_group_id, max_depth);
  return t.run(pattern, 0);
}

std::vector<Node> tokenize(std::string_view pattern) {
  size_t next_group_id = 1;
  return tokenize(pattern, next_group_id);
}

}  // namespace genrex
