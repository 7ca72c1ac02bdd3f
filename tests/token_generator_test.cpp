#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "error.hpp"
#include "token.hpp"
#include "token_context.hpp"
#include "token_generator.hpp"
#include "tokenizer.hpp"

namespace genrex {
namespace {

std::string run(const Node& node, uint64_t seed) {
  std::mt19937_64 rng(seed);
  GenerationContext ctx;
  return generate(node, rng, ctx);
}

// Walks a whole pattern the way one token attempt does, including the
// resolution pass.
std::string run_pattern(const std::string& pattern, std::mt19937_64& rng) {
  GenerationContext ctx;
  std::string out = generate(Node::concatenation(tokenize(pattern)), rng, ctx);
  ctx.resolve(out);
  return out;
}

ErrorKind kind_of(const Node& node, uint64_t seed) {
  try {
    run(node, seed);
  } catch (const GenrexError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected " << describe(node) << " to fail";
  return ErrorKind::NoMatch;
}

TEST(TokenGeneratorTest, Literal) {
  EXPECT_EQ(run(Node::literal('x'), 1), "x");
}

TEST(TokenGeneratorTest, ClassPicksMember) {
  Node cls = Node::char_class({"a", "b", "c"});
  for (uint64_t seed = 0; seed < 50; seed++) {
    std::string s = run(cls, seed);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_NE(std::string("abc").find(s[0]), std::string::npos);
  }
}

TEST(TokenGeneratorTest, EmptyClassIsInternalError) {
  EXPECT_EQ(kind_of(Node::char_class({}), 2), ErrorKind::Internal);
}

TEST(TokenGeneratorTest, NegatedClassIsUnsupportedForEverySeed) {
  Node neg = Node::negated_class({"a", "b", "c"});
  for (uint64_t seed = 0; seed < 20; seed++) {
    try {
      run(neg, seed);
      FAIL() << "negated class generated text";
    } catch (const GenrexError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFeature);
      EXPECT_FALSE(e.retryable());
    }
  }
}

TEST(TokenGeneratorTest, Concatenation) {
  Node cat = Node::concatenation({Node::literal('a'), Node::literal('b'), Node::literal('c')});
  EXPECT_EQ(run(cat, 3), "abc");
}

TEST(TokenGeneratorTest, AlternationPicksBranch) {
  Node alt = Node::alternation({Node::literal('x'), Node::literal('y')});
  bool saw_x = false;
  bool saw_y = false;
  for (uint64_t seed = 0; seed < 64; seed++) {
    std::string s = run(alt, seed);
    ASSERT_TRUE(s == "x" || s == "y") << s;
    saw_x |= (s == "x");
    saw_y |= (s == "y");
  }
  EXPECT_TRUE(saw_x);
  EXPECT_TRUE(saw_y);
}

TEST(TokenGeneratorTest, EmptyAlternationIsInternalError) {
  EXPECT_EQ(kind_of(Node::alternation({}), 4), ErrorKind::Internal);
}

TEST(TokenGeneratorTest, QuantifierWithinBounds) {
  Node q = Node::quantifier(Node::literal('z'), 2, 4);
  for (uint64_t seed = 0; seed < 100; seed++) {
    std::string s = run(q, seed);
    EXPECT_GE(s.size(), 2u);
    EXPECT_LE(s.size(), 4u);
    EXPECT_EQ(s.find_first_not_of('z'), std::string::npos);
  }
}

TEST(TokenGeneratorTest, QuantifierWithEqualBoundsRepeatsExactly) {
  Node q = Node::quantifier(Node::literal('q'), 5, 5);
  Node lazy = Node::quantifier(Node::literal('q'), 5, 5, false);
  for (uint64_t seed = 0; seed < 20; seed++) {
    EXPECT_EQ(run(q, seed), "qqqqq");
    EXPECT_EQ(run(lazy, seed), "qqqqq");
  }
}

TEST(TokenGeneratorTest, QuantifierMinAboveMaxIsInternalError) {
  Node q = Node::quantifier(Node::literal('q'), 3, 1);
  EXPECT_EQ(kind_of(q, 5), ErrorKind::Internal);
}

TEST(TokenGeneratorTest, UnboundedQuantifierUsesRepeatBound) {
  Node q = Node::quantifier(Node::literal('a'), 1, kUnbounded);
  size_t longest = 0;
  for (uint64_t seed = 0; seed < 200; seed++) {
    std::mt19937_64 rng(seed);
    GenerationContext ctx(4);
    std::string s = generate(q, rng, ctx);
    EXPECT_GE(s.size(), 1u);
    EXPECT_LE(s.size(), 5u);
    longest = std::max(longest, s.size());
  }
  EXPECT_EQ(longest, 5u);
}

TEST(TokenGeneratorTest, DefaultRepeatBoundIs32) {
  Node q = Node::quantifier(Node::literal('a'), 0, kUnbounded);
  for (uint64_t seed = 0; seed < 200; seed++) {
    EXPECT_LE(run(q, seed).size(), 32u);
  }
}

TEST(TokenGeneratorTest, GreedyDominatesLazyWithPairedStreams) {
  Node greedy = Node::quantifier(Node::literal('a'), 0, 20, true);
  Node lazy = Node::quantifier(Node::literal('a'), 0, 20, false);
  size_t greedy_total = 0;
  size_t lazy_total = 0;
  for (uint64_t seed = 0; seed < 500; seed++) {
    size_t g = run(greedy, seed).size();
    size_t l = run(lazy, seed).size();
    EXPECT_GE(g, l);
    greedy_total += g;
    lazy_total += l;
  }
  EXPECT_GT(greedy_total, lazy_total);
}

TEST(TokenGeneratorTest, GroupRecordsCapture) {
  Node g = Node::capture_group(Node::literal('g'), 1);
  std::mt19937_64 rng(6);
  GenerationContext ctx;
  EXPECT_EQ(generate(g, rng, ctx), "g");
  ASSERT_NE(ctx.capture(1), nullptr);
  EXPECT_EQ(*ctx.capture(1), "g");
}

TEST(TokenGeneratorTest, RepeatedGroupKeepsLastCompletion) {
  std::mt19937_64 rng(11);
  for (int i = 0; i < 50; i++) {
    GenerationContext ctx;
    std::string out = generate(Node::concatenation(tokenize("([abc]){3}")), rng, ctx);
    ASSERT_EQ(out.size(), 3u);
    ASSERT_NE(ctx.capture(1), nullptr);
    EXPECT_EQ(*ctx.capture(1), out.substr(2));
  }
}

TEST(TokenGeneratorTest, NonCapturingGroupLeavesCaptureTableEmpty) {
  std::mt19937_64 rng(7);
  GenerationContext ctx;
  EXPECT_EQ(generate(Node::concatenation(tokenize("(?:a)")), rng, ctx), "a");
  EXPECT_EQ(ctx.capture_count(), 0u);
}

TEST(TokenGeneratorTest, BackwardReferenceRepeatsGroup) {
  std::mt19937_64 rng(8);
  for (int i = 0; i < 20; i++) EXPECT_EQ(run_pattern("(a)\\1", rng), "aa");
}

TEST(TokenGeneratorTest, BackwardReferenceRepeatsClassChoice) {
  std::mt19937_64 rng(9);
  for (int i = 0; i < 50; i++) {
    std::string s = run_pattern("([ab])\\1\\1", rng);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_TRUE(s == "aaa" || s == "bbb") << s;
  }
}

TEST(TokenGeneratorTest, BackreferenceZeroIsRejected) {
  try {
    run(Node::backreference(0), 1);
    FAIL() << "index 0 accepted";
  } catch (const GenrexError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Backreference);
    EXPECT_FALSE(e.retryable());
  }
}

TEST(TokenGeneratorTest, ForwardReferenceIsRecordedAndEmpty) {
  std::mt19937_64 rng(10);
  GenerationContext ctx;
  Node tree = Node::concatenation(tokenize("x\\1(ab)"));
  std::string out = generate(tree, rng, ctx);
  EXPECT_EQ(out, "xab");
  ASSERT_EQ(ctx.unresolved().size(), 1u);
  EXPECT_EQ(ctx.unresolved()[0].group, 1u);
  EXPECT_EQ(ctx.unresolved()[0].position, 1u);
}

TEST(TokenGeneratorTest, ForwardReferenceResolvesInSecondPass) {
  std::mt19937_64 rng(12);
  EXPECT_EQ(run_pattern("x\\1(ab)", rng), "xabab");
  EXPECT_EQ(run_pattern("\\2(a)(b)", rng), "bab");
}

TEST(TokenGeneratorTest, CursorTracksNestedPositions) {
  std::mt19937_64 rng(13);
  GenerationContext ctx;
  Node tree = Node::concatenation(tokenize("ab(c(d\\3))(e)"));
  std::string out = generate(tree, rng, ctx);
  EXPECT_EQ(out, "abcde");
  ASSERT_EQ(ctx.unresolved().size(), 1u);
  EXPECT_EQ(ctx.unresolved()[0].position, 4u);
  ctx.resolve(out);
  EXPECT_EQ(out, "abcdee");
}

TEST(TokenGeneratorTest, AnchorsAndBoundariesAreEmpty) {
  EXPECT_EQ(run(Node::anchor_start(), 1), "");
  EXPECT_EQ(run(Node::anchor_end(), 1), "");
  EXPECT_EQ(run(Node::word_boundary(), 1), "");
}

TEST(TokenGeneratorTest, WildcardIsAlphanumeric) {
  for (uint64_t seed = 0; seed < 100; seed++) {
    std::string s = run(Node::wildcard(), seed);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_NE(kAlphanumeric.find(s[0]), std::string_view::npos);
  }
}

TEST(TokenGeneratorTest, BraceQuantifierFromPattern) {
  std::mt19937_64 rng(14);
  for (int i = 0; i < 100; i++) {
    std::string s = run_pattern("a{2,4}", rng);
    EXPECT_GE(s.size(), 2u);
    EXPECT_LE(s.size(), 4u);
    EXPECT_EQ(s.find_first_not_of('a'), std::string::npos);
  }
}

TEST(TokenGeneratorTest, MultibyteCharactersStayWhole) {
  const std::string e_acute = "\xC3\xA9";
  const std::string u_umlaut = "\xC3\xBC";
  std::mt19937_64 rng(15);
  for (int i = 0; i < 50; i++) {
    std::string s = run_pattern("[" + e_acute + u_umlaut + "]{3}", rng);
    ASSERT_EQ(s.size(), 6u);
    for (size_t k = 0; k < s.size(); k += 2) {
      std::string ch = s.substr(k, 2);
      EXPECT_TRUE(ch == e_acute || ch == u_umlaut) << s;
    }
  }
  EXPECT_EQ(run(Node::quantifier(Node::literal(e_acute), 2, 2), 1), e_acute + e_acute);
}

}  // namespace
}  // namespace genrex
