#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "srcsym/syntax/lexer.hpp"
#include "srcsym/syntax/token.hpp"

using srcsym::syntax::Lexer;
using srcsym::syntax::Token;
using srcsym::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src)
{
  Lexer lexer(src);
  return lexer.lex_all();
}

int count_kind(const std::vector<Token> & toks, TokenKind kind)
{
  int n = 0;
  for (const auto & t : toks) {
    if (t.kind == kind) {
      ++n;
    }
  }
  return n;
}

}  // namespace

TEST(SyntaxLexer, SkipsCommentsAndEndsWithEof)
{
  const std::string_view src =
    "// line\n"
    "/* block */\n"
    "const X = 1; // trailing\n"
    "let Y = /* inline */ 2;\n";

  const auto toks = lex(src);

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  EXPECT_EQ(count_kind(toks, TokenKind::Eof), 1);
  EXPECT_EQ(count_kind(toks, TokenKind::Numeric), 2);

  ASSERT_GE(toks.size(), 2U);
  EXPECT_TRUE(toks[0].is_keyword("const"));
  EXPECT_EQ(toks[0].line, 3U);
  EXPECT_EQ(toks[0].column, 1U);
  EXPECT_EQ(toks[1].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].text, "X");
}

TEST(SyntaxLexer, EmptyInputYieldsOnlyEof)
{
  const auto toks = lex("");
  ASSERT_EQ(toks.size(), 1U);
  EXPECT_EQ(toks[0].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, DivisionAfterIdentifierIsOperator)
{
  const auto toks = lex("a / b");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_TRUE(toks[1].is_op("/"));
  EXPECT_EQ(toks[2].kind, TokenKind::Identifier);
  EXPECT_EQ(count_kind(toks, TokenKind::Regex), 0);
}

TEST(SyntaxLexer, SlashAfterOpenParenIsRegex)
{
  const auto toks = lex("x(/ab+c/.test(y))");
  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[2].kind, TokenKind::Regex);
  EXPECT_EQ(toks[2].text, "/ab+c/");
  EXPECT_EQ(count_kind(toks, TokenKind::Regex), 1);

  // No stray division operators around the literal
  for (const auto & t : toks) {
    EXPECT_FALSE(t.is_op("/"));
  }
}

TEST(SyntaxLexer, RegexWithClassFlagsAndEscapes)
{
  const auto toks = lex(R"(const re = /[/\]]+\/x/gi;)");
  bool saw = false;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Regex) {
      EXPECT_EQ(t.text, R"(/[/\]]+\/x/gi)");
      saw = true;
    }
  }
  EXPECT_TRUE(saw);
}

TEST(SyntaxLexer, DivisionAfterCloseParenAndNumber)
{
  const auto toks = lex("(a + b) / 2 / c");
  EXPECT_EQ(count_kind(toks, TokenKind::Regex), 0);
  int divisions = 0;
  for (const auto & t : toks) {
    if (t.is_op("/")) {
      ++divisions;
    }
  }
  EXPECT_EQ(divisions, 2);
}

TEST(SyntaxLexer, UnterminatedRegexDegradesToOperator)
{
  const auto toks = lex("x = /abc\ny");
  EXPECT_EQ(count_kind(toks, TokenKind::Regex), 0);
  ASSERT_GE(toks.size(), 5U);
  EXPECT_TRUE(toks[2].is_op("/"));
  EXPECT_EQ(toks[3].text, "abc");
  EXPECT_EQ(toks[4].text, "y");
  EXPECT_EQ(toks[4].line, 2U);
}

TEST(SyntaxLexer, SlashEqualsIsCompoundAssignment)
{
  const auto toks = lex("x = (y) /= 2");
  bool saw = false;
  for (const auto & t : toks) {
    if (t.is_op("/=")) {
      saw = true;
    }
  }
  EXPECT_TRUE(saw);
}

TEST(SyntaxLexer, TemplateWithObjectLiteralInterpolationIsOneToken)
{
  const auto toks = lex("`a${ {x:1} }b`");
  ASSERT_EQ(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::Template);
  EXPECT_EQ(toks[0].text, "`a${ {x:1} }b`");
  EXPECT_EQ(toks[1].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, NestedTemplateStaysInsideOuterTemplate)
{
  const auto toks = lex("const s = `outer ${cond ? `inner ${v}` : '}'} end`;");
  EXPECT_EQ(count_kind(toks, TokenKind::Template), 1);
  ASSERT_GE(toks.size(), 5U);
  EXPECT_EQ(toks[3].kind, TokenKind::Template);
  EXPECT_TRUE(toks[4].is_punct(';'));
}

TEST(SyntaxLexer, UnterminatedStringAndCommentRunToEnd)
{
  {
    const auto toks = lex("const s = 'abc");
    ASSERT_EQ(toks.size(), 5U);
    EXPECT_EQ(toks[3].kind, TokenKind::String);
    EXPECT_EQ(toks[3].text, "'abc");
  }
  {
    const auto toks = lex("a /* never closed");
    ASSERT_EQ(toks.size(), 2U);
    EXPECT_EQ(toks[0].text, "a");
  }
  {
    const auto toks = lex("`unterminated ${x");
    ASSERT_EQ(toks.size(), 2U);
    EXPECT_EQ(toks[0].kind, TokenKind::Template);
  }
}

TEST(SyntaxLexer, StringEscapesDoNotCloseLiteral)
{
  const auto toks = lex(R"(f("a\"b", 'c\'d'))");
  int strings = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::String) {
      ++strings;
    }
  }
  EXPECT_EQ(strings, 2);
  EXPECT_EQ(toks[2].text, R"("a\"b")");
}

TEST(SyntaxLexer, NumericLiterals)
{
  const auto toks = lex("0xDEADBEEF 0b1010 0o777 1_000 3.14 .5 1e10 2E-3 10n");
  std::vector<std::string_view> texts;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Numeric) {
      texts.push_back(t.text);
    }
  }
  const std::vector<std::string_view> expected = {
    "0xDEADBEEF", "0b1010", "0o777", "1_000", "3.14", ".5", "1e10", "2E-3", "10n"};
  EXPECT_EQ(texts, expected);
}

TEST(SyntaxLexer, LongestOperatorWins)
{
  const auto toks = lex("a >>>= b === c => d ?? e ?. f ... g");
  std::vector<std::string_view> ops;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Operator) {
      ops.push_back(t.text);
    }
  }
  const std::vector<std::string_view> expected = {">>>=", "===", "=>", "??", "?.", "..."};
  EXPECT_EQ(ops, expected);
}

TEST(SyntaxLexer, ConditionalBeforeDecimalIsNotOptionalChain)
{
  const auto toks = lex("a?.5:1");
  ASSERT_GE(toks.size(), 3U);
  EXPECT_TRUE(toks[1].is_op("?"));
  EXPECT_EQ(toks[2].kind, TokenKind::Numeric);
  EXPECT_EQ(toks[2].text, ".5");
}

TEST(SyntaxLexer, KeywordsAndPrivateNames)
{
  const auto toks = lex("class A { #count = 0; static get value() { return this.#count; } }");
  EXPECT_TRUE(toks[0].is_keyword("class"));
  EXPECT_EQ(toks[1].kind, TokenKind::Identifier);

  int private_names = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Identifier && t.text == "#count") {
      ++private_names;
    }
  }
  EXPECT_EQ(private_names, 2);
}

TEST(SyntaxLexer, ShebangIsSkipped)
{
  const auto toks = lex("#!/usr/bin/env node\nrequire('x');");
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].text, "require");
  EXPECT_EQ(toks[0].line, 2U);
}

TEST(SyntaxLexer, TokenRangesMatchText)
{
  const std::string_view src = "let value = `t`;\nfoo(bar);";
  const auto toks = lex(src);
  for (const auto & t : toks) {
    EXPECT_EQ(src.substr(t.begin(), t.end() - t.begin()), t.text);
  }
  EXPECT_EQ(toks.back().begin(), src.size());
}

TEST(SyntaxLexer, UnknownBytesAreSkipped)
{
  const auto toks = lex("a \\ b");
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].text, "a");
  EXPECT_EQ(toks[1].text, "b");
}

TEST(SyntaxLexer, LexingIsDeterministic)
{
  const std::string_view src = "import x from 'y'; const z = x / 2; /re/g.test(z);";
  const auto a = lex(src);
  const auto b = lex(src);
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].kind, b[i].kind);
    EXPECT_EQ(a[i].text, b[i].text);
    EXPECT_EQ(a[i].range, b[i].range);
  }
}

// ============================================================================
// Template interpolations
// ============================================================================

TEST(SyntaxTemplateInterpolation, RelexesEachInterpolation)
{
  const std::string_view src = "const s = `hi ${name}, ${items.length} items`;";
  const auto toks = lex(src);
  ASSERT_GE(toks.size(), 4U);
  ASSERT_EQ(toks[3].kind, TokenKind::Template);

  const auto inner = srcsym::syntax::lex_template_interpolations(toks[3]);
  ASSERT_EQ(inner.size(), 4U);
  EXPECT_EQ(inner[0].text, "name");
  EXPECT_EQ(inner[1].text, "items");
  EXPECT_TRUE(inner[2].is_punct('.'));
  EXPECT_EQ(inner[3].text, "length");

  // Positions refer to the enclosing text
  for (const auto & t : inner) {
    EXPECT_EQ(src.substr(t.begin(), t.end() - t.begin()), t.text);
    EXPECT_EQ(t.line, 1U);
  }
  EXPECT_EQ(inner[0].column, static_cast<uint32_t>(src.find("name") + 1));
}

TEST(SyntaxTemplateInterpolation, ObjectLiteralBracesAreBalanced)
{
  const auto toks = lex("`a${ {x: y} }b`");
  const auto inner = srcsym::syntax::lex_template_interpolations(toks[0]);
  std::vector<std::string_view> texts;
  for (const auto & t : inner) {
    texts.push_back(t.text);
  }
  const std::vector<std::string_view> expected = {"{", "x", ":", "y", "}"};
  EXPECT_EQ(texts, expected);
}

TEST(SyntaxTemplateInterpolation, MultiLinePositions)
{
  const std::string_view src = "f(`line1\n${value}`)";
  const auto toks = lex(src);
  ASSERT_GE(toks.size(), 3U);
  const auto inner = srcsym::syntax::lex_template_interpolations(toks[2]);
  ASSERT_EQ(inner.size(), 1U);
  EXPECT_EQ(inner[0].text, "value");
  EXPECT_EQ(inner[0].line, 2U);
  EXPECT_EQ(inner[0].column, 3U);
}

TEST(SyntaxTemplateInterpolation, PlainTemplateHasNoTokens)
{
  const auto toks = lex("`no interpolation \\${here}`");
  EXPECT_TRUE(srcsym::syntax::lex_template_interpolations(toks[0]).empty());
}

TEST(SyntaxTemplateInterpolation, QuotedBraceStaysInsideInterpolation)
{
  const auto toks = lex("`${ '}' + a }tail`");
  const auto inner = srcsym::syntax::lex_template_interpolations(toks[0]);
  ASSERT_EQ(inner.size(), 3U);
  EXPECT_EQ(inner[0].kind, TokenKind::String);
  EXPECT_EQ(inner[0].text, "'}'");
  EXPECT_TRUE(inner[1].is_op("+"));
  EXPECT_EQ(inner[2].text, "a");
}

TEST(SyntaxTemplateInterpolation, ManyInterpolationsEachLexedOnce)
{
  std::string src = "`";
  for (int i = 0; i < 20000; ++i) {
    src += "${a}x";
  }
  src += "`";
  const auto toks = lex(src);
  ASSERT_EQ(toks[0].kind, TokenKind::Template);

  const auto inner = srcsym::syntax::lex_template_interpolations(toks[0]);
  ASSERT_EQ(inner.size(), 20000U);
  EXPECT_EQ(inner.back().text, "a");
  EXPECT_EQ(inner.back().column, static_cast<uint32_t>(src.size() - 3));
}
