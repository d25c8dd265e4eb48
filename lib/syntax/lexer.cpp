// srcsym/syntax/lexer.cpp - ECMAScript/TypeScript lexer implementation
#include "srcsym/syntax/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "srcsym/syntax/keywords.hpp"

namespace srcsym::syntax
{
namespace
{

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}
bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_punctuation(char c)
{
  switch (c) {
    case '{':
    case '}':
    case '[':
    case ']':
    case '(':
    case ')':
    case ',':
    case ';':
    case ':':
    case '.':
      return true;
    default:
      return false;
  }
}

bool is_operator_char(char c)
{
  switch (c) {
    case '+':
    case '-':
    case '*':
    case '/':
    case '%':
    case '=':
    case '!':
    case '<':
    case '>':
    case '&':
    case '|':
    case '^':
    case '~':
    case '?':
    case '@':
      return true;
    default:
      return false;
  }
}

// Longest first within each length class.
constexpr std::array<std::string_view, 37> k_operators = {
  ">>>=", "===", "!==", "**=", "<<=", ">>=", ">>>", "...", "&&=", "||=", "??=", "=>", "==",
  "!=",   "<=",  ">=",  "&&",  "||",  "??",  "++",  "--",  "+=",  "-=",  "*=", "/=",
  "%=",   "&=",  "|=",  "^=",  "**",  "<<",  ">>",  "+",   "-",   "*",   "/",   "%",
};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t k = 0; k < n && pos_ < src_.size(); ++k) {
    if (src_[pos_] == '\n') {
      ++line_;
      line_start_ = pos_ + 1;
    }
    ++pos_;
  }
}

uint32_t Lexer::current_column() const noexcept
{
  const auto delta = static_cast<uint32_t>(pos_ - line_start_);
  return (line_ == base_line_) ? base_column_ + delta : delta + 1;
}

Token Lexer::start_token(TokenKind kind) const noexcept
{
  Token t;
  t.kind = kind;
  t.line = line_;
  t.column = current_column();
  return t;
}

void Lexer::finish_token(Token & t, size_t start) const noexcept
{
  t.range = SourceRange(
    base_offset_ + static_cast<uint32_t>(start), base_offset_ + static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
}

std::vector<Token> Lexer::lex_all()
{
  tokens_.clear();

  // Shebang line
  if (base_offset_ == 0 && starts_with("#!")) {
    while (!eof() && peek() != '\n') {
      advance(1);
    }
  }

  while (true) {
    skip_whitespace_and_comments();
    if (eof()) {
      Token t = start_token(TokenKind::Eof);
      finish_token(t, pos_);
      tokens_.push_back(t);
      break;
    }

    const char c = peek();
    const auto uc = static_cast<unsigned char>(c);

    if (is_ident_start(uc)) {
      tokens_.push_back(lex_identifier_or_keyword());
    } else if (c == '#' && is_ident_start(static_cast<unsigned char>(peek(1)))) {
      tokens_.push_back(lex_private_name());
    } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
      tokens_.push_back(lex_number());
    } else if (c == '"' || c == '\'') {
      tokens_.push_back(lex_string());
    } else if (c == '`') {
      tokens_.push_back(lex_template());
    } else if (c == '/') {
      Token t;
      if (regex_allowed() && try_lex_regex(t)) {
        tokens_.push_back(t);
      } else {
        tokens_.push_back(lex_operator());
      }
    } else if (c == '.' && starts_with("...")) {
      tokens_.push_back(lex_operator());
    } else if (is_punctuation(c)) {
      const size_t start = pos_;
      Token t = start_token(TokenKind::Punctuation);
      advance(1);
      finish_token(t, start);
      tokens_.push_back(t);
    } else if (is_operator_char(c)) {
      tokens_.push_back(lex_operator());
    } else {
      // Unknown byte: skip it
      advance(1);
    }
  }

  return std::move(tokens_);
}

void Lexer::skip_whitespace_and_comments()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      advance(2);  // no-op at end of input
      continue;
    }
    break;
  }
}

bool Lexer::regex_allowed() const noexcept
{
  if (tokens_.empty()) {
    return true;
  }
  const Token & prev = tokens_.back();
  if (prev.kind == TokenKind::Identifier || prev.kind == TokenKind::Numeric) {
    return false;
  }
  return !(prev.is_punct(')') || prev.is_punct(']'));
}

Token Lexer::lex_identifier_or_keyword()
{
  const size_t start = pos_;
  Token t = start_token(TokenKind::Identifier);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  finish_token(t, start);
  if (is_reserved_keyword(t.text)) {
    t.kind = TokenKind::Keyword;
  }
  return t;
}

Token Lexer::lex_private_name()
{
  const size_t start = pos_;
  Token t = start_token(TokenKind::Identifier);
  advance(1);  // '#'
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  finish_token(t, start);
  return t;
}

Token Lexer::lex_number()
{
  const size_t start = pos_;
  Token t = start_token(TokenKind::Numeric);

  // Base-prefixed integers: 0x.. 0b.. 0o..
  const char p1 = peek(1);
  if (peek() == '0' && (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O')) {
    advance(2);
    while (!eof() && (std::isalnum(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
      advance(1);
    }
    finish_token(t, start);
    return t;
  }

  while (!eof() && (is_digit(peek()) || peek() == '_')) {
    advance(1);
  }

  // Fractional part (also covers a leading '.')
  if (peek() == '.' && peek(1) != '.' && !is_ident_start(static_cast<unsigned char>(peek(1)))) {
    advance(1);
    while (!eof() && (is_digit(peek()) || peek() == '_')) {
      advance(1);
    }
  }

  // Exponent
  if ((peek() == 'e' || peek() == 'E') &&
      (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
    advance(2);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }

  // BigInt suffix
  if (peek() == 'n') {
    advance(1);
  }

  finish_token(t, start);
  return t;
}

void Lexer::skip_quoted(char quote)
{
  advance(1);  // opening quote
  while (!eof() && peek() != quote) {
    // Escapes stay as raw two-byte sequences
    advance(peek() == '\\' ? 2 : 1);
  }
  advance(1);  // closing quote, no-op at end of input
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  Token t = start_token(TokenKind::String);
  skip_quoted(peek());
  finish_token(t, start);
  return t;
}

void Lexer::skip_template_body()
{
  advance(1);  // opening backtick
  int depth = 0;
  while (!eof()) {
    const char c = peek();
    if (c == '\\') {
      advance(2);
      continue;
    }
    if (c == '$' && peek(1) == '{') {
      advance(2);
      ++depth;
      continue;
    }
    if (depth > 0) {
      if (c == '{') {
        ++depth;
        advance(1);
        continue;
      }
      if (c == '}') {
        --depth;
        advance(1);
        continue;
      }
      if (c == '"' || c == '\'') {
        skip_quoted(c);
        continue;
      }
      if (c == '`') {
        skip_template_body();
        continue;
      }
    } else if (c == '`') {
      advance(1);
      return;
    }
    advance(1);
  }
}

Token Lexer::lex_template()
{
  const size_t start = pos_;
  Token t = start_token(TokenKind::Template);
  skip_template_body();
  finish_token(t, start);
  return t;
}

bool Lexer::try_lex_regex(Token & out)
{
  const char next = peek(1);
  if (next == '\0' || next == '=' || next == ' ' || next == '\n' || next == '\t' || next == '\r') {
    return false;
  }

  // Scan ahead on the current line without moving.
  size_t j = pos_ + 1;
  bool in_class = false;
  bool closed = false;
  while (j < src_.size()) {
    const char c = src_[j];
    if (c == '\n' || c == '\r') {
      break;
    }
    if (c == '\\') {
      if (j + 1 < src_.size() && (src_[j + 1] == '\n' || src_[j + 1] == '\r')) {
        break;
      }
      j += 2;
      continue;
    }
    if (c == '[') {
      in_class = true;
    } else if (c == ']') {
      in_class = false;
    } else if (c == '/' && !in_class) {
      closed = true;
      ++j;
      break;
    }
    ++j;
  }

  if (!closed) {
    return false;
  }

  // Flags
  while (j < src_.size() && is_ident_continue(static_cast<unsigned char>(src_[j]))) {
    ++j;
  }

  const size_t start = pos_;
  out = start_token(TokenKind::Regex);
  advance(j - pos_);
  finish_token(out, start);
  return true;
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;
  Token t = start_token(TokenKind::Operator);

  size_t len = 1;
  for (const auto op : k_operators) {
    if (starts_with(op)) {
      len = op.size();
      break;
    }
  }
  // ?. before a digit is a conditional followed by a number
  if (len == 1 && starts_with("?.") && !is_digit(peek(2))) {
    len = 2;
  }

  advance(len);
  finish_token(t, start);
  return t;
}

// ============================================================================
// Template interpolations
// ============================================================================

namespace
{

struct TextPosition
{
  uint32_t line;
  uint32_t column;
  size_t offset;
};

// Moves `p` forward to `offset` within the template text.
void advance_to(TextPosition & p, std::string_view text, size_t offset)
{
  for (; p.offset < offset && p.offset < text.size(); ++p.offset) {
    if (text[p.offset] == '\n') {
      ++p.line;
      p.column = 1;
    } else {
      ++p.column;
    }
  }
}

size_t skip_quoted_in(std::string_view text, size_t i)
{
  const char quote = text[i++];
  while (i < text.size() && text[i] != quote) {
    i += text[i] == '\\' ? 2 : 1;
  }
  return std::min(i + 1, text.size());
}

size_t skip_template_in(std::string_view text, size_t i);

/// Index of the '}' closing the interpolation whose body starts at `body`,
/// or the end of the text when it is unterminated. Same scan as the lexer's
/// template body skip.
size_t find_interpolation_end(std::string_view text, size_t body)
{
  int depth = 1;
  size_t i = body;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '\\') {
      i += 2;
    } else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
      ++depth;
      i += 2;
    } else if (c == '{') {
      ++depth;
      ++i;
    } else if (c == '}') {
      if (--depth == 0) {
        return i;
      }
      ++i;
    } else if (c == '"' || c == '\'') {
      i = skip_quoted_in(text, i);
    } else if (c == '`') {
      i = skip_template_in(text, i);
    } else {
      ++i;
    }
  }
  return text.size();
}

size_t skip_template_in(std::string_view text, size_t i)
{
  ++i;  // opening backtick
  while (i < text.size()) {
    const char c = text[i];
    if (c == '\\') {
      i += 2;
    } else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
      i = find_interpolation_end(text, i + 2) + 1;
    } else if (c == '`') {
      return i + 1;
    } else {
      ++i;
    }
  }
  return text.size();
}

}  // namespace

std::vector<Token> lex_template_interpolations(const Token & tmpl)
{
  std::vector<Token> out;
  if (tmpl.kind != TokenKind::Template) {
    return out;
  }

  const std::string_view text = tmpl.text;
  TextPosition pos{tmpl.line, tmpl.column, 0};
  size_t i = 1;  // past the opening backtick
  while (i < text.size()) {
    const char c = text[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == '`') {
      break;
    }
    if (c != '$' || i + 1 >= text.size() || text[i + 1] != '{') {
      ++i;
      continue;
    }

    const size_t body = i + 2;
    const size_t close = find_interpolation_end(text, body);
    advance_to(pos, text, body);
    Lexer inner(
      text.substr(body, close - body), tmpl.begin() + static_cast<uint32_t>(body), pos.line,
      pos.column);
    for (const auto & tok : inner.lex_all()) {
      if (tok.kind != TokenKind::Eof) {
        out.push_back(tok);
      }
    }
    i = close + 1;
  }
  return out;
}

}  // namespace srcsym::syntax
