// srcsym/syntax/token.hpp - Tokens of the ECMAScript-family lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "srcsym/basic/source_manager.hpp"

namespace srcsym::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Identifier,  // includes private names (#x)
  Keyword,     // reserved or contextual keyword

  String,    // '...' or "..." (text includes quotes)
  Template,  // `...` including every ${...} span
  Regex,     // /body/flags
  Numeric,

  Operator,     // longest-match operator, e.g. ===, =>, ?., ...
  Punctuation,  // { } [ ] ( ) , ; : .
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;      // byte range in the original source
  std::string_view text;  // slice view of the original source
  uint32_t line = 0;      // 1-indexed
  uint32_t column = 0;    // 1-indexed, in bytes

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
  [[nodiscard]] bool is(TokenKind k, std::string_view t) const noexcept
  {
    return kind == k && text == t;
  }
  [[nodiscard]] bool is_keyword(std::string_view t) const noexcept
  {
    return is(TokenKind::Keyword, t);
  }
  [[nodiscard]] bool is_punct(char c) const noexcept
  {
    return kind == TokenKind::Punctuation && text.size() == 1 && text[0] == c;
  }
  [[nodiscard]] bool is_op(std::string_view t) const noexcept { return is(TokenKind::Operator, t); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Keyword:
      return "keyword";
    case TokenKind::String:
      return "string";
    case TokenKind::Template:
      return "template";
    case TokenKind::Regex:
      return "regex";
    case TokenKind::Numeric:
      return "numeric";
    case TokenKind::Operator:
      return "operator";
    case TokenKind::Punctuation:
      return "punctuation";
  }
  return "";
}

}  // namespace srcsym::syntax
