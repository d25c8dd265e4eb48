// srcsym/syntax/lexer.hpp - ECMAScript/TypeScript lexer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "srcsym/syntax/token.hpp"

namespace srcsym::syntax
{

/**
 * Single forward pass over ECMAScript-family source text.
 *
 * The lexer has no error channel: unterminated strings, comments and
 * templates run to the end of input, and an unterminated regex degrades to a
 * `/` operator. The returned stream always ends with one Eof token.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  /// Lex a slice of a larger text; ranges and positions are reported
  /// relative to the enclosing text.
  Lexer(std::string_view src, uint32_t base_offset, uint32_t base_line, uint32_t base_column)
  : src_(src), base_offset_(base_offset), base_line_(base_line), base_column_(base_column)
  {
    line_ = base_line;
  }

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;
  [[nodiscard]] uint32_t current_column() const noexcept;

  void skip_whitespace_and_comments();
  void skip_quoted(char quote);
  void skip_template_body();

  [[nodiscard]] bool regex_allowed() const noexcept;

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_private_name();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_template();
  [[nodiscard]] bool try_lex_regex(Token & out);
  [[nodiscard]] Token lex_operator();

  /// Begin a token at the current position.
  [[nodiscard]] Token start_token(TokenKind kind) const noexcept;
  /// Close a token begun by start_token at the current position.
  void finish_token(Token & t, size_t start) const noexcept;

  std::string_view src_;
  uint32_t base_offset_ = 0;
  uint32_t base_line_ = 1;
  uint32_t base_column_ = 1;

  size_t pos_ = 0;
  uint32_t line_ = 1;
  size_t line_start_ = 0;

  std::vector<Token> tokens_;
};

/**
 * Re-lex every `${ ... }` interpolation of a Template token.
 *
 * Returns the tokens found inside the interpolations (without Eof), with
 * ranges and positions in the enclosing text. A nested template comes back
 * as one Template token.
 */
[[nodiscard]] std::vector<Token> lex_template_interpolations(const Token & tmpl);

}  // namespace srcsym::syntax
