// srcsym/lang/ecmascript_parser.hpp - JavaScript/TypeScript parser over the token stream
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "srcsym/lang/parser.hpp"
#include "srcsym/model/symbols.hpp"
#include "srcsym/syntax/token.hpp"

namespace srcsym::lang
{

/**
 * JavaScript and TypeScript parser.
 *
 * Works purely on the token stream produced by syntax::Lexer; raw text is
 * only consulted for the recall-improving `require(...)` scan and for
 * choosing between the two language tags.
 */
class EcmaScriptParser final : public LanguageParser
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "ecmascript"; }

  [[nodiscard]] std::vector<std::string> languages() const override
  {
    return {k_language_javascript, k_language_typescript};
  }

  [[nodiscard]] std::optional<std::string> language_for_extension(
    std::string_view extension) const override;

  [[nodiscard]] std::vector<LanguageScore> score_content(
    std::string_view content) const override;

  [[nodiscard]] ParseResult parse(
    std::string_view content, std::string_view filename = {},
    std::string_view language = {}) const override;

  /**
   * Extracts imports, top-level declarations and identifier references from
   * an already lexed token stream of `content`.
   */
  [[nodiscard]] ParseResult parse_tokens(
    gsl::span<const syntax::Token> tokens, std::string_view content,
    std::string_view filename = {}, std::string_view language = {}) const;
};

/**
 * Picks "typescript" or "javascript": a known extension decides, otherwise
 * TypeScript markers in the text (`interface `, `: string`, `enum `, generic
 * type arguments, ...) select "typescript".
 */
[[nodiscard]] std::string select_ecmascript_language(
  std::string_view content, std::string_view filename);

/// True when the text carries TypeScript-only syntax markers.
[[nodiscard]] bool has_typescript_markers(std::string_view content);

}  // namespace srcsym::lang
