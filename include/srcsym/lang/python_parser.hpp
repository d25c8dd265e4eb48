// srcsym/lang/python_parser.hpp - Python parser (tree-sitter with line-based fallback)
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "srcsym/lang/parser.hpp"
#include "srcsym/model/symbols.hpp"

namespace srcsym::lang
{

/**
 * Python parser.
 *
 * The primary path builds a tree-sitter-python syntax tree. When the tree
 * contains an error (or the grammar cannot be loaded) the result is marked
 * syntax-invalid with one error string, and imports, declarations and
 * identifiers come from the line-based fallback instead.
 */
class PythonParser final : public LanguageParser
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "python"; }

  [[nodiscard]] std::vector<std::string> languages() const override
  {
    return {k_language_python};
  }

  [[nodiscard]] std::optional<std::string> language_for_extension(
    std::string_view extension) const override;

  [[nodiscard]] std::vector<LanguageScore> score_content(
    std::string_view content) const override;

  [[nodiscard]] ParseResult parse(
    std::string_view content, std::string_view filename = {},
    std::string_view language = {}) const override;
};

namespace python_fallback
{

// Line-anchored extraction used when no syntax tree is available. It sees
// only unindented statements and single-line import lists.

[[nodiscard]] std::vector<Import> find_imports(std::string_view content);

[[nodiscard]] std::map<std::string, Declaration> find_declarations(std::string_view content);

[[nodiscard]] std::vector<IdentifierRef> find_identifiers(std::string_view content);

}  // namespace python_fallback

}  // namespace srcsym::lang
