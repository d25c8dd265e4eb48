// srcsym/lang/ecmascript_parser.cpp - JavaScript/TypeScript extraction over tokens
#include "srcsym/lang/ecmascript_parser.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <utility>

#include "srcsym/syntax/keywords.hpp"
#include "srcsym/syntax/lexer.hpp"

namespace srcsym::lang
{
namespace
{

using syntax::Token;
using syntax::TokenKind;

constexpr std::array<std::string_view, 4> k_typescript_extensions = {".ts", ".tsx", ".mts", ".cts"};
constexpr std::array<std::string_view, 4> k_javascript_extensions = {".js", ".jsx", ".mjs", ".cjs"};

template <size_t N>
bool one_of(const std::array<std::string_view, N> & words, std::string_view w)
{
  return std::find(words.begin(), words.end(), w) != words.end();
}

bool contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}

bool is_ident_start(char c)
{
  return c == '_' || c == '$' || std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_ident_char(char c)
{
  return c == '_' || c == '$' || std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Scans `Name[]?` at i; returns the index past it, or npos.
size_t scan_type_argument(std::string_view s, size_t i)
{
  if (i >= s.size() || !is_ident_start(s[i])) {
    return std::string_view::npos;
  }
  while (i < s.size() && is_ident_char(s[i])) {
    ++i;
  }
  if (i + 1 < s.size() && s[i] == '[' && s[i + 1] == ']') {
    i += 2;
  }
  return i;
}

/// Finds `Name<A, B[]>` usage. Every scan starts at a '<' and stops at the
/// next one at the latest, so the whole pass is linear.
bool has_generic_brackets(std::string_view s)
{
  for (size_t lt = s.find('<'); lt != std::string_view::npos; lt = s.find('<', lt + 1)) {
    // The word before '<' needs an identifier start somewhere in it
    bool named = false;
    for (size_t k = lt; k > 0 && is_ident_char(s[k - 1]); --k) {
      named = named || is_ident_start(s[k - 1]);
    }
    if (!named) {
      continue;
    }
    size_t i = scan_type_argument(s, lt + 1);
    while (i != std::string_view::npos && i < s.size() && s[i] != '>') {
      while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) {
        ++i;
      }
      if (i >= s.size() || s[i] != ',') {
        i = std::string_view::npos;
        break;
      }
      ++i;
      while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) {
        ++i;
      }
      i = scan_type_argument(s, i);
    }
    if (i != std::string_view::npos && i < s.size() && s[i] == '>') {
      return true;
    }
  }
  return false;
}

std::string unquote(std::string_view s)
{
  if (s.empty() || (s.front() != '"' && s.front() != '\'' && s.front() != '`')) {
    return std::string(s);
  }
  if (s.size() >= 2 && s.back() == s.front()) {
    return std::string(s.substr(1, s.size() - 2));
  }
  // Unterminated literal
  return std::string(s.substr(1));
}

bool is_name_token(const Token & t)
{
  return t.kind == TokenKind::Identifier || t.kind == TokenKind::Keyword;
}

bool is_binding_name(const Token & t)
{
  return t.kind == TokenKind::Identifier && !syntax::is_reserved_keyword(t.text) &&
         !syntax::is_builtin_name(t.text);
}

bool is_open(const Token & t) { return t.is_punct('(') || t.is_punct('[') || t.is_punct('{'); }
bool is_close(const Token & t) { return t.is_punct(')') || t.is_punct(']') || t.is_punct('}'); }

bool is_modifier(const Token & t)
{
  if (t.kind != TokenKind::Keyword) {
    return false;
  }
  return t.text == "export" || t.text == "default" || t.text == "declare" ||
         t.text == "abstract" || t.text == "async" || t.text == "const";
}

/// A token after which a line break may end the statement.
bool ends_expression(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Identifier:
    case TokenKind::Numeric:
    case TokenKind::String:
    case TokenKind::Template:
    case TokenKind::Regex:
      return true;
    case TokenKind::Keyword:
      return t.text == "this" || t.text == "true" || t.text == "false";
    case TokenKind::Punctuation:
      return is_close(t);
    default:
      return false;
  }
}

bool starts_statement(const Token & t)
{
  if (t.kind == TokenKind::Identifier) {
    return true;
  }
  if (t.kind != TokenKind::Keyword) {
    return false;
  }
  return t.text != "as" && t.text != "in" && t.text != "instanceof" && t.text != "of" &&
         t.text != "extends" && t.text != "implements";
}

/// Angle bracket depth change of a type-position operator token.
int angle_delta(const Token & t)
{
  if (t.kind != TokenKind::Operator) {
    return 0;
  }
  if (t.text == "<") return 1;
  if (t.text == ">") return -1;
  if (t.text == ">>") return -2;
  if (t.text == ">>>") return -3;
  return 0;
}

// ============================================================================
// EcmaScriptExtractor
// ============================================================================

class EcmaScriptExtractor
{
public:
  EcmaScriptExtractor(gsl::span<const Token> tokens, std::string_view content, ParseResult & out)
  : tokens_(tokens), content_(content), out_(out)
  {
  }

  void run()
  {
    collect_imports();
    collect_text_requires();
    collect_declarations();
    collect_references(tokens_);
  }

private:
  [[nodiscard]] const Token & at(size_t i) const noexcept
  {
    return i < tokens_.size() ? tokens_[i] : eof_;
  }
  [[nodiscard]] bool is_eof(size_t i) const noexcept { return at(i).kind == TokenKind::Eof; }

  /// Index just past the bracket matching the one at `j`.
  [[nodiscard]] size_t skip_balanced(size_t j) const noexcept
  {
    int nest = 0;
    for (; !is_eof(j); ++j) {
      if (is_open(at(j))) {
        ++nest;
      } else if (is_close(at(j))) {
        if (--nest <= 0) {
          return j + 1;
        }
      }
    }
    return j;
  }

  /// Index just past the type argument list opening at `j`.
  [[nodiscard]] size_t skip_angle(size_t j) const noexcept
  {
    int depth = 0;
    for (; !is_eof(j); ++j) {
      depth += angle_delta(at(j));
      if (depth <= 0) {
        return j + 1;
      }
    }
    return j;
  }

  // --------------------------------------------------------------------------
  // Imports
  // --------------------------------------------------------------------------

  void collect_imports()
  {
    for (size_t i = 0; i < tokens_.size(); ++i) {
      const Token & t = at(i);
      const bool member = i > 0 && (at(i - 1).is_punct('.') || at(i - 1).is_op("?."));

      if (t.is_keyword("import") && !member) {
        const Token & next = at(i + 1);
        if (next.is_punct('(')) {
          if (at(i + 2).is(TokenKind::String)) {
            add_import(unquote(at(i + 2).text), DynamicImport{}, {}, t);
          }
          continue;
        }
        if (next.is_punct('.')) {
          continue;  // import.meta
        }
        if (next.is(TokenKind::String)) {
          add_import(unquote(next.text), SideEffectImport{}, {}, t);
          continue;
        }
        if (is_name_token(next) && at(i + 2).is_op("=")) {
          continue;  // import x = require('m') is picked up as a require
        }
        parse_import_clause(i);
      } else if (
        t.is(TokenKind::Identifier, "require") && !member && at(i + 1).is_punct('(') &&
        at(i + 2).is(TokenKind::String)) {
        add_import(unquote(at(i + 2).text), RequireImport{}, {}, t);
      }
    }
  }

  void add_import(
    std::string source, ImportDetail detail, std::vector<ImportBinding> names, const Token & at_tok)
  {
    out_.imports.emplace_back(
      std::move(source), std::move(detail), std::move(names), at_tok.line, at_tok.column);
  }

  void parse_import_clause(size_t i)
  {
    size_t j = i + 1;
    bool type_only = false;
    if (at(j).is_keyword("type") && !at(j + 1).is_keyword("from") && !at(j + 1).is_punct(',')) {
      type_only = true;
      ++j;
    }

    std::vector<ImportBinding> names;
    bool has_default = false;
    bool has_namespace = false;
    bool has_named = false;
    std::optional<std::string> source;

    // The search for `from` stops at the end of the statement
    while (true) {
      const Token & c = at(j);
      if (c.kind == TokenKind::Eof || c.is_punct(';')) {
        break;
      }
      if (c.is_keyword("from") && at(j + 1).is(TokenKind::String)) {
        source = unquote(at(j + 1).text);
        break;
      }
      if (c.is_keyword("import") || c.is_keyword("export") || c.is(TokenKind::String)) {
        break;
      }
      if (c.is_op("*")) {
        if (at(j + 1).is_keyword("as") && is_name_token(at(j + 2))) {
          names.push_back(ImportBinding{"*", std::string(at(j + 2).text)});
          has_namespace = true;
          j += 3;
        } else {
          ++j;
        }
        continue;
      }
      if (c.is_punct('{')) {
        j = parse_named_bindings(j, names);
        has_named = true;
        continue;
      }
      if (c.is(TokenKind::Identifier) || (c.is(TokenKind::Keyword) && !c.is_keyword("from"))) {
        names.push_back(ImportBinding{std::string(c.text), std::nullopt});
        has_default = true;
      }
      ++j;
    }

    if (!source) {
      return;
    }

    ImportDetail detail = NamedImport{type_only};
    if (has_namespace) {
      detail = NamespaceImport{};
    } else if (!has_named && has_default) {
      detail = DefaultImport{};
    }
    add_import(std::move(*source), std::move(detail), std::move(names), at(i));
  }

  /// Parses `{a, b as c, type d}` starting at '{'; returns the index past '}'.
  size_t parse_named_bindings(size_t j, std::vector<ImportBinding> & names) const
  {
    ++j;
    while (true) {
      const Token & c = at(j);
      if (c.is_punct('}')) {
        return j + 1;
      }
      if (c.kind == TokenKind::Eof || c.is_punct(';')) {
        return j;
      }
      // Inline type modifier: {type Foo}
      if (
        c.is_keyword("type") && (is_name_token(at(j + 1)) || at(j + 1).is(TokenKind::String)) &&
        !at(j + 1).is_keyword("as")) {
        ++j;
        continue;
      }
      if (is_name_token(c) || c.is(TokenKind::String)) {
        ImportBinding b{
          c.is(TokenKind::String) ? unquote(c.text) : std::string(c.text), std::nullopt};
        if (at(j + 1).is_keyword("as") && is_name_token(at(j + 2))) {
          b.alias = std::string(at(j + 2).text);
          j += 3;
        } else {
          ++j;
        }
        names.push_back(std::move(b));
        continue;
      }
      ++j;
    }
  }

  // Recall-improving pass over the raw text; duplicates by (source, kind)
  // of what the token scan found are dropped.
  void collect_text_requires()
  {
    constexpr std::string_view k_require = "require";

    uint32_t line = 1;
    size_t line_start = 0;
    size_t counted = 0;
    std::set<std::string> seen;
    for (const auto & imp : out_.imports) {
      if (imp.kind() == ImportKind::Require) {
        seen.insert(imp.source());
      }
    }

    size_t pos = 0;
    while ((pos = content_.find(k_require, pos)) != std::string_view::npos) {
      const size_t offset = pos;
      pos += k_require.size();
      if (offset > 0 && (content_[offset - 1] == '.' || is_word_char(content_[offset - 1]))) {
        continue;  // obj.require(...) or a longer identifier
      }

      std::string source;
      if (!match_require_call(pos, source)) {
        continue;
      }

      if (!seen.insert(source).second) {
        continue;
      }

      for (; counted < offset; ++counted) {
        if (content_[counted] == '\n') {
          ++line;
          line_start = counted + 1;
        }
      }
      const auto column = static_cast<uint32_t>(offset - line_start + 1);
      out_.imports.emplace_back(
        std::move(source), RequireImport{true}, std::vector<ImportBinding>{}, line, column);
    }
  }

  [[nodiscard]] static bool is_word_char(char c) noexcept
  {
    return c == '_' || c == '$' || std::isalnum(static_cast<unsigned char>(c)) != 0;
  }

  [[nodiscard]] static bool is_space_char(char c) noexcept
  {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  }

  [[nodiscard]] size_t skip_spaces(size_t i) const noexcept
  {
    while (i < content_.size() && is_space_char(content_[i])) {
      ++i;
    }
    return i;
  }

  /// Matches `\s*(\s*'spec'\s*)` at `i`; the specifier may not span lines.
  bool match_require_call(size_t i, std::string & source) const
  {
    i = skip_spaces(i);
    if (i >= content_.size() || content_[i] != '(') {
      return false;
    }
    i = skip_spaces(i + 1);
    if (i >= content_.size() || (content_[i] != '\'' && content_[i] != '"')) {
      return false;
    }
    const size_t body = ++i;
    while (i < content_.size() && content_[i] != '\'' && content_[i] != '"' &&
           content_[i] != '\n') {
      ++i;
    }
    if (i == body || i >= content_.size() || content_[i] == '\n') {
      return false;
    }
    const size_t close = skip_spaces(i + 1);
    if (close >= content_.size() || content_[close] != ')') {
      return false;
    }
    source = std::string(content_.substr(body, i - body));
    return true;
  }

  // --------------------------------------------------------------------------
  // Declarations (brace depth 0 only)
  // --------------------------------------------------------------------------

  void collect_declarations()
  {
    int depth = 0;
    for (size_t i = 0; i < tokens_.size(); ++i) {
      const Token & t = at(i);
      if (t.is_punct('{')) {
        ++depth;
        continue;
      }
      if (t.is_punct('}')) {
        depth = std::max(0, depth - 1);
        continue;
      }
      if (depth != 0 || t.kind != TokenKind::Keyword || !at_statement_start(i)) {
        continue;
      }

      if (t.text == "const" || t.text == "let" || t.text == "var") {
        declare_variables(i);
      } else if (t.text == "function") {
        declare_function(i);
      } else if (t.text == "class") {
        declare_named(i, ClassDecl{}, "class");
      } else if (t.text == "interface") {
        declare_named(i, InterfaceDecl{}, "interface");
      } else if (t.text == "enum") {
        declare_named(i, EnumDecl{}, "enum");
      } else if (t.text == "type") {
        declare_type_alias(i);
      }
    }
  }

  [[nodiscard]] size_t first_modifier(size_t i) const noexcept
  {
    size_t k = i;
    while (k > 0 && is_modifier(at(k - 1))) {
      --k;
    }
    return k;
  }

  [[nodiscard]] bool exported_at(size_t i) const noexcept
  {
    for (size_t k = first_modifier(i); k < i; ++k) {
      if (at(k).is_keyword("export")) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] bool at_statement_start(size_t i) const noexcept
  {
    const size_t k = first_modifier(i);
    if (k == 0) {
      return true;
    }
    const Token & prev = at(k - 1);
    if (prev.is_punct(';') || prev.is_punct('}') || prev.is_punct('{')) {
      return true;
    }
    // A line break after a complete expression ends the previous statement
    return prev.line < at(k).line && ends_expression(prev);
  }

  void record(const Token & name, DeclarationDetail detail, std::string descriptor, bool exported)
  {
    binding_offsets_.insert(name.begin());
    std::string key(name.text);
    out_.declarations.insert_or_assign(
      key, Declaration(
             key, std::move(detail), name.line, std::move(descriptor), exported, name.column));
  }

  void declare_variables(size_t i)
  {
    const std::string descriptor(at(i).text);
    const bool exported = exported_at(i);

    size_t j = i + 1;
    while (true) {
      const Token & t = at(j);
      if (t.is(TokenKind::Identifier)) {
        if (is_binding_name(t)) {
          record(t, VariableDecl{}, descriptor, exported);
        }
        ++j;
      } else if (t.is_punct('{') || t.is_punct('[')) {
        std::vector<size_t> bound;
        j = collect_pattern(j, bound);
        for (const size_t b : bound) {
          if (is_binding_name(at(b))) {
            record(at(b), VariableDecl{}, descriptor, exported);
          }
        }
      } else {
        return;
      }

      j = skip_declarator_tail(j);
      if (!at(j).is_punct(',')) {
        return;
      }
      ++j;
    }
  }

  /// Skips `: Type = init` up to the next declarator comma or statement end.
  [[nodiscard]] size_t skip_declarator_tail(size_t j) const noexcept
  {
    int nest = 0;
    int angle = 0;
    bool in_type = false;
    for (; !is_eof(j); ++j) {
      const Token & t = at(j);
      if (is_open(t)) {
        ++nest;
      } else if (is_close(t)) {
        if (nest == 0) {
          return j;
        }
        --nest;
      } else if (nest == 0) {
        if (t.is_punct(':')) {
          in_type = true;
        } else if (t.is_op("=")) {
          in_type = false;
          angle = 0;
        } else if (in_type) {
          angle = std::max(0, angle + angle_delta(t));
        }
        if ((t.is_punct(',') && angle == 0) || t.is_punct(';')) {
          return j;
        }
        if (t.line > at(j - 1).line && ends_expression(at(j - 1)) && starts_statement(t)) {
          return j;
        }
      }
    }
    return j;
  }

  /// Collects binding identifiers of a destructuring pattern at `j`;
  /// returns the index past the pattern.
  size_t collect_pattern(size_t j, std::vector<size_t> & out) const
  {
    const bool object = at(j).is_punct('{');
    const char close = object ? '}' : ']';
    ++j;
    while (true) {
      const Token & t = at(j);
      if (t.kind == TokenKind::Eof) {
        return j;
      }
      if (t.is_punct(close)) {
        return j + 1;
      }
      if (is_close(t)) {
        return j;  // malformed
      }
      if (t.is_punct(',')) {
        ++j;
        continue;
      }

      if (t.is_op("...")) {
        ++j;
        j = collect_target(j, out);
      } else if (object) {
        const size_t key = j;
        j = t.is_punct('[') ? skip_balanced(j) : j + 1;  // computed key
        if (at(j).is_punct(':')) {
          j = collect_target(j + 1, out);
        } else if (at(key).is(TokenKind::Identifier)) {
          out.push_back(key);  // shorthand {a}
        }
      } else {
        j = collect_target(j, out);
      }

      j = skip_element_tail(j);
    }
  }

  size_t collect_target(size_t j, std::vector<size_t> & out) const
  {
    if (at(j).is(TokenKind::Identifier)) {
      out.push_back(j);
      return j + 1;
    }
    if (at(j).is_punct('{') || at(j).is_punct('[')) {
      return collect_pattern(j, out);
    }
    return j;
  }

  /// Skips a default value up to ',' or the closing bracket of the pattern.
  [[nodiscard]] size_t skip_element_tail(size_t j) const noexcept
  {
    int nest = 0;
    for (; !is_eof(j); ++j) {
      const Token & t = at(j);
      if (is_open(t)) {
        ++nest;
      } else if (is_close(t)) {
        if (nest == 0) {
          return j;
        }
        --nest;
      } else if (nest == 0 && t.is_punct(',')) {
        return j;
      }
    }
    return j;
  }

  void declare_function(size_t i)
  {
    size_t j = i + 1;
    bool is_generator = false;
    if (at(j).is_op("*")) {
      is_generator = true;
      ++j;
    }
    const Token & name = at(j);
    if (!is_binding_name(name)) {
      return;
    }
    const bool is_async = i > 0 && at(i - 1).is_keyword("async");

    std::string descriptor = "function";
    if (is_async) {
      descriptor = "async function";
    } else if (is_generator) {
      descriptor = "generator function";
    }

    FunctionDecl fn{function_signature(j + 1, name.text, is_async, is_generator), is_async, is_generator};
    record(name, std::move(fn), std::move(descriptor), exported_at(i));
  }

  // function name(a: string, b, ...rest): number
  [[nodiscard]] std::string function_signature(
    size_t j, std::string_view name, bool is_async, bool is_generator) const
  {
    const std::string head =
      fmt::format("{}function{} {}", is_async ? "async " : "", is_generator ? "*" : "", name);

    if (at(j).is_op("<")) {
      j = skip_angle(j);
    }
    if (!at(j).is_punct('(')) {
      return head + "()";
    }

    const size_t close = skip_balanced(j) - 1;
    std::vector<std::string> params;
    for (const auto & [b, e] : split_parameters(j + 1, close)) {
      std::string p = describe_parameter(b, e);
      if (!p.empty()) {
        params.push_back(std::move(p));
      }
    }

    std::string ret;
    if (at(close).is_punct(')') && at(close + 1).is_punct(':')) {
      const Token & type = at(close + 2);
      const Token & after = at(close + 3);
      const bool single = after.is_punct('{') || after.is_punct(';') ||
                          after.kind == TokenKind::Eof || after.line > type.line;
      if (is_name_token(type) && single) {
        ret = fmt::format(": {}", type.text);
      }
    }

    return fmt::format("{}({}){}", head, fmt::join(params, ", "), ret);
  }

  /// Splits [begin, end) on top-level commas.
  [[nodiscard]] std::vector<std::pair<size_t, size_t>> split_parameters(
    size_t begin, size_t end) const
  {
    std::vector<std::pair<size_t, size_t>> out;
    int nest = 0;
    int angle = 0;
    bool in_type = false;
    size_t start = begin;
    for (size_t k = begin; k < end && !is_eof(k); ++k) {
      const Token & t = at(k);
      if (is_open(t)) {
        ++nest;
      } else if (is_close(t)) {
        --nest;
      } else if (nest == 0) {
        if (t.is_punct(':')) {
          in_type = true;
        } else if (t.is_op("=")) {
          in_type = false;
        } else if (in_type) {
          angle = std::max(0, angle + angle_delta(t));
        }
        if (t.is_punct(',') && angle == 0) {
          out.emplace_back(start, k);
          start = k + 1;
          in_type = false;
        }
      }
    }
    if (start < end) {
      out.emplace_back(start, end);
    }
    return out;
  }

  [[nodiscard]] std::string describe_parameter(size_t k, size_t e) const
  {
    // Constructor parameter properties
    while (k < e && at(k).is(TokenKind::Keyword) &&
           (at(k).text == "public" || at(k).text == "private" || at(k).text == "protected" ||
            at(k).text == "readonly")) {
      ++k;
    }
    if (k >= e) {
      return {};
    }

    std::string out;
    if (at(k).is_op("...")) {
      out = "...";
      ++k;
    }

    const Token & first = at(k);
    if (first.is_punct('{')) {
      out += "{...}";
      k = skip_balanced(k);
    } else if (first.is_punct('[')) {
      out += "[...]";
      k = skip_balanced(k);
    } else if (is_name_token(first)) {
      out += first.text;
      ++k;
    } else {
      return out;
    }

    if (k < e && at(k).is_op("?")) {
      out += "?";
      ++k;
    }
    if (k < e && at(k).is_punct(':')) {
      const size_t type_begin = k + 1;
      size_t type_end = type_begin;
      while (type_end < e && !at(type_end).is_op("=")) {
        ++type_end;
      }
      if (type_end == type_begin + 1 && is_name_token(at(type_begin))) {
        out += fmt::format(": {}", at(type_begin).text);
      }
    }
    return out;
  }

  template <typename Detail>
  void declare_named(size_t i, Detail detail, const char * descriptor)
  {
    const Token & name = at(i + 1);
    if (is_binding_name(name)) {
      record(name, std::move(detail), descriptor, exported_at(i));
    }
  }

  // type Name<T> = ...
  void declare_type_alias(size_t i)
  {
    const Token & name = at(i + 1);
    if (!is_binding_name(name)) {
      return;
    }
    size_t j = i + 2;
    if (at(j).is_op("<")) {
      j = skip_angle(j);
    }
    if (at(j).is_op("=")) {
      record(name, TypeAliasDecl{}, "type", exported_at(i));
    }
  }

  // --------------------------------------------------------------------------
  // Identifier references
  // --------------------------------------------------------------------------

  void collect_references(gsl::span<const Token> tokens)
  {
    bool in_import = false;
    for (size_t i = 0; i < tokens.size(); ++i) {
      const Token & t = tokens[i];
      const Token * prev = (i > 0) ? &tokens[i - 1] : nullptr;

      if (t.is_keyword("import")) {
        const bool expression = i + 1 < tokens.size() &&
                                (tokens[i + 1].is_punct('(') || tokens[i + 1].is_punct('.'));
        in_import = !expression;
        continue;
      }
      if (in_import) {
        if (t.is(TokenKind::String) || t.is_punct(';')) {
          in_import = false;
        }
        continue;
      }

      if (t.is(TokenKind::Template)) {
        const std::vector<Token> inner = syntax::lex_template_interpolations(t);
        collect_references(inner);
        continue;
      }

      if (!t.is(TokenKind::Identifier) || syntax::is_builtin_name(t.text)) {
        continue;
      }
      if (binding_offsets_.count(t.begin()) > 0) {
        continue;
      }
      if (prev != nullptr) {
        if (
          prev->is(TokenKind::Keyword) && (syntax::is_declaring_keyword(prev->text) ||
                                           prev->text == "as" || prev->text == "from")) {
          continue;
        }
        if (prev->is_punct('.') || prev->is_op("?.")) {
          continue;  // member access
        }
      }
      out_.identifiers.push_back(IdentifierRef{t.line, std::string(t.text)});
    }
  }

  gsl::span<const Token> tokens_;
  std::string_view content_;
  ParseResult & out_;
  std::set<uint32_t> binding_offsets_;  // declaration names are not references
  Token eof_;
};

}  // namespace

// ============================================================================
// Language selection
// ============================================================================

bool has_typescript_markers(std::string_view content)
{
  if (
    contains(content, "interface ") || contains(content, ": string") ||
    contains(content, ": number") || contains(content, "enum ") ||
    contains(content, "declare ")) {
    return true;
  }
  return has_generic_brackets(content);
}

std::string select_ecmascript_language(std::string_view content, std::string_view filename)
{
  const std::string ext = extension_of(filename);
  if (one_of(k_typescript_extensions, ext)) {
    return k_language_typescript;
  }
  if (one_of(k_javascript_extensions, ext)) {
    return k_language_javascript;
  }
  return has_typescript_markers(content) ? k_language_typescript : k_language_javascript;
}

// ============================================================================
// EcmaScriptParser
// ============================================================================

std::optional<std::string> EcmaScriptParser::language_for_extension(
  std::string_view extension) const
{
  if (one_of(k_typescript_extensions, extension)) {
    return std::string(k_language_typescript);
  }
  if (one_of(k_javascript_extensions, extension)) {
    return std::string(k_language_javascript);
  }
  return std::nullopt;
}

std::vector<LanguageScore> EcmaScriptParser::score_content(std::string_view content) const
{
  int js = 0;
  if (contains(content, "function ") || contains(content, "=>")) {
    js += 2;
  }
  if (contains(content, "const ") || contains(content, "let ") || contains(content, "var ")) {
    js += 2;
  }
  if (contains(content, "require(")) {
    js += 2;
  }
  if (contains(content, "{") && contains(content, "}")) {
    js += 1;
  }

  int ts = 0;
  if (
    contains(content, ": string") || contains(content, ": number") ||
    contains(content, ": boolean")) {
    ts += 3;
  }
  if (contains(content, "interface ")) {
    ts += 3;
  }
  if (contains(content, "type ") && contains(content, "=")) {
    ts += 2;
  }

  // TypeScript is a superset: its score includes the JavaScript markers
  return {LanguageScore{k_language_javascript, js}, LanguageScore{k_language_typescript, ts + js}};
}

ParseResult EcmaScriptParser::parse(
  std::string_view content, std::string_view filename, std::string_view language) const
{
  syntax::Lexer lexer(content);
  const std::vector<syntax::Token> tokens = lexer.lex_all();
  return parse_tokens(tokens, content, filename, language);
}

ParseResult EcmaScriptParser::parse_tokens(
  gsl::span<const syntax::Token> tokens, std::string_view content, std::string_view filename,
  std::string_view language) const
{
  ParseResult result;
  if (language == k_language_javascript || language == k_language_typescript) {
    result.language = std::string(language);
  } else {
    result.language = select_ecmascript_language(content, filename);
  }
  result.raw = std::string(content);

  EcmaScriptExtractor(tokens, content, result).run();
  return result;
}

}  // namespace srcsym::lang
