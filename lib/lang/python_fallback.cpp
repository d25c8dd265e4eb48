// srcsym/lang/python_fallback.cpp - Line-based Python extraction
#include <array>
#include <cctype>
#include <optional>
#include <utility>

#include "srcsym/lang/python_parser.hpp"

namespace srcsym::lang::python_fallback
{
namespace
{

constexpr std::array<std::string_view, 35> k_python_keywords = {
  "if",     "else",   "elif",     "for",   "while",  "return", "def",   "class", "import",
  "from",   "as",     "try",      "except", "finally", "with",  "lambda", "and",  "or",
  "not",    "in",     "is",       "True",  "False",  "None",   "pass",  "break", "continue",
  "raise",  "yield",  "global",   "nonlocal", "del", "assert", "async", "await",
};

bool is_python_keyword(std::string_view w)
{
  for (const auto k : k_python_keywords) {
    if (k == w) {
      return true;
    }
  }
  return false;
}

struct SourceLine
{
  uint32_t number;
  std::string text;
};

std::vector<SourceLine> split_lines(std::string_view content)
{
  std::vector<SourceLine> lines;
  uint32_t number = 1;
  size_t start = 0;
  while (start <= content.size()) {
    size_t end = content.find('\n', start);
    if (end == std::string_view::npos) {
      end = content.size();
    }
    std::string text(content.substr(start, end - start));
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
    lines.push_back({number++, std::move(text)});
    start = end + 1;
  }
  return lines;
}

std::string trim(std::string_view s)
{
  const size_t b = s.find_first_not_of(" \t");
  if (b == std::string_view::npos) {
    return {};
  }
  const size_t e = s.find_last_not_of(" \t");
  return std::string(s.substr(b, e - b + 1));
}

std::string strip_comment(const std::string & s)
{
  const size_t hash = s.find('#');
  return hash == std::string::npos ? s : s.substr(0, hash);
}

bool is_word(char c) { return c == '_' || std::isalnum(static_cast<unsigned char>(c)) != 0; }
bool is_name_start(char c) { return c == '_' || std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Line scanning: every helper moves `i` forward only, so one line is one pass.

size_t skip_spaces(std::string_view s, size_t i)
{
  while (i < s.size() && is_space(s[i])) {
    ++i;
  }
  return i;
}

/// Matches `word` followed by at least one space at `i`; returns the index
/// past the spaces.
std::optional<size_t> keyword_then_space(std::string_view s, size_t i, std::string_view word)
{
  if (s.substr(i, word.size()) != word) {
    return std::nullopt;
  }
  i += word.size();
  if (i >= s.size() || !is_space(s[i])) {
    return std::nullopt;
  }
  return skip_spaces(s, i);
}

/// Scans a `[A-Za-z_]\w*` name at `i`; returns its end, or `i` when absent.
size_t scan_name(std::string_view s, size_t i)
{
  if (i >= s.size() || !is_name_start(s[i])) {
    return i;
  }
  while (i < s.size() && is_word(s[i])) {
    ++i;
  }
  return i;
}

/// "a as b" -> (a, b); "a" -> (a, none)
ImportBinding split_alias(const std::string & part)
{
  const std::string_view s = part;
  size_t i = 0;
  while (i < s.size() && (is_word(s[i]) || s[i] == '.' || s[i] == '*')) {
    ++i;
  }
  const size_t name_end = i;
  if (name_end > 0 && name_end < s.size() && is_space(s[name_end])) {
    if (auto after_as = keyword_then_space(s, skip_spaces(s, name_end), "as")) {
      size_t k = *after_as;
      while (k < s.size() && is_word(s[k])) {
        ++k;
      }
      if (k > *after_as && k == s.size()) {
        return ImportBinding{std::string(s.substr(0, name_end)), std::string(s.substr(*after_as))};
      }
    }
  }
  return ImportBinding{part, std::nullopt};
}

std::vector<std::string> split_commas(const std::string & list)
{
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= list.size()) {
    size_t comma = list.find(',', start);
    if (comma == std::string::npos) {
      comma = list.size();
    }
    std::string part = trim(std::string_view(list).substr(start, comma - start));
    if (!part.empty()) {
      out.push_back(std::move(part));
    }
    start = comma + 1;
  }
  return out;
}

bool is_exported(const std::string & name) { return !name.empty() && name.front() != '_'; }

}  // namespace

std::vector<Import> find_imports(std::string_view content)
{
  std::vector<Import> imports;
  for (const auto & line : split_lines(content)) {
    const std::string text = strip_comment(line.text);
    const std::string_view t = text;

    // import a, b as c
    if (auto rest = keyword_then_space(t, 0, "import"); rest && *rest < t.size()) {
      for (const auto & part : split_commas(text.substr(*rest))) {
        ImportBinding b = split_alias(part);
        std::string source = b.name;
        imports.emplace_back(
          std::move(source), PlainImport{}, std::vector<ImportBinding>{std::move(b)},
          line.number, 1);
      }
      continue;
    }

    // from mod import a, (b as c)
    const auto after_from = keyword_then_space(t, 0, "from");
    if (!after_from) {
      continue;
    }
    size_t i = *after_from;
    while (i < t.size() && (is_word(t[i]) || t[i] == '.')) {
      ++i;
    }
    if (i == *after_from || i >= t.size() || !is_space(t[i])) {
      continue;
    }
    const auto after_import = keyword_then_space(t, skip_spaces(t, i), "import");
    if (!after_import || *after_import >= t.size()) {
      continue;
    }

    std::string module(t.substr(*after_from, i - *after_from));
    std::string cleaned;
    for (const char c : t.substr(*after_import)) {
      if (c != '(' && c != ')' && c != '\\') {
        cleaned += c;
      }
    }
    std::vector<ImportBinding> names;
    for (const auto & part : split_commas(cleaned)) {
      names.push_back(split_alias(part));
    }
    const bool is_future = module == "__future__";
    imports.emplace_back(
      std::move(module), FromImport{is_future}, std::move(names), line.number, 1);
  }
  return imports;
}

std::map<std::string, Declaration> find_declarations(std::string_view content)
{
  std::map<std::string, Declaration> declarations;
  for (const auto & line : split_lines(content)) {
    const std::string_view t = line.text;

    // [async] def name(
    const auto after_async = keyword_then_space(t, 0, "async");
    const auto after_def = keyword_then_space(t, after_async.value_or(0), "def");
    if (after_def) {
      const size_t name_end = scan_name(t, *after_def);
      const size_t paren = skip_spaces(t, name_end);
      if (name_end > *after_def && paren < t.size() && t[paren] == '(') {
        const bool is_async = after_async.has_value();
        std::string name(t.substr(*after_def, name_end - *after_def));
        const auto column = static_cast<uint32_t>(*after_def) + 1;
        declarations.insert_or_assign(
          name, Declaration(
                  name, FunctionDecl{"", is_async, false}, line.number,
                  is_async ? "async function" : "function", is_exported(name), column));
        continue;
      }
    }

    // class Name
    if (auto after_class = keyword_then_space(t, 0, "class")) {
      const size_t name_end = scan_name(t, *after_class);
      if (name_end > *after_class) {
        std::string name(t.substr(*after_class, name_end - *after_class));
        const auto column = static_cast<uint32_t>(*after_class) + 1;
        declarations.insert_or_assign(
          name, Declaration(name, ClassDecl{}, line.number, "class", is_exported(name), column));
        continue;
      }
    }

    // name [: annotation] = value, but not name == value
    const size_t name_end = scan_name(t, 0);
    if (name_end == 0) {
      continue;
    }
    size_t i = skip_spaces(t, name_end);
    bool annotated = false;
    if (i < t.size() && t[i] == ':') {
      const size_t eq = t.find('=', i + 1);
      if (eq == std::string_view::npos || eq == i + 1) {
        continue;
      }
      annotated = true;
      i = eq;
    }
    if (i >= t.size() || t[i] != '=' || (i + 1 < t.size() && t[i + 1] == '=')) {
      continue;
    }
    std::string name(t.substr(0, name_end));
    if (is_python_keyword(name)) {
      continue;
    }
    declarations.try_emplace(
      name, name, VariableDecl{}, line.number, annotated ? "annotated variable" : "variable",
      is_exported(name), 1u);
  }
  return declarations;
}

std::vector<IdentifierRef> find_identifiers(std::string_view content)
{
  std::vector<IdentifierRef> identifiers;
  for (const auto & line : split_lines(content)) {
    const std::string text = strip_comment(line.text);
    const std::string head = trim(text);
    if (head.rfind("import ", 0) == 0 || head.rfind("from ", 0) == 0) {
      continue;
    }

    bool after_def = false;
    for (size_t i = 0; i < text.size();) {
      if (!is_word(text[i])) {
        ++i;
        continue;
      }
      const size_t start = i;
      while (i < text.size() && is_word(text[i])) {
        ++i;
      }
      if (!is_name_start(text[start])) {
        continue;  // a run that starts with a digit is a number
      }
      const std::string word = text.substr(start, i - start);
      if (after_def) {
        after_def = false;
        continue;
      }
      if (word == "def" || word == "class") {
        after_def = true;
        continue;
      }
      if (is_python_keyword(word)) {
        continue;
      }
      identifiers.push_back(IdentifierRef{line.number, word});
    }
  }
  return identifiers;
}

}  // namespace srcsym::lang::python_fallback
