// srcsym/syntax/keywords.hpp - ECMAScript/TypeScript word lists
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace srcsym::syntax
{

// NOTE: Contextual TypeScript words (type, from, as, declare, ...) are lexed
// as keywords too; names spelled like them are never recorded as bindings.

inline constexpr std::array<std::string_view, 57> k_reserved_keywords = {
  "break",     "case",       "catch",     "class",      "const",     "continue",  "debugger",
  "default",   "delete",     "do",        "else",       "export",    "extends",   "finally",
  "for",       "function",   "if",        "import",     "in",        "instanceof", "new",
  "return",    "super",      "switch",    "this",       "throw",     "try",       "typeof",
  "var",       "void",       "while",     "with",       "yield",     "let",       "static",
  "enum",      "await",      "implements", "package",   "protected", "interface", "private",
  "public",    "abstract",   "readonly",  "as",         "from",      "type",      "namespace",
  "declare",   "module",     "get",       "set",        "async",     "true",      "false",
  "of",
};

// Built-in types and well-known globals.
inline constexpr std::array<std::string_view, 50> k_builtin_names = {
  "string",      "number",       "boolean",      "symbol",      "bigint",
  "undefined",   "null",         "object",       "any",         "unknown",
  "never",       "void",         "Array",        "Record",      "Partial",
  "Required",    "Readonly",     "Pick",         "Omit",        "Exclude",
  "Extract",     "NonNullable",  "Parameters",   "ReturnType",  "InstanceType",
  "ThisParameterType", "OmitThisParameter", "ThisType", "Uppercase", "Lowercase",
  "Capitalize",  "Uncapitalize", "Promise",      "Map",         "Set",
  "WeakMap",     "WeakSet",      "Date",         "RegExp",      "Error",
  "Function",    "String",       "Number",       "Boolean",     "Object",
  "console",     "window",       "document",     "process",     "Buffer",
};

inline constexpr std::array<std::string_view, 2> k_builtin_namespaces = {"Math", "JSON"};

// Keywords that introduce a binding name.
inline constexpr std::array<std::string_view, 8> k_declaring_keywords = {
  "const", "let", "var", "function", "class", "interface", "type", "enum",
};

template <size_t N>
[[nodiscard]] bool contains(
  const std::array<std::string_view, N> & words, std::string_view w) noexcept
{
  return std::find(words.begin(), words.end(), w) != words.end();
}

[[nodiscard]] inline bool is_reserved_keyword(std::string_view w) noexcept
{
  return contains(k_reserved_keywords, w);
}

[[nodiscard]] inline bool is_builtin_name(std::string_view w) noexcept
{
  return contains(k_builtin_names, w) || contains(k_builtin_namespaces, w);
}

[[nodiscard]] inline bool is_declaring_keyword(std::string_view w) noexcept
{
  return contains(k_declaring_keywords, w);
}

}  // namespace srcsym::syntax
