// srcsym/model/symbols.hpp - Language-agnostic symbol model
//
// Imports, top-level declarations and identifier references extracted from
// one source text. Heterogeneous shapes are tagged variants; the kind enums
// are derived from the active alternative.
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace srcsym
{

// ============================================================================
// Language tags
// ============================================================================

inline constexpr const char * k_language_python = "python";
inline constexpr const char * k_language_javascript = "javascript";
inline constexpr const char * k_language_typescript = "typescript";
inline constexpr const char * k_language_unknown = "unknown";

// ============================================================================
// Imports
// ============================================================================

enum class ImportKind : uint8_t {
  Plain,       // import a.b
  From,        // from a import b
  Namespace,   // import * as ns from 'm'
  Named,       // import {a, b as c} from 'm'
  Default,     // import d from 'm'
  SideEffect,  // import 'm'
  Require,     // require('m')
  Dynamic,     // import('m')
};

[[nodiscard]] std::string_view to_string(ImportKind k) noexcept;

/// One `(name, alias)` entry of an import clause.
struct ImportBinding
{
  std::string name;
  std::optional<std::string> alias;

  [[nodiscard]] bool operator==(const ImportBinding & other) const
  {
    return name == other.name && alias == other.alias;
  }
  [[nodiscard]] bool operator!=(const ImportBinding & other) const { return !(*this == other); }
};

struct PlainImport
{
  [[nodiscard]] bool operator==(const PlainImport &) const noexcept { return true; }
};

struct FromImport
{
  bool is_future = false;  // from __future__ import ...

  [[nodiscard]] bool operator==(const FromImport & o) const noexcept
  {
    return is_future == o.is_future;
  }
};

struct NamespaceImport
{
  [[nodiscard]] bool operator==(const NamespaceImport &) const noexcept { return true; }
};

struct NamedImport
{
  bool type_only = false;  // import type {...}

  [[nodiscard]] bool operator==(const NamedImport & o) const noexcept
  {
    return type_only == o.type_only;
  }
};

struct DefaultImport
{
  [[nodiscard]] bool operator==(const DefaultImport &) const noexcept { return true; }
};

struct SideEffectImport
{
  [[nodiscard]] bool operator==(const SideEffectImport &) const noexcept { return true; }
};

struct RequireImport
{
  bool from_text_scan = false;  // recovered by the text-level fallback pass

  [[nodiscard]] bool operator==(const RequireImport & o) const noexcept
  {
    return from_text_scan == o.from_text_scan;
  }
};

struct DynamicImport
{
  [[nodiscard]] bool operator==(const DynamicImport &) const noexcept { return true; }
};

/// Alternative order matches ImportKind.
using ImportDetail = std::variant<
  PlainImport, FromImport, NamespaceImport, NamedImport, DefaultImport, SideEffectImport,
  RequireImport, DynamicImport>;

/**
 * One import/require statement.
 *
 * Relativity is always computed from the specifier at construction: a
 * specifier is relative iff it starts with '.', and its level is the number
 * of leading dots ("./x" -> 1, "../x" -> 2, Python ".." -> 2).
 */
class Import
{
public:
  Import(
    std::string source, ImportDetail detail, std::vector<ImportBinding> names, uint32_t line,
    uint32_t column = 0);

  [[nodiscard]] const std::string & source() const noexcept { return source_; }
  [[nodiscard]] const ImportDetail & detail() const noexcept { return detail_; }
  [[nodiscard]] ImportKind kind() const noexcept
  {
    return static_cast<ImportKind>(detail_.index());
  }
  [[nodiscard]] const std::vector<ImportBinding> & names() const noexcept { return names_; }
  [[nodiscard]] uint32_t line() const noexcept { return line_; }
  [[nodiscard]] uint32_t column() const noexcept { return column_; }

  [[nodiscard]] bool is_relative() const noexcept { return level_ > 0; }
  [[nodiscard]] uint32_t level() const noexcept { return level_; }

  /**
   * Names this import introduces into the file's scope.
   *
   * The alias wins when present. A plain `import a.b.c` binds `a`, and a
   * wildcard without alias binds nothing.
   */
  [[nodiscard]] std::vector<std::string> bound_names() const;

  [[nodiscard]] bool operator==(const Import & other) const;
  [[nodiscard]] bool operator!=(const Import & other) const { return !(*this == other); }

private:
  std::string source_;
  ImportDetail detail_;
  std::vector<ImportBinding> names_;
  uint32_t line_ = 0;
  uint32_t column_ = 0;
  uint32_t level_ = 0;
};

/// Number of leading '.' characters of a specifier.
[[nodiscard]] uint32_t relative_level(std::string_view specifier) noexcept;

// ============================================================================
// Declarations
// ============================================================================

enum class DeclarationKind : uint8_t {
  Variable,
  Function,
  Class,
  Interface,
  TypeAlias,
  Enum,
};

[[nodiscard]] std::string_view to_string(DeclarationKind k) noexcept;

struct VariableDecl
{
  [[nodiscard]] bool operator==(const VariableDecl &) const noexcept { return true; }
};

struct FunctionDecl
{
  std::string signature;  // best-effort reconstruction
  bool is_async = false;
  bool is_generator = false;

  [[nodiscard]] bool operator==(const FunctionDecl & o) const
  {
    return signature == o.signature && is_async == o.is_async && is_generator == o.is_generator;
  }
};

struct ClassDecl
{
  [[nodiscard]] bool operator==(const ClassDecl &) const noexcept { return true; }
};

struct InterfaceDecl
{
  [[nodiscard]] bool operator==(const InterfaceDecl &) const noexcept { return true; }
};

struct TypeAliasDecl
{
  [[nodiscard]] bool operator==(const TypeAliasDecl &) const noexcept { return true; }
};

struct EnumDecl
{
  [[nodiscard]] bool operator==(const EnumDecl &) const noexcept { return true; }
};

/// Alternative order matches DeclarationKind.
using DeclarationDetail =
  std::variant<VariableDecl, FunctionDecl, ClassDecl, InterfaceDecl, TypeAliasDecl, EnumDecl>;

/// One top-level named binding.
class Declaration
{
public:
  Declaration(
    std::string name, DeclarationDetail detail, uint32_t line, std::string descriptor,
    bool exported = false, uint32_t column = 0);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const DeclarationDetail & detail() const noexcept { return detail_; }
  [[nodiscard]] DeclarationKind kind() const noexcept
  {
    return static_cast<DeclarationKind>(detail_.index());
  }
  [[nodiscard]] uint32_t line() const noexcept { return line_; }
  [[nodiscard]] uint32_t column() const noexcept { return column_; }
  [[nodiscard]] const std::string & descriptor() const noexcept { return descriptor_; }
  [[nodiscard]] bool exported() const noexcept { return exported_; }

  /// Reconstructed signature; only functions have one.
  [[nodiscard]] const std::string * signature() const noexcept;

  [[nodiscard]] bool operator==(const Declaration & other) const;
  [[nodiscard]] bool operator!=(const Declaration & other) const { return !(*this == other); }

private:
  std::string name_;
  DeclarationDetail detail_;
  uint32_t line_ = 0;
  uint32_t column_ = 0;
  std::string descriptor_;
  bool exported_ = false;
};

// ============================================================================
// ParseResult
// ============================================================================

/// A free identifier in load/use position.
struct IdentifierRef
{
  uint32_t line = 0;
  std::string name;

  [[nodiscard]] bool operator==(const IdentifierRef & o) const
  {
    return line == o.line && name == o.name;
  }
};

/**
 * Output of parsing one source text. Created once per parse call and owned
 * by the caller.
 */
struct ParseResult
{
  std::string language = k_language_unknown;
  std::vector<Import> imports;
  std::map<std::string, Declaration> declarations;  // latest binding wins
  std::vector<IdentifierRef> identifiers;
  bool syntax_valid = true;
  std::vector<std::string> errors;
  std::string raw;

  /// Set of every referenced identifier name.
  [[nodiscard]] std::set<std::string> referenced_names() const;

  [[nodiscard]] bool operator==(const ParseResult & o) const;
  [[nodiscard]] bool operator!=(const ParseResult & o) const { return !(*this == o); }
};

/// Empty result for a language no parser understands.
[[nodiscard]] ParseResult make_unknown_result(std::string_view content);

}  // namespace srcsym
