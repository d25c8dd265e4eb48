// srcsym/model/symbols.cpp - Symbol model implementation
#include "srcsym/model/symbols.hpp"

#include <utility>

namespace srcsym
{

std::string_view to_string(ImportKind k) noexcept
{
  switch (k) {
    case ImportKind::Plain:
      return "import";
    case ImportKind::From:
      return "from";
    case ImportKind::Namespace:
      return "namespace";
    case ImportKind::Named:
      return "named";
    case ImportKind::Default:
      return "default";
    case ImportKind::SideEffect:
      return "side_effect";
    case ImportKind::Require:
      return "require";
    case ImportKind::Dynamic:
      return "dynamic";
  }
  return "";
}

std::string_view to_string(DeclarationKind k) noexcept
{
  switch (k) {
    case DeclarationKind::Variable:
      return "variable";
    case DeclarationKind::Function:
      return "function";
    case DeclarationKind::Class:
      return "class";
    case DeclarationKind::Interface:
      return "interface";
    case DeclarationKind::TypeAlias:
      return "type";
    case DeclarationKind::Enum:
      return "enum";
  }
  return "";
}

uint32_t relative_level(std::string_view specifier) noexcept
{
  uint32_t level = 0;
  while (level < specifier.size() && specifier[level] == '.') {
    ++level;
  }
  return level;
}

// ============================================================================
// Import
// ============================================================================

Import::Import(
  std::string source, ImportDetail detail, std::vector<ImportBinding> names, uint32_t line,
  uint32_t column)
: source_(std::move(source)),
  detail_(std::move(detail)),
  names_(std::move(names)),
  line_(line),
  column_(column),
  level_(relative_level(source_))
{
}

std::vector<std::string> Import::bound_names() const
{
  std::vector<std::string> out;
  // Compiler directives bind no names
  if (const auto * from = std::get_if<FromImport>(&detail_); from != nullptr && from->is_future) {
    return out;
  }
  out.reserve(names_.size());
  for (const auto & b : names_) {
    if (b.alias) {
      out.push_back(*b.alias);
      continue;
    }
    if (b.name == "*" || b.name.empty()) {
      continue;
    }
    if (std::holds_alternative<PlainImport>(detail_)) {
      // import a.b.c binds the top-level package
      out.push_back(b.name.substr(0, b.name.find('.')));
    } else {
      out.push_back(b.name);
    }
  }
  return out;
}

bool Import::operator==(const Import & other) const
{
  return source_ == other.source_ && detail_ == other.detail_ && names_ == other.names_ &&
         line_ == other.line_ && column_ == other.column_;
}

// ============================================================================
// Declaration
// ============================================================================

Declaration::Declaration(
  std::string name, DeclarationDetail detail, uint32_t line, std::string descriptor,
  bool exported, uint32_t column)
: name_(std::move(name)),
  detail_(std::move(detail)),
  line_(line),
  column_(column),
  descriptor_(std::move(descriptor)),
  exported_(exported)
{
}

const std::string * Declaration::signature() const noexcept
{
  if (const auto * fn = std::get_if<FunctionDecl>(&detail_)) {
    return &fn->signature;
  }
  return nullptr;
}

bool Declaration::operator==(const Declaration & other) const
{
  return name_ == other.name_ && detail_ == other.detail_ && line_ == other.line_ &&
         column_ == other.column_ && descriptor_ == other.descriptor_ &&
         exported_ == other.exported_;
}

// ============================================================================
// ParseResult
// ============================================================================

std::set<std::string> ParseResult::referenced_names() const
{
  std::set<std::string> out;
  for (const auto & id : identifiers) {
    out.insert(id.name);
  }
  return out;
}

bool ParseResult::operator==(const ParseResult & o) const
{
  return language == o.language && imports == o.imports && declarations == o.declarations &&
         identifiers == o.identifiers && syntax_valid == o.syntax_valid && errors == o.errors &&
         raw == o.raw;
}

ParseResult make_unknown_result(std::string_view content)
{
  ParseResult r;
  r.language = k_language_unknown;
  r.raw = std::string(content);
  return r;
}

}  // namespace srcsym
