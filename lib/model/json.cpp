// srcsym/model/json.cpp - JSON serialization implementation
#include "srcsym/model/json.hpp"

#include <string>
#include <variant>

namespace srcsym
{
namespace
{

using nlohmann::json;

json j_binding(const ImportBinding & b)
{
  return json{
    {"name", b.name}, {"alias", b.alias ? json(*b.alias) : json(nullptr)}};
}

}  // namespace

json to_json(const Import & imp)
{
  json names = json::array();
  for (const auto & b : imp.names()) {
    names.push_back(j_binding(b));
  }

  json j{
    {"source", imp.source()},
    {"kind", std::string(to_string(imp.kind()))},
    {"line", imp.line()},
    {"column", imp.column()},
    {"names", std::move(names)},
    {"is_relative", imp.is_relative()},
    {"level", imp.level()}};

  if (const auto * from = std::get_if<FromImport>(&imp.detail())) {
    j["is_future"] = from->is_future;
  } else if (const auto * named = std::get_if<NamedImport>(&imp.detail())) {
    j["type_only"] = named->type_only;
  } else if (const auto * req = std::get_if<RequireImport>(&imp.detail())) {
    j["from_text_scan"] = req->from_text_scan;
  }
  return j;
}

json to_json(const Declaration & decl)
{
  json j{
    {"name", decl.name()},
    {"kind", std::string(to_string(decl.kind()))},
    {"descriptor", decl.descriptor()},
    {"line", decl.line()},
    {"column", decl.column()},
    {"exported", decl.exported()}};

  if (const auto * fn = std::get_if<FunctionDecl>(&decl.detail())) {
    j["signature"] = fn->signature;
    j["is_async"] = fn->is_async;
    j["is_generator"] = fn->is_generator;
  }
  return j;
}

json to_json(const ParseResult & result)
{
  json imports = json::array();
  for (const auto & imp : result.imports) {
    imports.push_back(to_json(imp));
  }

  json declarations = json::object();
  for (const auto & [name, decl] : result.declarations) {
    declarations[name] = to_json(decl);
  }

  json identifiers = json::array();
  for (const auto & ref : result.identifiers) {
    identifiers.push_back(json{{"line", ref.line}, {"name", ref.name}});
  }

  return json{
    {"language", result.language},
    {"imports", std::move(imports)},
    {"declarations", std::move(declarations)},
    {"identifiers", std::move(identifiers)},
    {"syntax_valid", result.syntax_valid},
    {"errors", result.errors}};
}

json to_json(const ImportGraph & graph)
{
  json edges = json::array();
  for (const auto & e : graph.edges()) {
    edges.push_back(
      json{{"from", e.from}, {"to", e.to}, {"source", e.import.source()}, {"line", e.import.line()}});
  }

  json unresolved = json::array();
  for (const auto & u : graph.unresolved()) {
    unresolved.push_back(
      json{{"file", u.file}, {"source", u.import.source()}, {"line", u.import.line()}});
  }

  return json{
    {"files", graph.files()}, {"edges", std::move(edges)}, {"unresolved", std::move(unresolved)}};
}

}  // namespace srcsym
