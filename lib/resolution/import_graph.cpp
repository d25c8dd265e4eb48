// srcsym/resolution/import_graph.cpp - Import dependency graph construction
#include "srcsym/resolution/import_graph.hpp"

#include <set>

namespace srcsym
{

ImportGraph ImportGraph::build(const std::map<std::string, ParseResult> & files)
{
  ImportGraph graph;
  for (const auto & entry : files) {
    graph.files_.push_back(entry.first);
    graph.known_.emplace(entry.first, module_name_for_path(entry.first));
  }

  for (const auto & [path, result] : files) {
    for (const auto & imp : result.imports) {
      const std::optional<std::string> target =
        imp.is_relative() ? resolve_relative_import(imp.source(), path, graph.known_)
                          : resolve_module_to_file(imp.source(), graph.known_, path);
      if (!target) {
        graph.unresolved_.push_back(UnresolvedImport{path, imp});
        continue;
      }
      // A package importing from itself (`from . import x` in __init__.py)
      if (*target == path) {
        continue;
      }
      graph.edges_.push_back(ImportEdge{path, *target, imp});
    }
  }
  return graph;
}

bool ImportGraph::has_file(std::string_view path) const
{
  return known_.find(std::string(path)) != known_.end();
}

std::vector<std::string> ImportGraph::dependencies_of(std::string_view path) const
{
  std::set<std::string> out;
  for (const auto & e : edges_) {
    if (e.from == path) {
      out.insert(e.to);
    }
  }
  return {out.begin(), out.end()};
}

std::vector<std::string> ImportGraph::dependents_of(std::string_view path) const
{
  std::set<std::string> out;
  for (const auto & e : edges_) {
    if (e.to == path) {
      out.insert(e.from);
    }
  }
  return {out.begin(), out.end()};
}

std::vector<Import> ImportGraph::unresolved_of(std::string_view path) const
{
  std::vector<Import> out;
  for (const auto & u : unresolved_) {
    if (u.file == path) {
      out.push_back(u.import);
    }
  }
  return out;
}

}  // namespace srcsym
