// srcsym/resolution/import_graph.hpp - Repository import dependency graph
//
// Built from already parsed files; edges point from the importing file to
// the repository file an import resolves to.
//
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "srcsym/model/symbols.hpp"
#include "srcsym/resolution/import_resolver.hpp"

namespace srcsym
{

/// One resolved import.
struct ImportEdge
{
  std::string from;  // importing file
  std::string to;    // resolved repository file
  Import import;
};

/// An import that matched no known repository file.
struct UnresolvedImport
{
  std::string file;
  Import import;
};

// ============================================================================
// Import Graph
// ============================================================================

/**
 * Import dependency graph of a set of parsed files.
 *
 * Bare module names (third-party packages, standard library) that match no
 * repository file show up in unresolved() like any other miss; callers
 * decide which of those matter.
 */
class ImportGraph
{
public:
  ImportGraph() = default;

  /**
   * Resolve every import of every file against the set of files itself.
   *
   * @param files Repository-relative path -> parse result
   */
  [[nodiscard]] static ImportGraph build(const std::map<std::string, ParseResult> & files);

  /// Known files in path order.
  [[nodiscard]] const std::vector<std::string> & files() const noexcept { return files_; }
  [[nodiscard]] const KnownPaths & known_paths() const noexcept { return known_; }

  [[nodiscard]] const std::vector<ImportEdge> & edges() const noexcept { return edges_; }
  [[nodiscard]] const std::vector<UnresolvedImport> & unresolved() const noexcept
  {
    return unresolved_;
  }

  [[nodiscard]] bool has_file(std::string_view path) const;

  /// Files imported by `path` (sorted, unique).
  [[nodiscard]] std::vector<std::string> dependencies_of(std::string_view path) const;

  /// Files importing `path` (sorted, unique).
  [[nodiscard]] std::vector<std::string> dependents_of(std::string_view path) const;

  /// Unresolved imports of one file, in source order.
  [[nodiscard]] std::vector<Import> unresolved_of(std::string_view path) const;

private:
  std::vector<std::string> files_;
  KnownPaths known_;
  std::vector<ImportEdge> edges_;
  std::vector<UnresolvedImport> unresolved_;
};

}  // namespace srcsym
