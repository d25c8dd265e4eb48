// srcsym/resolution/import_resolver.hpp - Import specifier to repository path resolution
//
// Resolution is pure path arithmetic against a caller-supplied table of known
// repository paths; nothing here touches the filesystem.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace srcsym
{

/// Repository-relative path -> module name (the value is informational only).
using KnownPaths = std::map<std::string, std::string>;

/// Source extensions tried, in order, after a relative specifier.
inline constexpr std::string_view k_resolve_extensions[] = {
  ".py", ".js", ".ts", ".jsx", ".tsx", ".mjs", ".cjs",
};

/// Package index files tried, in order, when a specifier names a directory.
inline constexpr std::string_view k_index_files[] = {
  "index.js",
  "index.ts",
  "index.tsx",
  "__init__.py",
};

/**
 * Lexically normalize a repository path: collapses `.` and `..` segments,
 * uses '/' separators and drops any trailing separator.
 */
[[nodiscard]] std::string normalize_path(std::string_view path);

/// Path with its final extension removed ("a/b.test.ts" -> "a/b.test").
[[nodiscard]] std::string strip_extension(std::string_view path);

/**
 * Convert a relative specifier to path form.
 *
 * Specifiers containing a separator are returned unchanged. Dotted Python
 * specifiers are rewritten: "." -> "./", "..pkg.mod" -> "../pkg/mod".
 */
[[nodiscard]] std::string relative_specifier_to_path(std::string_view specifier);

/**
 * Resolve a relative import specifier against the importing file.
 *
 * Tried in order, first match wins:
 * 1. exact normalized match, or match ignoring extensions;
 * 2. the path with each of k_resolve_extensions appended;
 * 3. the path as a directory with each of k_index_files appended.
 *
 * @return The matching key of `known_paths`, or std::nullopt for a
 *         non-relative specifier or no match
 */
[[nodiscard]] std::optional<std::string> resolve_relative_import(
  std::string_view source, std::string_view current_file, const KnownPaths & known_paths);

/**
 * Resolve a module name to a known path.
 *
 * Relative names are delegated to resolve_relative_import (and need
 * `current_file`). Bare names have their dots turned into separators and
 * match any known path whose extension-less form ends with that path on a
 * segment boundary; a package index file also answers to its directory.
 */
[[nodiscard]] std::optional<std::string> resolve_module_to_file(
  std::string_view module, const KnownPaths & known_paths, std::string_view current_file = {});

/// Dotted module name of a repository path ("pkg/sub/mod.py" -> "pkg.sub.mod").
[[nodiscard]] std::string module_name_for_path(std::string_view path);

}  // namespace srcsym
