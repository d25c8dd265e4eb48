// srcsym/resolution/import_resolver.cpp - Import specifier resolution
#include "srcsym/resolution/import_resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace srcsym
{
namespace
{

namespace fs = std::filesystem;

bool ends_with_segment(std::string_view path, std::string_view suffix)
{
  if (suffix.empty() || path.size() < suffix.size()) {
    return false;
  }
  if (path.substr(path.size() - suffix.size()) != suffix) {
    return false;
  }
  return path.size() == suffix.size() || path[path.size() - suffix.size() - 1] == '/';
}

std::string join(const std::string & dir, std::string_view name)
{
  return dir.empty() ? std::string(name) : dir + "/" + std::string(name);
}

bool has_source_extension(std::string_view path)
{
  const std::string stem = strip_extension(path);
  if (stem.size() == path.size()) {
    return false;
  }
  const std::string_view ext = path.substr(stem.size());
  return std::find(std::begin(k_resolve_extensions), std::end(k_resolve_extensions), ext) !=
         std::end(k_resolve_extensions);
}

struct KnownEntry
{
  const std::string * key;
  std::string normalized;
  std::string stem;
};

std::vector<KnownEntry> normalize_known(const KnownPaths & known_paths)
{
  std::vector<KnownEntry> out;
  out.reserve(known_paths.size());
  for (const auto & entry : known_paths) {
    std::string normalized = normalize_path(entry.first);
    std::string stem = strip_extension(normalized);
    out.push_back(KnownEntry{&entry.first, std::move(normalized), std::move(stem)});
  }
  return out;
}

const std::string * find_exact(const std::vector<KnownEntry> & known, const std::string & candidate)
{
  for (const auto & k : known) {
    if (k.normalized == candidate) {
      return k.key;
    }
  }
  return nullptr;
}

}  // namespace

std::string normalize_path(std::string_view path)
{
  if (path.empty()) {
    return {};
  }
  std::string out = fs::path(std::string(path)).lexically_normal().generic_string();
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  if (out == ".") {
    out.clear();
  }
  return out;
}

std::string strip_extension(std::string_view path)
{
  const size_t slash = path.rfind('/');
  const size_t base = (slash == std::string_view::npos) ? 0 : slash + 1;
  const size_t dot = path.rfind('.');
  // No dot in the final segment, or a dotfile
  if (dot == std::string_view::npos || dot <= base) {
    return std::string(path);
  }
  return std::string(path.substr(0, dot));
}

std::string relative_specifier_to_path(std::string_view specifier)
{
  if (specifier.find('/') != std::string_view::npos) {
    return std::string(specifier);
  }

  const size_t level = specifier.find_first_not_of('.') == std::string_view::npos
                         ? specifier.size()
                         : specifier.find_first_not_of('.');
  if (level == 0) {
    return std::string(specifier);
  }

  std::string out = (level == 1) ? "./" : "";
  for (size_t i = 1; i < level; ++i) {
    out += "../";
  }
  std::string rest(specifier.substr(level));
  std::replace(rest.begin(), rest.end(), '.', '/');
  return out + rest;
}

std::optional<std::string> resolve_relative_import(
  std::string_view source, std::string_view current_file, const KnownPaths & known_paths)
{
  if (source.empty() || source.front() != '.') {
    return std::nullopt;
  }

  const fs::path base = fs::path(std::string(current_file)).parent_path();
  const std::string resolved =
    normalize_path((base / relative_specifier_to_path(source)).generic_string());
  const std::vector<KnownEntry> known = normalize_known(known_paths);

  // 1. Exact, or ignoring extensions
  const bool explicit_ext = has_source_extension(resolved);
  const std::string resolved_stem = strip_extension(resolved);
  for (const auto & k : known) {
    if (k.normalized == resolved || k.stem == resolved) {
      return *k.key;
    }
    if (explicit_ext && k.stem == resolved_stem) {
      return *k.key;
    }
  }

  // 2. Appended source extension
  for (const auto ext : k_resolve_extensions) {
    if (const std::string * key = find_exact(known, resolved + std::string(ext))) {
      return *key;
    }
  }

  // 3. Directory index
  for (const auto index : k_index_files) {
    if (const std::string * key = find_exact(known, join(resolved, index))) {
      return *key;
    }
  }

  return std::nullopt;
}

std::optional<std::string> resolve_module_to_file(
  std::string_view module, const KnownPaths & known_paths, std::string_view current_file)
{
  if (module.empty()) {
    return std::nullopt;
  }
  if (module.front() == '.') {
    if (current_file.empty()) {
      return std::nullopt;
    }
    return resolve_relative_import(module, current_file, known_paths);
  }

  std::string wanted(module);
  std::replace(wanted.begin(), wanted.end(), '.', '/');

  for (const auto & k : normalize_known(known_paths)) {
    if (ends_with_segment(k.stem, wanted)) {
      return *k.key;
    }
    // pkg/__init__.py and pkg/index.ts answer to "pkg"
    const size_t slash = k.stem.rfind('/');
    if (slash == std::string::npos) {
      continue;
    }
    const std::string_view base = std::string_view(k.stem).substr(slash + 1);
    if ((base == "__init__" || base == "index") &&
        ends_with_segment(std::string_view(k.stem).substr(0, slash), wanted)) {
      return *k.key;
    }
  }
  return std::nullopt;
}

std::string module_name_for_path(std::string_view path)
{
  std::string stem = strip_extension(normalize_path(path));
  const size_t slash = stem.rfind('/');
  const std::string_view base =
    std::string_view(stem).substr(slash == std::string::npos ? 0 : slash + 1);
  if (base == "__init__" || base == "index") {
    stem.erase(slash == std::string::npos ? 0 : slash);
  }
  std::replace(stem.begin(), stem.end(), '/', '.');
  return stem;
}

}  // namespace srcsym
