// srcsym/analysis/unused.cpp - Unused import/declaration detection
#include "srcsym/analysis/unused.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <regex>
#include <set>

namespace srcsym
{

namespace
{

/// Range of the position named in "... at line N, column M", else line 1.
SourceRange error_range(const SourceFile & file, const std::string & message)
{
  static const std::regex pos_re(R"(line (\d+), column (\d+))");
  std::smatch m;
  if (!std::regex_search(message, m, pos_re)) {
    return file.line_range(1);
  }

  const auto line = static_cast<uint32_t>(std::stoul(m[1].str()));
  const auto column = static_cast<uint32_t>(std::stoul(m[2].str()));
  const SourceRange whole = file.line_range(line);
  if (whole.is_invalid()) {
    return file.line_range(1);
  }
  const uint32_t begin = whole.get_begin().get_offset() + column - 1;
  if (column == 0 || begin >= whole.get_end().get_offset()) {
    return whole;
  }
  return {begin, begin + 1};
}

}  // namespace

std::vector<Import> find_unused_imports(const ParseResult & result)
{
  const std::set<std::string> used = result.referenced_names();

  std::vector<Import> unused;
  for (const auto & imp : result.imports) {
    const std::vector<std::string> bound = imp.bound_names();
    if (bound.empty()) {
      continue;
    }
    const bool any_used = std::any_of(bound.begin(), bound.end(), [&used](const std::string & n) {
      return used.count(n) > 0;
    });
    if (!any_used) {
      unused.push_back(imp);
    }
  }
  return unused;
}

std::vector<std::string> find_unused_declarations(const ParseResult & result, UnusedPolicy policy)
{
  const std::set<std::string> used = result.referenced_names();

  std::vector<std::string> unused;
  for (const auto & [name, decl] : result.declarations) {
    if (policy == UnusedPolicy::ExemptExported && decl.exported()) {
      continue;
    }
    if (used.count(name) == 0) {
      unused.push_back(name);
    }
  }
  return unused;
}

void analyze(
  const ParseResult & result, const AnalysisConfig & config, const SourceFile & file,
  DiagnosticBag & diags)
{
  if (!result.syntax_valid) {
    for (const auto & err : result.errors) {
      diags.report_error(error_range(file, err), err, "syntax error")
        .with_code(k_code_syntax_error)
        .with_file(file.name())
        .with_help("symbols were recovered line by line and may be incomplete");
    }
  }

  if (config.unused_imports) {
    for (const auto & imp : find_unused_imports(result)) {
      const std::vector<std::string> bound = imp.bound_names();
      if (std::all_of(bound.begin(), bound.end(), [&config](const std::string & n) {
            return config.is_ignored(n);
          })) {
        continue;
      }
      auto builder = diags.report_warning(
        file.find_on_line(imp.line(), bound.front()),
        fmt::format("unused import '{}'", fmt::join(bound, "', '")),
        fmt::format("imported from '{}'", imp.source()));
      builder.with_code(k_code_unused_import).with_file(file.name()).with_help("remove the import");

      // Further names on the same line; a name on a continuation line has no exact span
      const SourceRange whole_line = file.line_range(imp.line());
      for (size_t i = 1; i < bound.size(); ++i) {
        const SourceRange r = file.find_on_line(imp.line(), bound[i]);
        if (r.is_valid() && r != whole_line) {
          builder.with_secondary_label(r, "");
        }
      }
    }
  }

  if (config.unused_declarations) {
    const UnusedPolicy policy =
      config.exempt_public ? UnusedPolicy::ExemptExported : UnusedPolicy::ReportAll;
    for (const auto & name : find_unused_declarations(result, policy)) {
      if (config.is_ignored(name)) {
        continue;
      }
      const Declaration & decl = result.declarations.at(name);
      diags
        .report_warning(
          file.find_on_line(decl.line(), name),
          fmt::format("{} '{}' is never used", decl.descriptor(), name), "declared here")
        .with_code(k_code_unused_declaration)
        .with_file(file.name());
    }
  }
}

void report_unresolved_imports(
  const ImportGraph & graph, const AnalysisConfig & config, const SourceFile & file,
  DiagnosticBag & diags)
{
  if (!config.unresolved_imports) {
    return;
  }
  for (const auto & imp : graph.unresolved_of(file.name())) {
    if (!imp.is_relative()) {
      continue;
    }
    diags
      .report_warning(
        file.find_on_line(imp.line(), imp.source()),
        fmt::format("cannot resolve import '{}'", imp.source()), "no matching file")
      .with_code(k_code_unresolved_import)
      .with_file(file.name());
  }
}

}  // namespace srcsym
