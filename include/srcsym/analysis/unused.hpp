// srcsym/analysis/unused.hpp - Unused import/declaration detection
//
// The find_* functions are pure queries over one ParseResult. analyze() and
// report_unresolved_imports() turn their findings into diagnostics.
//
#pragma once

#include <string>
#include <vector>

#include "srcsym/basic/diagnostic.hpp"
#include "srcsym/basic/source_manager.hpp"
#include "srcsym/config/analysis_config.hpp"
#include "srcsym/model/symbols.hpp"
#include "srcsym/resolution/import_graph.hpp"

namespace srcsym
{

/// Which declarations find_unused_declarations may report.
enum class UnusedPolicy : uint8_t {
  ReportAll,       // any name absent from the references
  ExemptExported,  // skip exported/public names
};

/**
 * Imports none of whose bound names is referenced.
 *
 * An import binding no name at all (side-effect imports, bare requires,
 * wildcards) is never reported.
 */
[[nodiscard]] std::vector<Import> find_unused_imports(const ParseResult & result);

/// Names of top-level declarations that are never referenced, in name order.
[[nodiscard]] std::vector<std::string> find_unused_declarations(
  const ParseResult & result, UnusedPolicy policy = UnusedPolicy::ReportAll);

/**
 * Report syntax errors (E001), unused imports (W001) and unused
 * declarations (W002) of one file.
 *
 * @param result Parse result of `file`'s content
 * @param config Which findings to report and which names to ignore
 * @param file Source the diagnostic ranges refer to
 * @param diags Bag receiving the diagnostics
 */
void analyze(
  const ParseResult & result, const AnalysisConfig & config, const SourceFile & file,
  DiagnosticBag & diags);

/**
 * Report relative imports of `file` that resolved to no known file (W003).
 *
 * Bare module names are not reported; they usually name third-party
 * packages outside the repository.
 */
void report_unresolved_imports(
  const ImportGraph & graph, const AnalysisConfig & config, const SourceFile & file,
  DiagnosticBag & diags);

}  // namespace srcsym
