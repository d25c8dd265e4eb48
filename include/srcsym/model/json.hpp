// srcsym/model/json.hpp - JSON serialization of parse results and import graphs
//
// Produces stable nlohmann::json objects for collaborators that assemble
// prompts or reports from the extracted symbols.
//
#pragma once

#include <nlohmann/json.hpp>

#include "srcsym/model/symbols.hpp"
#include "srcsym/resolution/import_graph.hpp"

namespace srcsym
{

/**
 * Serialize a parse result.
 *
 * Keys: language, imports[], declarations{name: ...}, identifiers[],
 * syntax_valid, errors[]. The raw text is not included.
 */
[[nodiscard]] nlohmann::json to_json(const ParseResult & result);

/// {source, kind, line, column, names[{name, alias}], is_relative, level, ...}
[[nodiscard]] nlohmann::json to_json(const Import & imp);

/// {name, kind, descriptor, line, column, exported[, signature, is_async, is_generator]}
[[nodiscard]] nlohmann::json to_json(const Declaration & decl);

/// {files[], edges[{from, to, source, line}], unresolved[{file, source, line}]}
[[nodiscard]] nlohmann::json to_json(const ImportGraph & graph);

}  // namespace srcsym
