// srcsym/lang/detector.hpp - Language detection and parse dispatch
#pragma once

#include <string>
#include <string_view>

#include "srcsym/lang/parser.hpp"
#include "srcsym/model/symbols.hpp"

namespace srcsym::lang
{

/**
 * Detects the language of a source text.
 *
 * A filename whose extension some parser claims decides outright. Otherwise
 * each registered language is scored on textual markers; the first strictly
 * greatest score in registration order wins, and all-zero scores yield
 * "unknown".
 */
[[nodiscard]] std::string detect_language(
  std::string_view content, std::string_view filename = {},
  const LanguageRegistry & registry = LanguageRegistry::builtin());

/**
 * Detects the language and runs the matching parser.
 *
 * Only a claimed extension is passed on as the tag; a content-scored
 * language picks the parser, which then selects its own tag.
 *
 * Never throws for unsupported content: an unrecognized language yields a
 * result tagged "unknown" that carries only the raw text.
 */
[[nodiscard]] ParseResult parse_file(
  std::string_view content, std::string_view filename = {},
  const LanguageRegistry & registry = LanguageRegistry::builtin());

}  // namespace srcsym::lang
