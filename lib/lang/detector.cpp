// srcsym/lang/detector.cpp - Language detection and parse dispatch
#include "srcsym/lang/detector.hpp"

namespace srcsym::lang
{

std::string detect_language(
  std::string_view content, std::string_view filename, const LanguageRegistry & registry)
{
  if (!filename.empty()) {
    if (auto tag = registry.language_for_filename(filename)) {
      return *tag;
    }
  }

  std::string best = k_language_unknown;
  int best_score = 0;
  for (auto & s : registry.score_content(content)) {
    if (s.score > best_score) {
      best_score = s.score;
      best = std::move(s.language);
    }
  }
  return best;
}

ParseResult parse_file(
  std::string_view content, std::string_view filename, const LanguageRegistry & registry)
{
  // Only an extension pins the tag; a content-scored family is refined by its parser
  std::optional<std::string> claimed;
  if (!filename.empty()) {
    claimed = registry.language_for_filename(filename);
  }
  const std::string language =
    claimed ? *claimed : detect_language(content, std::string_view{}, registry);
  const LanguageParser * parser = registry.find(language);
  if (parser == nullptr) {
    return make_unknown_result(content);
  }
  return parser->parse(content, filename, claimed ? std::string_view(*claimed) : std::string_view{});
}

}  // namespace srcsym::lang
