// srcsym/lang/registry.cpp - Language parser registry
#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <stdexcept>

#include "srcsym/lang/ecmascript_parser.hpp"
#include "srcsym/lang/parser.hpp"
#include "srcsym/lang/python_parser.hpp"

namespace srcsym::lang
{

std::string extension_of(std::string_view filename)
{
  const size_t slash = filename.find_last_of("/\\");
  const std::string_view base =
    (slash == std::string_view::npos) ? filename : filename.substr(slash + 1);
  const size_t dot = base.rfind('.');
  // Dotfiles such as ".eslintrc" have no extension
  if (dot == std::string_view::npos || dot == 0) {
    return {};
  }

  std::string ext(base.substr(dot));
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

void LanguageRegistry::add(std::unique_ptr<LanguageParser> parser)
{
  if (!parser) {
    throw std::invalid_argument("LanguageRegistry::add: null parser");
  }
  for (const auto & tag : parser->languages()) {
    if (find(tag) != nullptr) {
      throw std::invalid_argument("LanguageRegistry::add: language '" + tag + "' already registered");
    }
  }
  parsers_.push_back(std::move(parser));
}

const LanguageParser * LanguageRegistry::find(std::string_view language) const noexcept
{
  for (const auto & p : parsers_) {
    for (const auto & tag : p->languages()) {
      if (tag == language) {
        return p.get();
      }
    }
  }
  return nullptr;
}

std::optional<std::string> LanguageRegistry::language_for_filename(
  std::string_view filename) const
{
  const std::string ext = extension_of(filename);
  if (ext.empty()) {
    return std::nullopt;
  }
  for (const auto & p : parsers_) {
    if (auto tag = p->language_for_extension(ext)) {
      return tag;
    }
  }
  return std::nullopt;
}

std::vector<LanguageScore> LanguageRegistry::score_content(std::string_view content) const
{
  std::vector<LanguageScore> scores;
  for (const auto & p : parsers_) {
    auto part = p->score_content(content);
    scores.insert(
      scores.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
  }
  return scores;
}

const LanguageRegistry & LanguageRegistry::builtin()
{
  static const LanguageRegistry registry = [] {
    LanguageRegistry r;
    r.add(std::make_unique<PythonParser>());
    r.add(std::make_unique<EcmaScriptParser>());
    return r;
  }();
  return registry;
}

}  // namespace srcsym::lang
