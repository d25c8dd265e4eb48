// srcsym/lang/parser.hpp - Language parser interface and registry
//
// Each supported language family implements LanguageParser. The registry is
// a small static table (language tag -> parser) that the detector and
// dispatcher consult; adding a language means adding one implementation and
// one registration.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "srcsym/model/symbols.hpp"

namespace srcsym::lang
{

/// Content-detection score of one language tag.
struct LanguageScore
{
  std::string language;
  int score = 0;
};

/**
 * Base interface for language parsers.
 *
 * Implementations are stateless: every call is a pure function of its
 * arguments, so one instance may serve concurrent callers.
 */
class LanguageParser
{
public:
  virtual ~LanguageParser() = default;

  /// Parser name, e.g. "python".
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// Language tags this parser produces, in detection priority order.
  [[nodiscard]] virtual std::vector<std::string> languages() const = 0;

  /**
   * Maps a file extension (with its dot, lower case) to one of this
   * parser's language tags.
   */
  [[nodiscard]] virtual std::optional<std::string> language_for_extension(
    std::string_view extension) const = 0;

  /// Scores the content for each of this parser's language tags.
  [[nodiscard]] virtual std::vector<LanguageScore> score_content(
    std::string_view content) const = 0;

  /**
   * Parses source text. Never throws for malformed content.
   *
   * @param content Source text
   * @param filename Optional path hint (only its extension is used)
   * @param language Optional tag chosen by the caller; must be one of
   *        languages() to take effect
   */
  [[nodiscard]] virtual ParseResult parse(
    std::string_view content, std::string_view filename = {},
    std::string_view language = {}) const = 0;
};

/**
 * Static table of language parsers.
 */
class LanguageRegistry
{
public:
  LanguageRegistry() = default;

  LanguageRegistry(const LanguageRegistry &) = delete;
  LanguageRegistry & operator=(const LanguageRegistry &) = delete;
  LanguageRegistry(LanguageRegistry &&) = default;
  LanguageRegistry & operator=(LanguageRegistry &&) = default;

  /**
   * Registers a parser.
   *
   * @throws std::invalid_argument for a null parser or a language tag that
   *         is already claimed
   */
  void add(std::unique_ptr<LanguageParser> parser);

  /// Parser producing the given tag, or nullptr.
  [[nodiscard]] const LanguageParser * find(std::string_view language) const noexcept;

  /// Language tag mapped from a filename's extension, if any parser claims it.
  [[nodiscard]] std::optional<std::string> language_for_filename(
    std::string_view filename) const;

  /// Every (tag, score) pair in registration order.
  [[nodiscard]] std::vector<LanguageScore> score_content(std::string_view content) const;

  [[nodiscard]] const std::vector<std::unique_ptr<LanguageParser>> & parsers() const noexcept
  {
    return parsers_;
  }

  /// Registry with the built-in parsers (python, then ecmascript).
  [[nodiscard]] static const LanguageRegistry & builtin();

private:
  std::vector<std::unique_ptr<LanguageParser>> parsers_;
};

/// Lower-cased extension of a path ("src/App.TSX" -> ".tsx"), or empty.
[[nodiscard]] std::string extension_of(std::string_view filename);

}  // namespace srcsym::lang
