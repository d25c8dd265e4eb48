// srcsym/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include "srcsym/basic/diagnostic.hpp"
#include "srcsym/basic/source_manager.hpp"

namespace srcsym
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W001]: unused import 'os'
 *     --> src/tool.py:1:8
 *      |
 *    1 | import os
 *      |        ^^ never referenced in this file
 *      |
 *      = help: remove the import
 */
class DiagnosticPrinter
{
public:
  /// Resolves the source text a diagnostic's ranges refer to (may return null)
  using SourceLookup = std::function<const SourceFile *(const Diagnostic &)>;

  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream supplied by the caller
   * @param use_color Whether to emit terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = false);

  /// Print a single diagnostic against one source text.
  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print a single diagnostic without source context.
  void print(const Diagnostic & diag);

  /// Print every diagnostic of a single-file bag, ordered by position.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

  /// Print every diagnostic of a multi-file bag, ordered by file then position.
  void print_all(const DiagnosticBag & diags, const SourceLookup & lookup);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace srcsym
