#include <gtest/gtest.h>

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "srcsym/analysis/unused.hpp"
#include "srcsym/basic/diagnostic_printer.hpp"
#include "srcsym/lang/detector.hpp"

using srcsym::AnalysisConfig;
using srcsym::DiagnosticBag;
using srcsym::ParseResult;
using srcsym::Severity;
using srcsym::SourceFile;
using srcsym::UnusedPolicy;

namespace
{

constexpr const char * k_tool_py =
  "import os\n"
  "import sys\n"
  "\n"
  "def run():\n"
  "    return sys.argv\n"
  "\n"
  "def _helper():\n"
  "    pass\n";

ParseResult parse(const std::string & content, const std::string & filename)
{
  return srcsym::lang::parse_file(content, filename);
}

}  // namespace

// ============================================================================
// Queries
// ============================================================================

TEST(UnusedImports, ReportsImportsWithNoReferencedName)
{
  const auto unused = srcsym::find_unused_imports(parse(k_tool_py, "tool.py"));
  ASSERT_EQ(unused.size(), 1U);
  EXPECT_EQ(unused[0].source(), "os");
}

TEST(UnusedImports, UsedWhenAnyBoundNameIsReferenced)
{
  const auto r = parse(
    "import './polyfill';\n"
    "import { a, b } from './m';\n"
    "import * as all from 'lib';\n"
    "b();\n",
    "index.js");
  const auto unused = srcsym::find_unused_imports(r);
  ASSERT_EQ(unused.size(), 1U);
  EXPECT_EQ(unused[0].source(), "lib");
}

TEST(UnusedImports, WildcardIsNeverReported)
{
  EXPECT_TRUE(srcsym::find_unused_imports(parse("from pkg import *\n", "m.py")).empty());
}

TEST(UnusedImports, FutureDirectiveIsNeverReported)
{
  const auto r = parse("from __future__ import annotations\nimport os\n", "m.py");
  const auto unused = srcsym::find_unused_imports(r);
  ASSERT_EQ(unused.size(), 1U);
  EXPECT_EQ(unused[0].source(), "os");
}

TEST(UnusedDeclarations, PolicyControlsExportedNames)
{
  const auto r = parse(k_tool_py, "tool.py");
  EXPECT_EQ(
    srcsym::find_unused_declarations(r), (std::vector<std::string>{"_helper", "run"}));
  EXPECT_EQ(
    srcsym::find_unused_declarations(r, UnusedPolicy::ExemptExported),
    std::vector<std::string>{"_helper"});
}

TEST(UnusedDeclarations, ForwardReferenceCountsAsUse)
{
  const auto r = parse("def main():\n    helper()\n\ndef helper():\n    pass\n", "m.py");
  EXPECT_EQ(srcsym::find_unused_declarations(r), std::vector<std::string>{"main"});
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(AnalyzeFile, DefaultConfigReportsImportsAndDeclarations)
{
  const SourceFile file("tool.py", k_tool_py);
  DiagnosticBag diags;
  srcsym::analyze(parse(k_tool_py, "tool.py"), AnalysisConfig{}, file, diags);

  ASSERT_EQ(diags.size(), 3U);
  EXPECT_FALSE(diags.has_errors());

  const auto imports = diags.with_code("W001");
  ASSERT_EQ(imports.size(), 1U);
  EXPECT_EQ(imports[0].severity, Severity::Warning);
  EXPECT_EQ(imports[0].message, "unused import 'os'");
  EXPECT_EQ(imports[0].file, "tool.py");
  EXPECT_EQ(file.get_slice(imports[0].primary_range()), "os");
  ASSERT_TRUE(imports[0].help_message.has_value());

  const auto decls = diags.with_code("W002");
  ASSERT_EQ(decls.size(), 2U);
  EXPECT_EQ(decls[0].message, "function '_helper' is never used");
  EXPECT_EQ(decls[1].message, "function 'run' is never used");
  EXPECT_EQ(file.get_slice(decls[1].primary_range()), "run");
}

TEST(AnalyzeFile, MultiNameImportListsEveryBinding)
{
  const std::string src = "import x, { y as z } from 'm';\n";
  const SourceFile file("a.js", src);
  DiagnosticBag diags;
  srcsym::analyze(parse(src, "a.js"), AnalysisConfig{}, file, diags);

  const auto imports = diags.with_code("W001");
  ASSERT_EQ(imports.size(), 1U);
  EXPECT_EQ(imports[0].message, "unused import 'x', 'z'");

  // The first name carries the primary label, the rest are secondary
  ASSERT_EQ(imports[0].labels.size(), 2U);
  EXPECT_EQ(file.get_slice(imports[0].primary_range()), "x");
  EXPECT_EQ(imports[0].labels[1].style, srcsym::LabelStyle::Secondary);
  EXPECT_EQ(file.get_slice(imports[0].labels[1].range), "z");
}

TEST(AnalyzeFile, ContinuationLineNamesGetNoSecondaryLabel)
{
  const std::string src = "from pkg import (a,\n    b)\n";
  const SourceFile file("m.py", src);
  DiagnosticBag diags;
  srcsym::analyze(parse(src, "m.py"), AnalysisConfig{}, file, diags);

  const auto imports = diags.with_code("W001");
  ASSERT_EQ(imports.size(), 1U);
  EXPECT_EQ(imports[0].message, "unused import 'a', 'b'");
  EXPECT_EQ(imports[0].labels.size(), 1U);
}

TEST(AnalyzeFile, ConfigSwitchesAndIgnoredNames)
{
  const SourceFile file("tool.py", k_tool_py);
  const auto result = parse(k_tool_py, "tool.py");

  AnalysisConfig config;
  config.exempt_public = true;
  config.ignore_names = {"os"};
  DiagnosticBag diags;
  srcsym::analyze(result, config, file, diags);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].message, "function '_helper' is never used");

  AnalysisConfig quiet;
  quiet.unused_imports = false;
  quiet.unused_declarations = false;
  DiagnosticBag none;
  srcsym::analyze(result, quiet, file, none);
  EXPECT_TRUE(none.empty());
}

TEST(AnalyzeFile, SyntaxErrorsAreReported)
{
  const std::string src = "import os\ndef broken(:\n    pass\n";
  const SourceFile file("broken.py", src);
  DiagnosticBag diags;
  AnalysisConfig config;
  config.unused_declarations = false;
  srcsym::analyze(parse(src, "broken.py"), config, file, diags);

  EXPECT_TRUE(diags.has_errors());
  const auto errors = diags.with_code("E001");
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].severity, Severity::Error);
  EXPECT_EQ(errors[0].message.rfind("syntax error at line", 0), 0U);
  EXPECT_TRUE(errors[0].primary_range().is_valid());

  // Fallback still recovered the import
  EXPECT_EQ(diags.with_code("W001").size(), 1U);
}

TEST(UnresolvedImports, OnlyRelativeMissesAreReported)
{
  const std::string app =
    "import React from 'react';\n"
    "import { helper } from './util';\n"
    "import { gone } from './missing';\n"
    "helper(gone, React);\n";
  std::map<std::string, ParseResult> files;
  files.emplace("src/app.ts", parse(app, "src/app.ts"));
  files.emplace("src/util.ts", parse("export const helper = 1;\n", "src/util.ts"));
  const auto graph = srcsym::ImportGraph::build(files);

  const SourceFile file("src/app.ts", app);
  DiagnosticBag diags;
  srcsym::report_unresolved_imports(graph, AnalysisConfig{}, file, diags);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "W003");
  EXPECT_EQ(diags.all()[0].message, "cannot resolve import './missing'");
  EXPECT_EQ(file.get_full_range(diags.all()[0].primary_range()).start_line, 3U);

  AnalysisConfig off;
  off.unresolved_imports = false;
  DiagnosticBag none;
  srcsym::report_unresolved_imports(graph, off, file, none);
  EXPECT_TRUE(none.empty());
}

TEST(AnalyzeFile, RenderedReport)
{
  const std::string src = "import os\n";
  const SourceFile file("src/tool.py", src);
  DiagnosticBag diags;
  srcsym::analyze(parse(src, "src/tool.py"), AnalysisConfig{}, file, diags);

  std::ostringstream out;
  srcsym::DiagnosticPrinter printer(out);
  printer.print_all(diags, file);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[W001]: unused import 'os'"), std::string::npos);
  EXPECT_NE(text.find("--> src/tool.py:1:8"), std::string::npos);
  EXPECT_NE(text.find("^^ imported from 'os'"), std::string::npos);
  EXPECT_NE(text.find("= help: remove the import"), std::string::npos);
}

TEST(AnalyzeFile, RenderedSecondaryLabel)
{
  const std::string src = "from pkg import a, b\n";
  const SourceFile file("m.py", src);
  DiagnosticBag diags;
  srcsym::analyze(parse(src, "m.py"), AnalysisConfig{}, file, diags);

  std::ostringstream out;
  srcsym::DiagnosticPrinter printer(out);
  printer.print_all(diags, file);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[W001]: unused import 'a', 'b'"), std::string::npos);
  EXPECT_NE(text.find("--> m.py:1:17"), std::string::npos);
  EXPECT_NE(text.find("      | " + std::string(16, ' ') + "^ imported from 'pkg'\n"), std::string::npos);
  EXPECT_NE(text.find("      | " + std::string(19, ' ') + "-\n"), std::string::npos);
}
