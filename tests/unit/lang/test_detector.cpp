#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "srcsym/lang/detector.hpp"
#include "srcsym/lang/ecmascript_parser.hpp"
#include "srcsym/lang/python_parser.hpp"

using srcsym::lang::detect_language;
using srcsym::lang::extension_of;
using srcsym::lang::LanguageRegistry;
using srcsym::lang::parse_file;

TEST(LanguageDetection, ContentMarkers)
{
  EXPECT_EQ(detect_language("interface A { x: number }"), "typescript");
  EXPECT_EQ(detect_language("def f(x):\n    return x\n"), "python");
  EXPECT_EQ(detect_language("const f = () => require('x');"), "javascript");
}

TEST(LanguageDetection, TieGoesToEarlierRegistration)
{
  // javascript and typescript both score 3; javascript is registered first
  EXPECT_EQ(detect_language("function f() { return 1; }"), "javascript");
}

TEST(LanguageDetection, NoMarkersIsUnknown)
{
  EXPECT_EQ(detect_language("hello world"), "unknown");
  EXPECT_EQ(detect_language(""), "unknown");
}

TEST(LanguageDetection, ExtensionIsAuthoritative)
{
  EXPECT_EQ(detect_language("interface A { x: number }", "A.PY"), "python");
  EXPECT_EQ(detect_language("def f(): pass", "src/view.tsx"), "typescript");
  EXPECT_EQ(detect_language("", "lib/index.mjs"), "javascript");
  // Unclaimed extensions fall back to content scoring
  EXPECT_EQ(detect_language("def f(x):\n    return x\n", "notes.txt"), "python");
  EXPECT_EQ(detect_language("hello", ".eslintrc"), "unknown");
}

TEST(LanguageDetection, ExtensionOf)
{
  EXPECT_EQ(extension_of("src/App.TSX"), ".tsx");
  EXPECT_EQ(extension_of("archive.tar.gz"), ".gz");
  EXPECT_EQ(extension_of("dir.d/Makefile"), "");
  EXPECT_EQ(extension_of(".gitignore"), "");
  EXPECT_EQ(extension_of(""), "");
}

TEST(ParseDispatch, RoutesToDetectedParser)
{
  const auto py = parse_file("import os\nos.getcwd()\n", "tool.py");
  EXPECT_EQ(py.language, "python");
  ASSERT_EQ(py.imports.size(), 1U);
  EXPECT_EQ(py.imports[0].source(), "os");

  const auto ts = parse_file("import { A } from './a';\nexport interface B extends A {}\n", "b.ts");
  EXPECT_EQ(ts.language, "typescript");
  ASSERT_EQ(ts.imports.size(), 1U);
  EXPECT_EQ(ts.declarations.count("B"), 1U);
}

TEST(ParseDispatch, ScriptFamilyRefinedWithoutFilename)
{
  // Both inputs tie between javascript and typescript on content scores
  EXPECT_EQ(detect_language("enum Color { Red }\n"), "javascript");

  const auto e = parse_file("enum Color { Red }\n");
  EXPECT_EQ(e.language, "typescript");
  EXPECT_EQ(e.declarations.count("Color"), 1U);

  EXPECT_EQ(parse_file("declare const x: Foo;\n").language, "typescript");
  EXPECT_EQ(parse_file("let m: Map<K, V> = new Map();\n").language, "typescript");
  EXPECT_EQ(parse_file("const f = () => 1;\n").language, "javascript");

  // A claimed extension still pins the tag
  EXPECT_EQ(parse_file("enum Color { Red }\n", "colors.js").language, "javascript");
}

TEST(ParseDispatch, UnknownContentKeepsRawText)
{
  const auto r = parse_file("just some words", "README");
  EXPECT_EQ(r.language, "unknown");
  EXPECT_TRUE(r.syntax_valid);
  EXPECT_TRUE(r.imports.empty());
  EXPECT_TRUE(r.declarations.empty());
  EXPECT_TRUE(r.identifiers.empty());
  EXPECT_EQ(r.raw, "just some words");
}

TEST(LanguageRegistry, RejectsNullAndDuplicateParsers)
{
  LanguageRegistry registry;
  EXPECT_THROW(registry.add(nullptr), std::invalid_argument);

  registry.add(std::make_unique<srcsym::lang::PythonParser>());
  EXPECT_THROW(
    registry.add(std::make_unique<srcsym::lang::PythonParser>()), std::invalid_argument);
  EXPECT_EQ(registry.parsers().size(), 1U);
}

TEST(LanguageRegistry, CustomRegistryLimitsDetection)
{
  LanguageRegistry registry;
  registry.add(std::make_unique<srcsym::lang::EcmaScriptParser>());

  EXPECT_EQ(registry.find("python"), nullptr);
  ASSERT_NE(registry.find("typescript"), nullptr);
  EXPECT_EQ(registry.find("typescript"), registry.find("javascript"));

  EXPECT_EQ(detect_language("x", "mod.py", registry), "unknown");
  EXPECT_EQ(parse_file("import os\n", "mod.py", registry).language, "unknown");
}

TEST(LanguageRegistry, BuiltinScoresInRegistrationOrder)
{
  const auto scores = LanguageRegistry::builtin().score_content("");
  ASSERT_EQ(scores.size(), 3U);
  EXPECT_EQ(scores[0].language, "python");
  EXPECT_EQ(scores[1].language, "javascript");
  EXPECT_EQ(scores[2].language, "typescript");
}
