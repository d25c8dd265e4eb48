#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "srcsym/lang/python_parser.hpp"

using srcsym::ImportBinding;
using srcsym::ImportKind;
using srcsym::ParseResult;
using srcsym::lang::PythonParser;

namespace
{

ParseResult parse(const std::string & src) { return PythonParser().parse(src, "module.py"); }

bool has_reference(const ParseResult & r, const std::string & name)
{
  return std::any_of(r.identifiers.begin(), r.identifiers.end(), [&](const auto & ref) {
    return ref.name == name;
  });
}

}  // namespace

// ============================================================================
// Imports
// ============================================================================

TEST(PythonImports, PlainImportsOnePerModule)
{
  const auto r = parse("import os\nimport numpy as np, os.path\n");
  ASSERT_TRUE(r.syntax_valid);
  ASSERT_EQ(r.imports.size(), 3U);

  EXPECT_EQ(r.imports[0].source(), "os");
  EXPECT_EQ(r.imports[0].kind(), ImportKind::Plain);
  EXPECT_EQ(r.imports[0].line(), 1U);

  EXPECT_EQ(r.imports[1].source(), "numpy");
  EXPECT_EQ(r.imports[1].names(), (std::vector<ImportBinding>{ImportBinding{"numpy", "np"}}));
  EXPECT_EQ(r.imports[1].bound_names(), std::vector<std::string>{"np"});

  // import os.path binds the top-level package
  EXPECT_EQ(r.imports[2].source(), "os.path");
  EXPECT_EQ(r.imports[2].bound_names(), std::vector<std::string>{"os"});
}

TEST(PythonImports, FromImportsAndRelativity)
{
  const auto r = parse(
    "from typing import List, Dict as D\n"
    "from . import sibling\n"
    "from ..pkg.mod import a\n");
  ASSERT_EQ(r.imports.size(), 3U);

  EXPECT_EQ(r.imports[0].kind(), ImportKind::From);
  EXPECT_EQ(r.imports[0].source(), "typing");
  EXPECT_FALSE(r.imports[0].is_relative());
  const std::vector<ImportBinding> expected = {
    ImportBinding{"List", std::nullopt}, ImportBinding{"Dict", "D"}};
  EXPECT_EQ(r.imports[0].names(), expected);

  EXPECT_EQ(r.imports[1].source(), ".");
  EXPECT_TRUE(r.imports[1].is_relative());
  EXPECT_EQ(r.imports[1].level(), 1U);

  EXPECT_EQ(r.imports[2].source(), "..pkg.mod");
  EXPECT_EQ(r.imports[2].level(), 2U);
  EXPECT_EQ(r.imports[2].line(), 3U);
}

TEST(PythonImports, WildcardBindsNothing)
{
  const auto r = parse("from pkg import *\n");
  ASSERT_EQ(r.imports.size(), 1U);
  ASSERT_EQ(r.imports[0].names().size(), 1U);
  EXPECT_EQ(r.imports[0].names()[0].name, "*");
  EXPECT_TRUE(r.imports[0].bound_names().empty());
}

TEST(PythonImports, FutureImport)
{
  const auto r = parse("from __future__ import annotations\n");
  ASSERT_EQ(r.imports.size(), 1U);
  EXPECT_EQ(r.imports[0].source(), "__future__");
  const auto * from = std::get_if<srcsym::FromImport>(&r.imports[0].detail());
  ASSERT_NE(from, nullptr);
  EXPECT_TRUE(from->is_future);
}

TEST(PythonImports, NestedImportsAreCollected)
{
  const auto r = parse("def load():\n    import json\n    return json\n");
  ASSERT_EQ(r.imports.size(), 1U);
  EXPECT_EQ(r.imports[0].source(), "json");
  EXPECT_EQ(r.imports[0].line(), 2U);
}

// ============================================================================
// Declarations
// ============================================================================

TEST(PythonDeclarations, FunctionsClassesAndVariables)
{
  const auto r = parse(
    "__all__ = [\"_private_api\"]\n"
    "\n"
    "def greet(name: str, times=1, *args, **kwargs) -> str:\n"
    "    return name * times\n"
    "\n"
    "async def fetch(url):\n"
    "    pass\n"
    "\n"
    "@decorator\n"
    "def decorated():\n"
    "    pass\n"
    "\n"
    "class Service(Base):\n"
    "    def method(self):\n"
    "        return 1\n"
    "\n"
    "def _private_api():\n"
    "    pass\n"
    "\n"
    "def _hidden():\n"
    "    pass\n"
    "\n"
    "CONSTANT = 10\n"
    "CONSTANT = 20\n"
    "typed: int = 5\n"
    "a = b = 1\n");
  ASSERT_TRUE(r.syntax_valid);
  const auto & d = r.declarations;

  ASSERT_EQ(d.count("greet"), 1U);
  EXPECT_EQ(d.at("greet").descriptor(), "function");
  EXPECT_EQ(*d.at("greet").signature(), "def greet(name: str, times, *args, **kwargs) -> str");
  EXPECT_EQ(d.at("greet").line(), 3U);

  ASSERT_EQ(d.count("fetch"), 1U);
  EXPECT_EQ(d.at("fetch").descriptor(), "async function");
  EXPECT_EQ(*d.at("fetch").signature(), "async def fetch(url)");

  EXPECT_EQ(d.count("decorated"), 1U);
  ASSERT_EQ(d.count("Service"), 1U);
  EXPECT_EQ(d.at("Service").kind(), srcsym::DeclarationKind::Class);
  EXPECT_EQ(d.count("method"), 0U);

  EXPECT_TRUE(d.at("_private_api").exported());
  EXPECT_FALSE(d.at("_hidden").exported());
  EXPECT_TRUE(d.at("greet").exported());

  ASSERT_EQ(d.count("CONSTANT"), 1U);
  EXPECT_EQ(d.at("CONSTANT").line(), 23U);
  EXPECT_EQ(d.at("CONSTANT").descriptor(), "variable");
  EXPECT_EQ(d.at("typed").descriptor(), "annotated variable");
  EXPECT_EQ(d.count("a"), 1U);
  EXPECT_EQ(d.count("b"), 1U);
}

TEST(PythonDeclarations, ComplexAnnotationsAreDropped)
{
  const auto r = parse("def f(x: List[int], y: int = 0) -> Dict[str, int]:\n    pass\n");
  ASSERT_EQ(r.declarations.count("f"), 1U);
  EXPECT_EQ(*r.declarations.at("f").signature(), "def f(x, y: int)");
}

// ============================================================================
// References
// ============================================================================

TEST(PythonReferences, LoadContextsOnly)
{
  const auto r = parse(
    "import os\n"
    "result = os.getcwd()\n"
    "def run(path: Path = DEFAULT):\n"
    "    local = compute(path, key=value)\n"
    "    return local.attr\n");

  EXPECT_TRUE(has_reference(r, "os"));
  EXPECT_TRUE(has_reference(r, "Path"));
  EXPECT_TRUE(has_reference(r, "DEFAULT"));
  EXPECT_TRUE(has_reference(r, "compute"));
  EXPECT_TRUE(has_reference(r, "value"));
  EXPECT_TRUE(has_reference(r, "local"));

  EXPECT_FALSE(has_reference(r, "result"));
  EXPECT_FALSE(has_reference(r, "getcwd"));
  EXPECT_FALSE(has_reference(r, "key"));
  EXPECT_FALSE(has_reference(r, "attr"));
  EXPECT_FALSE(has_reference(r, "run"));
}

TEST(PythonReferences, DeeplyNestedExpression)
{
  std::string src = "total = ";
  for (int i = 0; i < 20000; ++i) {
    src += "base + ";
  }
  src += "last\n";

  const auto r = parse(src);
  ASSERT_TRUE(r.syntax_valid);
  EXPECT_EQ(r.declarations.count("total"), 1U);
  EXPECT_EQ(r.identifiers.size(), 20001U);
  EXPECT_EQ(r.identifiers.front().name, "base");
  EXPECT_EQ(r.identifiers.back().name, "last");
}

TEST(PythonReferences, ForwardReferencesCount)
{
  const auto r = parse("def main():\n    helper()\n\ndef helper():\n    pass\n");
  EXPECT_TRUE(has_reference(r, "helper"));
  EXPECT_FALSE(has_reference(r, "main"));
}

// ============================================================================
// Syntax errors and fallback
// ============================================================================

TEST(PythonFallback, UnbalancedParenthesisUsesFallback)
{
  const auto r = parse(
    "import os\n"
    "from pkg.sub import thing as t\n"
    "\n"
    "def broken(a, b:\n"
    "    return (a + b\n"
    "\n"
    "class Kept:\n"
    "    pass\n"
    "LIMIT = 3\n");

  EXPECT_FALSE(r.syntax_valid);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].rfind("syntax error at line ", 0), 0U);
  EXPECT_EQ(r.language, "python");

  ASSERT_EQ(r.imports.size(), 2U);
  EXPECT_EQ(r.imports[0].source(), "os");
  EXPECT_EQ(r.imports[1].source(), "pkg.sub");
  EXPECT_EQ(r.imports[1].names(), (std::vector<ImportBinding>{ImportBinding{"thing", "t"}}));

  EXPECT_EQ(r.declarations.count("broken"), 1U);
  EXPECT_EQ(r.declarations.count("Kept"), 1U);
  EXPECT_EQ(r.declarations.count("LIMIT"), 1U);
}

TEST(PythonFallback, LineBasedExtraction)
{
  namespace fb = srcsym::lang::python_fallback;
  const std::string src =
    "import a, b as c\n"
    "from .rel import (x, y)  # comment\n"
    "async def go(:\n"
    "value: int = 1\n"
    "if value == 2:\n"
    "    pass\n";

  const auto imports = fb::find_imports(src);
  ASSERT_EQ(imports.size(), 3U);
  EXPECT_EQ(imports[0].source(), "a");
  EXPECT_EQ(imports[1].source(), "b");
  EXPECT_EQ(imports[1].bound_names(), std::vector<std::string>{"c"});
  EXPECT_EQ(imports[2].source(), ".rel");
  EXPECT_EQ(imports[2].level(), 1U);
  EXPECT_EQ(imports[2].names().size(), 2U);

  const auto decls = fb::find_declarations(src);
  ASSERT_EQ(decls.count("go"), 1U);
  EXPECT_EQ(decls.at("go").descriptor(), "async function");
  ASSERT_EQ(decls.count("value"), 1U);
  EXPECT_EQ(decls.at("value").descriptor(), "annotated variable");

  const auto ids = fb::find_identifiers(src);
  const auto named = [&ids](const std::string & n) {
    return std::any_of(ids.begin(), ids.end(), [&n](const auto & ref) { return ref.name == n; });
  };
  EXPECT_TRUE(named("value"));
  EXPECT_FALSE(named("go"));
  EXPECT_FALSE(named("rel"));
  EXPECT_FALSE(named("if"));
  EXPECT_FALSE(named("comment"));
}

TEST(PythonFallback, VeryLongLinesAreScannedLinearly)
{
  namespace fb = srcsym::lang::python_fallback;
  const std::string name(100000, 'a');
  const std::string src =
    "from pkg import " + name + "\n" +
    "value: " + name + " = 1\n" +
    "def " + name + "(x):\n";

  const auto imports = fb::find_imports(src);
  ASSERT_EQ(imports.size(), 1U);
  ASSERT_EQ(imports[0].names().size(), 1U);
  EXPECT_EQ(imports[0].names()[0].name, name);

  const auto decls = fb::find_declarations(src);
  ASSERT_EQ(decls.count("value"), 1U);
  EXPECT_EQ(decls.at("value").descriptor(), "annotated variable");
  EXPECT_EQ(decls.count(name), 1U);

  const auto ids = fb::find_identifiers(src);
  EXPECT_TRUE(std::any_of(
    ids.begin(), ids.end(), [&name](const auto & ref) { return ref.name == name; }));
}

TEST(PythonFallback, AssignmentShapes)
{
  namespace fb = srcsym::lang::python_fallback;
  const auto decls = fb::find_declarations(
    "a = 1\n"
    "b == 2\n"
    "c := 3\n"
    "d: int\n"
    "e : str = 'x'\n"
    "1f = 2\n"
    "asyncdef = 4\n");
  EXPECT_EQ(decls.count("a"), 1U);
  EXPECT_EQ(decls.count("b"), 0U);
  EXPECT_EQ(decls.count("c"), 0U);
  EXPECT_EQ(decls.count("d"), 0U);
  ASSERT_EQ(decls.count("e"), 1U);
  EXPECT_EQ(decls.at("e").descriptor(), "annotated variable");
  EXPECT_EQ(decls.count("f"), 0U);
  EXPECT_EQ(decls.count("asyncdef"), 1U);
}

TEST(PythonParser, ParsingIsIdempotent)
{
  const std::string src = "import os\n\ndef f(x):\n    return os.path.join(x)\n";
  EXPECT_EQ(parse(src), parse(src));
}

TEST(PythonParser, ScoreFavorsPythonMarkers)
{
  const auto scores = PythonParser().score_content("class A:\n    def f(self):\n        self.x = 1\n");
  ASSERT_EQ(scores.size(), 1U);
  EXPECT_EQ(scores[0].language, "python");
  EXPECT_EQ(scores[0].score, 5);
}
