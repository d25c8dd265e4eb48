#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "srcsym/resolution/import_resolver.hpp"

using srcsym::KnownPaths;
using srcsym::module_name_for_path;
using srcsym::normalize_path;
using srcsym::relative_specifier_to_path;
using srcsym::resolve_module_to_file;
using srcsym::resolve_relative_import;
using srcsym::strip_extension;

namespace
{

KnownPaths repository()
{
  KnownPaths known;
  for (const char * path :
       {"src/a/c/index.ts", "src/a/b.ts", "src/util.ts", "pkg/__init__.py", "pkg/mod.py",
        "pkg/sub/helpers.py", "lib/deep/x.js"}) {
    known.emplace(path, module_name_for_path(path));
  }
  return known;
}

}  // namespace

TEST(ImportResolver, NormalizePath)
{
  EXPECT_EQ(normalize_path("a/./b/../c/"), "a/c");
  EXPECT_EQ(normalize_path("./x"), "x");
  EXPECT_EQ(normalize_path("../x"), "../x");
  EXPECT_EQ(normalize_path("."), "");
  EXPECT_EQ(normalize_path(""), "");
}

TEST(ImportResolver, StripExtension)
{
  EXPECT_EQ(strip_extension("a/b.test.ts"), "a/b.test");
  EXPECT_EQ(strip_extension("dir/.env"), "dir/.env");
  EXPECT_EQ(strip_extension("a.d/file"), "a.d/file");
  EXPECT_EQ(strip_extension("mod.py"), "mod");
}

TEST(ImportResolver, RelativeSpecifierToPath)
{
  EXPECT_EQ(relative_specifier_to_path("."), "./");
  EXPECT_EQ(relative_specifier_to_path(".."), "../");
  EXPECT_EQ(relative_specifier_to_path(".mod"), "./mod");
  EXPECT_EQ(relative_specifier_to_path("..pkg.mod"), "../pkg/mod");
  EXPECT_EQ(relative_specifier_to_path("...a"), "../../a");
  // Path-style specifiers keep their dots
  EXPECT_EQ(relative_specifier_to_path("./x.js"), "./x.js");
  EXPECT_EQ(relative_specifier_to_path("../lib/y"), "../lib/y");
}

TEST(ImportResolver, ModuleNameForPath)
{
  EXPECT_EQ(module_name_for_path("pkg/sub/mod.py"), "pkg.sub.mod");
  EXPECT_EQ(module_name_for_path("pkg/__init__.py"), "pkg");
  EXPECT_EQ(module_name_for_path("src/a/c/index.ts"), "src.a.c");
  EXPECT_EQ(module_name_for_path("main.py"), "main");
}

TEST(ImportResolver, EcmaScriptRelativeSpecifiers)
{
  const auto known = repository();

  // Directory index
  EXPECT_EQ(resolve_relative_import("./c", "src/a/b.ts", known), "src/a/c/index.ts");
  // Appended extension
  EXPECT_EQ(resolve_relative_import("../util", "src/a/b.ts", known), "src/util.ts");
  EXPECT_EQ(resolve_relative_import("../../lib/deep/x", "src/a/b.ts", known), "lib/deep/x.js");
  // A compiled-output extension still finds the TypeScript source
  EXPECT_EQ(resolve_relative_import("../b.js", "src/a/c/index.ts", known), "src/a/b.ts");
  // Exact match
  EXPECT_EQ(resolve_relative_import("./b.ts", "src/a/c.ts", known), "src/a/b.ts");

  EXPECT_EQ(resolve_relative_import("./missing", "src/a/b.ts", known), std::nullopt);
  EXPECT_EQ(resolve_relative_import("react", "src/a/b.ts", known), std::nullopt);
}

TEST(ImportResolver, PythonRelativeSpecifiers)
{
  const auto known = repository();

  EXPECT_EQ(resolve_relative_import(".mod", "pkg/__init__.py", known), "pkg/mod.py");
  EXPECT_EQ(resolve_relative_import(".", "pkg/mod.py", known), "pkg/__init__.py");
  EXPECT_EQ(resolve_relative_import("..mod", "pkg/sub/helpers.py", known), "pkg/mod.py");
  EXPECT_EQ(resolve_relative_import(".sub.helpers", "pkg/mod.py", known), "pkg/sub/helpers.py");
  EXPECT_EQ(resolve_relative_import(".nothing", "pkg/mod.py", known), std::nullopt);
}

TEST(ImportResolver, ModuleToFile)
{
  const auto known = repository();

  EXPECT_EQ(resolve_module_to_file("pkg.sub.helpers", known), "pkg/sub/helpers.py");
  EXPECT_EQ(resolve_module_to_file("helpers", known), "pkg/sub/helpers.py");
  EXPECT_EQ(resolve_module_to_file("pkg", known), "pkg/__init__.py");
  EXPECT_EQ(resolve_module_to_file("src.a.c", known), "src/a/c/index.ts");

  // Suffix matches stop at segment boundaries
  EXPECT_EQ(resolve_module_to_file("elpers", known), std::nullopt);
  EXPECT_EQ(resolve_module_to_file("numpy", known), std::nullopt);
  EXPECT_EQ(resolve_module_to_file("", known), std::nullopt);
}

TEST(ImportResolver, ModuleToFileDelegatesRelativeNames)
{
  const auto known = repository();
  EXPECT_EQ(resolve_module_to_file(".mod", known), std::nullopt);
  EXPECT_EQ(resolve_module_to_file(".mod", known, "pkg/__init__.py"), "pkg/mod.py");
}

TEST(ImportResolver, EmptyRepository)
{
  const KnownPaths known;
  EXPECT_EQ(resolve_relative_import("./a", "b.ts", known), std::nullopt);
  EXPECT_EQ(resolve_module_to_file("a", known), std::nullopt);
}
