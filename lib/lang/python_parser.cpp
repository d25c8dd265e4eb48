// srcsym/lang/python_parser.cpp - Python parser over the tree-sitter CST
#include "srcsym/lang/python_parser.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <cctype>
#include <set>
#include <utility>
#include <vector>

#include "srcsym/syntax/ts_ll.hpp"

namespace srcsym::lang
{
namespace
{

using ts_ll::Node;

constexpr std::array<std::string_view, 3> k_python_extensions = {".py", ".pyi", ".pyw"};

bool contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}

bool is_simple_name(std::string_view s)
{
  if (s.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(s.front());
  if (std::isalpha(first) == 0 && first != '_' && first < 0x80) {
    return false;
  }
  for (const char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && uc != '_' && uc < 0x80) {
      return false;
    }
  }
  return true;
}

/// Drops whitespace and line continuations ("from . import x" -> ".").
std::string squeeze(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\\') {
      out += c;
    }
  }
  return out;
}

/// Contents of a plain string literal ('x', "x", '''x''', r"x").
std::optional<std::string> string_literal_value(std::string_view text)
{
  size_t i = 0;
  while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i])) != 0) {
    ++i;
  }
  if (i >= text.size() || (text[i] != '"' && text[i] != '\'')) {
    return std::nullopt;
  }
  const char q = text[i];
  const size_t quote_len = (text.substr(i, 3) == std::string(3, q)) ? 3 : 1;
  const size_t begin = i + quote_len;
  if (text.size() < begin + quote_len) {
    return std::nullopt;
  }
  return std::string(text.substr(begin, text.size() - begin - quote_len));
}

/// Named children of `n` whose field is `field`.
std::vector<Node> children_with_field(Node n, std::string_view field)
{
  std::vector<Node> out;
  ts_ll::Cursor cursor(n);
  if (!cursor.goto_first_child()) {
    return out;
  }
  do {
    if (cursor.current_field_name() == field) {
      out.push_back(cursor.current_node());
    }
  } while (cursor.goto_next_sibling());
  return out;
}

bool has_anonymous_child(Node n, std::string_view kind)
{
  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const Node c = n.child(i);
    if (!c.is_named() && c.kind() == kind) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// TreeExtractor - imports, declarations and references from one CST
// ============================================================================

class TreeExtractor
{
public:
  TreeExtractor(std::string_view source, ParseResult & out) : source_(source), out_(out) {}

  void run(Node root)
  {
    collect_imports(root);
    collect_declarations(root);
    visit(root, Mode::Load);
  }

private:
  enum class Mode : uint8_t {
    Load,
    Store,
  };

  [[nodiscard]] std::string_view text(Node n) const { return n.text(source_); }

  // --------------------------------------------------------------------------
  // Imports
  // --------------------------------------------------------------------------

  void collect_imports(Node root)
  {
    ts_ll::Cursor cursor(root);
    while (true) {
      const Node n = cursor.current_node();
      const auto k = n.kind();
      bool descend = true;
      if (k == "import_statement") {
        add_plain_imports(n);
        descend = false;
      } else if (k == "import_from_statement") {
        add_from_import(n, false);
        descend = false;
      } else if (k == "future_import_statement") {
        add_from_import(n, true);
        descend = false;
      }

      if (descend && cursor.goto_first_child()) {
        continue;
      }
      while (!cursor.goto_next_sibling()) {
        if (!cursor.goto_parent()) {
          return;
        }
      }
    }
  }

  [[nodiscard]] std::optional<ImportBinding> binding_of(Node n) const
  {
    if (n.kind() == "dotted_name") {
      return ImportBinding{squeeze(text(n)), std::nullopt};
    }
    if (n.kind() == "aliased_import") {
      const Node name = n.child_by_field("name");
      const Node alias = n.child_by_field("alias");
      ImportBinding b{squeeze(text(name)), std::nullopt};
      if (!alias.is_null()) {
        b.alias = std::string(text(alias));
      }
      return b;
    }
    return std::nullopt;
  }

  // import a.b, c as d -> one Import per module
  void add_plain_imports(Node stmt)
  {
    const auto pos = stmt.start_position();
    for (const Node name : children_with_field(stmt, "name")) {
      auto b = binding_of(name);
      if (!b) {
        continue;
      }
      std::string source = b->name;
      out_.imports.emplace_back(
        std::move(source), PlainImport{}, std::vector<ImportBinding>{std::move(*b)}, pos.line,
        pos.column);
    }
  }

  void add_from_import(Node stmt, bool is_future)
  {
    const auto pos = stmt.start_position();

    std::string source = "__future__";
    if (!is_future) {
      const Node module = stmt.child_by_field("module_name");
      source = module.is_null() ? std::string() : squeeze(text(module));
    }

    std::vector<ImportBinding> names;
    for (const Node name : children_with_field(stmt, "name")) {
      if (auto b = binding_of(name)) {
        names.push_back(std::move(*b));
      }
    }
    for (uint32_t i = 0; i < stmt.named_child_count(); ++i) {
      if (stmt.named_child(i).kind() == "wildcard_import") {
        names.push_back(ImportBinding{"*", std::nullopt});
      }
    }

    out_.imports.emplace_back(
      std::move(source), FromImport{is_future}, std::move(names), pos.line, pos.column);
  }

  // --------------------------------------------------------------------------
  // Declarations (module level only)
  // --------------------------------------------------------------------------

  void collect_declarations(Node root)
  {
    collect_dunder_all(root);

    for (uint32_t i = 0; i < root.named_child_count(); ++i) {
      const Node stmt = root.named_child(i);
      const auto k = stmt.kind();
      if (k == "function_definition" || k == "class_definition") {
        add_definition(stmt);
      } else if (k == "decorated_definition") {
        const Node def = stmt.child_by_field("definition");
        if (!def.is_null()) {
          add_definition(def);
        }
      } else if (k == "expression_statement") {
        for (uint32_t j = 0; j < stmt.named_child_count(); ++j) {
          const Node expr = stmt.named_child(j);
          if (expr.kind() == "assignment") {
            add_assignment(expr, stmt.start_position().line);
          }
        }
      }
    }
  }

  // __all__ = ["a", "b"] or ("a", "b") at module level
  void collect_dunder_all(Node root)
  {
    for (uint32_t i = 0; i < root.named_child_count(); ++i) {
      const Node stmt = root.named_child(i);
      if (stmt.kind() != "expression_statement" || stmt.named_child_count() == 0) {
        continue;
      }
      const Node assign = stmt.named_child(0);
      if (assign.kind() != "assignment") {
        continue;
      }
      const Node left = assign.child_by_field("left");
      const Node right = assign.child_by_field("right");
      if (left.is_null() || right.is_null() || text(left) != "__all__") {
        continue;
      }
      if (right.kind() != "list" && right.kind() != "tuple") {
        continue;
      }
      for (uint32_t j = 0; j < right.named_child_count(); ++j) {
        const Node item = right.named_child(j);
        if (item.kind() != "string") {
          continue;
        }
        if (auto v = string_literal_value(text(item))) {
          dunder_all_.insert(std::move(*v));
        }
      }
    }
  }

  [[nodiscard]] bool is_exported(const std::string & name) const
  {
    return (!name.empty() && name.front() != '_') || dunder_all_.count(name) > 0;
  }

  void add_definition(Node def)
  {
    const Node name_node = def.child_by_field("name");
    if (name_node.is_null()) {
      return;
    }
    std::string name(text(name_node));
    const uint32_t line = def.start_position().line;
    const uint32_t column = name_node.start_position().column;
    const bool exported = is_exported(name);

    if (def.kind() == "function_definition") {
      const bool is_async = has_anonymous_child(def, "async");
      FunctionDecl fn{build_signature(def, name, is_async), is_async, false};
      std::string descriptor = is_async ? "async function" : "function";
      out_.declarations.insert_or_assign(
        name, Declaration(name, std::move(fn), line, std::move(descriptor), exported, column));
    } else {
      out_.declarations.insert_or_assign(
        name, Declaration(name, ClassDecl{}, line, "class", exported, column));
    }
  }

  [[nodiscard]] std::string build_signature(
    Node def, const std::string & name, bool is_async) const
  {
    std::vector<std::string> params;
    const Node parameters = def.child_by_field("parameters");
    for (uint32_t i = 0; !parameters.is_null() && i < parameters.named_child_count(); ++i) {
      const Node p = parameters.named_child(i);
      const auto k = p.kind();
      if (k == "identifier") {
        params.emplace_back(text(p));
      } else if (k == "typed_parameter") {
        params.push_back(describe_typed_parameter(p));
      } else if (k == "default_parameter" || k == "typed_default_parameter") {
        const Node pname = p.child_by_field("name");
        std::string s(text(pname));
        const Node type = p.child_by_field("type");
        if (!type.is_null() && is_simple_name(text(type))) {
          s += fmt::format(": {}", text(type));
        }
        params.push_back(std::move(s));
      } else if (k == "list_splat_pattern" || k == "dictionary_splat_pattern") {
        params.push_back(describe_splat(p));
      }
    }

    std::string ret;
    const Node return_type = def.child_by_field("return_type");
    if (!return_type.is_null() && is_simple_name(text(return_type))) {
      ret = fmt::format(" -> {}", text(return_type));
    }

    return fmt::format(
      "{}def {}({}){}", is_async ? "async " : "", name, fmt::join(params, ", "), ret);
  }

  [[nodiscard]] std::string describe_splat(Node p) const
  {
    const std::string prefix = (p.kind() == "dictionary_splat_pattern") ? "**" : "*";
    if (p.named_child_count() > 0) {
      return prefix + std::string(text(p.named_child(0)));
    }
    return prefix;
  }

  [[nodiscard]] std::string describe_typed_parameter(Node p) const
  {
    if (p.named_child_count() == 0) {
      return std::string(text(p));
    }
    const Node inner = p.named_child(0);
    if (inner.kind() != "identifier") {
      // *args: T and **kwargs: T keep only the catch-all name
      return describe_splat(inner);
    }
    std::string s(text(inner));
    const Node type = p.child_by_field("type");
    if (!type.is_null() && is_simple_name(text(type))) {
      s += fmt::format(": {}", text(type));
    }
    return s;
  }

  // a = 1, a: int = 1, a = b = 1; first occurrence wins
  void add_assignment(Node assign, uint32_t line)
  {
    Node node = assign;
    while (!node.is_null() && node.kind() == "assignment") {
      const Node left = node.child_by_field("left");
      if (!left.is_null() && left.kind() == "identifier") {
        std::string name(text(left));
        const bool annotated = !node.child_by_field("type").is_null();
        const bool exported = is_exported(name);
        const uint32_t column = left.start_position().column;
        out_.declarations.try_emplace(
          name, name, VariableDecl{}, line, annotated ? "annotated variable" : "variable",
          exported, column);
      }
      node = node.child_by_field("right");
    }
  }

  // --------------------------------------------------------------------------
  // Identifier references
  // --------------------------------------------------------------------------

  void add_reference(Node n)
  {
    out_.identifiers.push_back(IdentifierRef{n.start_position().line, std::string(text(n))});
  }

  struct Pending
  {
    Node node;
    Mode mode;
  };
  using PendingList = std::vector<Pending>;

  // Explicit work stack: deeply nested expressions must not grow the call stack
  void visit(Node root, Mode mode)
  {
    PendingList stack{Pending{root, mode}};
    PendingList next;
    while (!stack.empty()) {
      const Pending p = stack.back();
      stack.pop_back();
      next.clear();
      expand(p.node, p.mode, next);
      // Reversed so children come off the stack in source order
      stack.insert(stack.end(), next.rbegin(), next.rend());
    }
  }

  static void push_field(Node n, std::string_view field, Mode mode, PendingList & next)
  {
    for (const Node c : children_with_field(n, field)) {
      next.push_back(Pending{c, mode});
    }
  }

  static void push_children(Node n, Mode mode, PendingList & next)
  {
    for (uint32_t i = 0; i < n.named_child_count(); ++i) {
      next.push_back(Pending{n.named_child(i), mode});
    }
  }

  /// Pushes every named child, switching to `field_mode` for children in `field`.
  static void push_children_with(
    Node n, std::string_view field, Mode field_mode, Mode other_mode, PendingList & next)
  {
    ts_ll::Cursor cursor(n);
    if (!cursor.goto_first_child()) {
      return;
    }
    do {
      const Node c = cursor.current_node();
      if (!c.is_named()) {
        continue;
      }
      next.push_back(Pending{c, cursor.current_field_name() == field ? field_mode : other_mode});
    } while (cursor.goto_next_sibling());
  }

  // Only annotations and default values of parameters are references.
  static void push_parameters(Node params, PendingList & next)
  {
    if (params.is_null()) {
      return;
    }
    for (uint32_t i = 0; i < params.named_child_count(); ++i) {
      const Node p = params.named_child(i);
      const auto k = p.kind();
      if (k == "typed_parameter") {
        push_field(p, "type", Mode::Load, next);
      } else if (k == "default_parameter") {
        push_field(p, "value", Mode::Load, next);
      } else if (k == "typed_default_parameter") {
        push_field(p, "type", Mode::Load, next);
        push_field(p, "value", Mode::Load, next);
      }
    }
  }

  void expand(Node n, Mode mode, PendingList & next)
  {
    if (n.is_null()) {
      return;
    }
    const auto k = n.kind();

    if (k == "identifier") {
      if (mode == Mode::Load) {
        add_reference(n);
      }
      return;
    }

    if (
      k == "import_statement" || k == "import_from_statement" ||
      k == "future_import_statement" || k == "global_statement" || k == "nonlocal_statement" ||
      k == "comment") {
      return;
    }

    if (k == "function_definition") {
      push_parameters(n.child_by_field("parameters"), next);
      push_field(n, "return_type", Mode::Load, next);
      push_field(n, "body", Mode::Load, next);
      return;
    }
    if (k == "lambda") {
      push_parameters(n.child_by_field("parameters"), next);
      push_field(n, "body", Mode::Load, next);
      return;
    }
    if (k == "class_definition") {
      push_field(n, "superclasses", Mode::Load, next);
      push_field(n, "body", Mode::Load, next);
      return;
    }
    if (k == "attribute") {
      // obj.attr: the attribute name is never a free reference
      push_field(n, "object", Mode::Load, next);
      return;
    }
    if (k == "subscript") {
      push_children(n, Mode::Load, next);
      return;
    }
    if (k == "keyword_argument") {
      push_field(n, "value", Mode::Load, next);
      return;
    }
    if (k == "assignment") {
      push_field(n, "left", Mode::Store, next);
      push_field(n, "type", Mode::Load, next);
      push_field(n, "right", Mode::Load, next);
      return;
    }
    if (k == "augmented_assignment") {
      push_field(n, "left", Mode::Store, next);
      push_field(n, "right", Mode::Load, next);
      return;
    }
    if (k == "for_statement" || k == "for_in_clause") {
      push_children_with(n, "left", Mode::Store, Mode::Load, next);
      return;
    }
    if (k == "named_expression") {
      push_field(n, "name", Mode::Store, next);
      push_field(n, "value", Mode::Load, next);
      return;
    }
    if (k == "as_pattern") {
      push_children_with(n, "alias", Mode::Store, mode, next);
      return;
    }
    if (k == "delete_statement") {
      push_children(n, Mode::Store, next);
      return;
    }

    push_children(n, mode, next);
  }

  std::string_view source_;
  ParseResult & out_;
  std::set<std::string> dunder_all_;
};

void apply_fallback(std::string_view content, ParseResult & out)
{
  out.imports = python_fallback::find_imports(content);
  out.declarations = python_fallback::find_declarations(content);
  out.identifiers = python_fallback::find_identifiers(content);
}

}  // namespace

std::optional<std::string> PythonParser::language_for_extension(std::string_view extension) const
{
  for (const auto ext : k_python_extensions) {
    if (ext == extension) {
      return std::string(k_language_python);
    }
  }
  return std::nullopt;
}

std::vector<LanguageScore> PythonParser::score_content(std::string_view content) const
{
  int score = 0;
  if (contains(content, "def ")) {
    score += 2;
  }
  if (contains(content, "class ") && contains(content, ":")) {
    score += 2;
  }
  if (contains(content, "import ") || contains(content, "from ")) {
    score += 2;
  }
  if (contains(content, ":") && contains(content, "#")) {
    score += 1;
  }
  if (contains(content, "self.")) {
    score += 1;
  }
  return {LanguageScore{k_language_python, score}};
}

ParseResult PythonParser::parse(
  std::string_view content, std::string_view /*filename*/, std::string_view /*language*/) const
{
  ParseResult result;
  result.language = k_language_python;
  result.raw = std::string(content);

  const ts_ll::Parser parser(ts_ll::tree_sitter_python());
  const ts_ll::Tree tree(parser.parse_string(result.raw));

  if (tree.is_null()) {
    result.syntax_valid = false;
    result.errors.emplace_back("python grammar could not be loaded");
    apply_fallback(result.raw, result);
    return result;
  }

  const Node root = tree.root_node();
  if (root.has_error()) {
    Node err = ts_ll::find_first_error(root);
    if (err.is_null()) {
      err = root;
    }
    const auto pos = err.start_position();
    result.syntax_valid = false;
    result.errors.push_back(fmt::format("syntax error at line {}, column {}", pos.line, pos.column));
    apply_fallback(result.raw, result);
    return result;
  }

  TreeExtractor(result.raw, result).run(root);
  return result;
}

}  // namespace srcsym::lang
