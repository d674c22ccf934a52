#pragma once

// cordon/ast.hpp: Syntax tree of the cordon analysis script.
//
// Nodes are "fat" structs: one Expr type and one Stmt type, discriminated by
// a kind enum, with the fields each kind uses documented beside the enum.
// Children are owned through unique_ptr; a parsed Module is immutable and
// shared (shared_ptr<const Module>) between the validator, the interpreter
// and every function object created from it.
//
// INVARIANTS:
//   - Every node carries the 1-based line/column of its first token.
//   - Tree depth is bounded by the parser's max_depth, so every recursive
//     walk over a tree (validator, interpreter, destructor) is bounded too.

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace cordon::ast {

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

// None, True/False, integer, float, string.
using Constant = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

enum class ExprKind {
  name,         // name
  constant,     // constant
  fstring,      // parts
  list,         // items
  tuple,        // items
  dict,         // items (keys), values
  list_comp,    // a (element), generators
  dict_comp,    // a (key), b (value), generators
  unary,        // op in {"-", "+", "~", "not"}, a
  binary,       // op, a, b
  bool_op,      // op in {"and", "or"}, items (two or more operands)
  compare,      // a (leftmost), ops, items (right operands)
  conditional,  // a (test), b (body), c (orelse)
  call,         // a (callee), items (positional), keywords
  attribute,    // a (object), name (attribute)
  subscript,    // a (object), b (index, possibly a slice or tuple)
  slice,        // a (lower), b (upper), c (step); each may be null
  lambda,       // params, a (body)
};

struct Keyword {
  std::string name;
  ExprPtr value;
};

struct Param {
  std::string name;
  ExprPtr default_value;  // null when the parameter has no default
};

struct Comprehension {
  ExprPtr target;
  ExprPtr iter;
  std::vector<ExprPtr> conditions;
};

struct FStringPart {
  std::string literal;      // used when expr is null
  ExprPtr expr;
  char conversion{0};       // 0, 'r', 's' or 'a'
  std::string format_spec;  // text after ':' (no nested fields)
};

struct Expr {
  ExprKind kind{ExprKind::constant};
  int line{0};
  int column{0};

  std::string name;
  std::string op;
  Constant constant;
  ExprPtr a;
  ExprPtr b;
  ExprPtr c;
  std::vector<ExprPtr> items;
  std::vector<ExprPtr> values;
  std::vector<std::string> ops;
  std::vector<Keyword> keywords;
  std::vector<Comprehension> generators;
  std::vector<FStringPart> parts;
  std::vector<Param> params;
};

enum class StmtKind {
  expr,          // value
  assign,        // targets (left to right), value
  aug_assign,    // targets[0], op (without '='), value
  import,        // names
  import_from,   // module, names
  if_,           // test, body, orelse
  for_,          // target, iter, body, orelse
  while_,        // test, body, orelse
  break_,
  continue_,
  pass,
  function_def,  // name, params, body
  return_,       // value (may be null)
  with,          // value (context expression), target (may be null), body
  try_,          // body, handlers, orelse, finalbody
  raise,         // value (may be null: re-raise)
  assert_,       // test, value (message, may be null)
  del,           // targets
};

struct ImportAlias {
  std::string name;     // dotted module name, or imported member for import_from
  std::string as_name;  // empty when no "as"
  int line{0};
  int column{0};
};

struct ExceptHandler {
  ExprPtr type;  // null for a bare except
  std::string name;
  Block body;
  int line{0};
  int column{0};
};

struct Stmt {
  StmtKind kind{StmtKind::pass};
  int line{0};
  int column{0};

  ExprPtr value;
  ExprPtr test;
  ExprPtr target;
  ExprPtr iter;
  std::vector<ExprPtr> targets;
  std::string op;
  std::string name;
  std::string module;
  std::vector<ImportAlias> names;
  std::vector<Param> params;
  std::vector<ExceptHandler> handlers;
  Block body;
  Block orelse;
  Block finalbody;
};

struct Module {
  Block body;
};

// Dotted spelling of a name/attribute chain ("numeric.linalg.solve"), or
// empty when the expression is anything else.
std::string dotted_name(const Expr& expr);

}  // namespace cordon::ast
