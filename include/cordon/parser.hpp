#pragma once

// cordon/parser.hpp: Recursive-descent parser for the analysis script.
//
// The parser is the only component that interprets program text. It never
// evaluates anything: constant folding, name resolution and import
// resolution all happen later. A malformed program yields a ParseFailure,
// never an exception and never a crash, whatever the input.

#include <memory>
#include <optional>
#include <string>

#include "cordon/ast.hpp"

namespace cordon {

struct ParseFailure {
  std::string message;  // without position
  int line{0};
  int column{0};

  // "line 3, column 7: expected ':'"
  std::string describe() const;
};

struct ParseResult {
  std::shared_ptr<const ast::Module> module;  // null on failure
  std::optional<ParseFailure> error;

  bool ok() const { return module != nullptr; }
};

constexpr int kDefaultMaxParseDepth = 200;

/**
 * @brief Parses a whole program.
 * @param max_depth Bound on syntactic nesting (brackets, unary chains,
 *        operator chains, blocks). Exceeding it is reported as a failure.
 */
ParseResult parse_program(const std::string& source, int max_depth = kDefaultMaxParseDepth);

}  // namespace cordon
