#pragma once

// cordon/validator.hpp: Static Validator.
//
// Parses candidate source with the script grammar and walks every node,
// collecting violations against the AllowList. Nothing is executed. The
// validator is a fast reject: the runtime gates in the interpreter and the
// module resolver remain authoritative for everything it cannot see
// (aliasing, values computed at run time).

#include <memory>
#include <string>

#include "cordon/allow_list.hpp"
#include "cordon/ast.hpp"
#include "cordon/parser.hpp"
#include "cordon/types.hpp"

namespace cordon {

struct ValidatorOptions {
  // Reject programs that never bind result_name at module level.
  bool require_result_assignment{false};
  std::string result_name{"result"};
  int max_parse_depth{kDefaultMaxParseDepth};
};

/**
 * @brief Validates program text.
 * @param parsed When non-null and parsing succeeds, receives the module so
 *        the executor can run it without parsing again.
 * @return Violations in source order; a parse failure is the only violation.
 */
ValidationResult validate(const std::string& source, const AllowList& list, const ValidatorOptions& options = {},
                          std::shared_ptr<const ast::Module>* parsed = nullptr);

// Checks an already-parsed module.
ValidationResult validate_module(const ast::Module& module, const AllowList& list,
                                 const ValidatorOptions& options = {});

}  // namespace cordon
