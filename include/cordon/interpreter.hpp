#pragma once

// cordon/interpreter.hpp: Tree-walking evaluator for parsed programs.
//
// CANCELLATION:
//   check_interrupts() is called before every statement, on every loop
//   iteration, on every call, and inside native per-element loops. It throws
//   ExecutionCancelled as soon as the stop flag or the caller's token is set,
//   so a worker abandoned after a timeout stops within one polling interval.
//
// CAPABILITIES:
//   The interpreter resolves names through local scopes, the global scope and
//   finally the environment's builtin scope. Imports go only through the
//   environment's ModuleResolver; attribute access only through
//   get_attribute(), which re-applies the blocked-attribute gate.
//
// THREADING:
//   An Interpreter is confined to the thread that runs it. The only state it
//   shares is the read-only AllowList and the atomic stop flag.

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "cordon/ast.hpp"
#include "cordon/environment.hpp"
#include "cordon/types.hpp"
#include "cordon/value.hpp"

namespace cordon {

struct ExecutionControl {
  // Raised by the executor when the deadline passes.
  std::shared_ptr<std::atomic<bool>> stop;
  std::shared_ptr<CancellationToken> token;
};

class Interpreter {
 public:
  Interpreter(ExecutionEnvironment env, ExecutionControl control);
  ~Interpreter();

  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  /**
   * @brief Executes a module's top-level statements in the global scope.
   * @throws ScriptError for an uncaught script-level error;
   *         ExecutionCancelled, ResourceLimitExceeded, CapabilityViolation
   *         as described in value.hpp.
   */
  void run(std::shared_ptr<const ast::Module> module);

  void set_global(const std::string& name, Value value);
  const Value* find_global(const std::string& name) const;
  // Entry of this environment's builtin scope, or null when not bound.
  const Value* find_builtin(const std::string& name) const;

  // -- services for native functions --------------------------------------

  Value call(const Value& callee, CallArgs& args, int line = 0);
  Value call1(const Value& callee, Value arg);
  Value get_attribute(const Value& object, const std::string& name, int line = 0);

  void check_interrupts();
  // Throws ResourceLimitExceeded when n exceeds max_collection_size.
  void check_size(std::size_t n, const char* what = "collection");
  void write_output(const std::string& text);
  const std::string& output() const { return output_; }
  bool output_truncated() const { return output_truncated_; }

  std::shared_ptr<ListObject> new_list(std::vector<Value> items = {});
  std::shared_ptr<DictObject> new_dict();

  // Calls fn for each element; fn returns false to stop early. Ranges are
  // not materialized.
  void for_each(const Value& iterable, const std::function<bool(const Value&)>& fn);
  std::vector<Value> to_vector(const Value& iterable);

  Value binary_op(const std::string& op, const Value& a, const Value& b);
  Value compare_op(const std::string& op, const Value& a, const Value& b);
  Value unary_op(const std::string& op, const Value& a);
  Value get_item(const Value& object, const Value& index);

  const AllowList& allow_list() const { return *env_.allow_list; }
  const InterpreterLimits& limits() const { return env_.limits; }

 private:
  // Non-local control flow inside function bodies and loops.
  enum class Flow { normal, break_loop, continue_loop, return_value };

  Flow exec_block(const ast::Block& block, const std::shared_ptr<Scope>& scope);
  Flow exec(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  Flow exec_for(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  Flow exec_while(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  Flow exec_try(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  void exec_import(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  void exec_import_from(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  void exec_def(const ast::Stmt& stmt, const std::shared_ptr<Scope>& scope);
  void exec_del(const ast::Expr& target, const std::shared_ptr<Scope>& scope);

  Value eval(const ast::Expr& expr, const std::shared_ptr<Scope>& scope);
  Value eval_name(const ast::Expr& expr, const std::shared_ptr<Scope>& scope);
  Value eval_call(const ast::Expr& expr, const std::shared_ptr<Scope>& scope);
  Value eval_compare(const ast::Expr& expr, const std::shared_ptr<Scope>& scope);
  Value eval_fstring(const ast::Expr& expr, const std::shared_ptr<Scope>& scope);
  Value eval_comprehension(const ast::Expr& expr, const std::shared_ptr<Scope>& scope);
  void run_generators(const ast::Expr& expr, std::size_t level, const std::shared_ptr<Scope>& scope,
                      const std::function<void()>& emit);
  Value make_function(const std::string& name, const std::vector<ast::Param>& params, const ast::Block* body,
                      const ast::Expr* expression, const std::shared_ptr<Scope>& scope);
  Value call_function(const FunctionObject& fn, CallArgs& args);

  void assign(const ast::Expr& target, const Value& value, const std::shared_ptr<Scope>& scope);
  void set_item(const Value& object, const Value& index, const Value& value);
  void check_attribute(const std::string& name, int line) const;
  std::shared_ptr<Scope> new_scope(std::shared_ptr<Scope> parent);
  void track(const ObjectPtr& object);

  ExecutionEnvironment env_;
  ExecutionControl control_;
  std::shared_ptr<Scope> globals_;
  std::shared_ptr<const ast::Module> module_;
  int call_depth_{0};
  int current_line_{0};
  Value return_value_;
  // Errors being handled by an except clause, innermost last; a bare
  // `raise` re-raises the last one.
  std::vector<ScriptError> active_errors_;
  std::string output_;
  bool output_truncated_{false};
  // Everything that can participate in a reference cycle; released at teardown.
  std::vector<std::weak_ptr<Object>> heap_;
  std::vector<std::weak_ptr<Scope>> scopes_;
  std::size_t prune_at_{4096};
};

}  // namespace cordon
