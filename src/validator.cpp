#include "cordon/validator.hpp"

#include <algorithm>

namespace cordon {

namespace {

class Walker {
 public:
  explicit Walker(const AllowList& list) : list_(list) {}

  std::vector<Violation> take() {
    std::stable_sort(violations_.begin(), violations_.end(), [](const Violation& a, const Violation& b) {
      return a.line != b.line ? a.line < b.line : a.column < b.column;
    });
    return std::move(violations_);
  }

  void block(const ast::Block& body) {
    for (const auto& stmt : body) visit(*stmt);
  }

  void visit(const ast::Stmt& s) {
    switch (s.kind) {
      case ast::StmtKind::import:
        for (const auto& alias : s.names) {
          check_import(alias.name, alias.line, alias.column);
          if (!alias.as_name.empty()) check_bound_name(alias.as_name, alias.line, alias.column);
        }
        break;
      case ast::StmtKind::import_from:
        check_import(s.module, s.line, s.column);
        for (const auto& alias : s.names) {
          if (list_.is_blocked_attribute(alias.name)) {
            add(ViolationKind::blocked_attribute, alias.name, alias.line, alias.column);
          }
          if (!alias.as_name.empty()) check_bound_name(alias.as_name, alias.line, alias.column);
        }
        break;
      case ast::StmtKind::function_def:
        check_bound_name(s.name, s.line, s.column);
        params(s.params, s.line, s.column);
        block(s.body);
        break;
      case ast::StmtKind::try_:
        block(s.body);
        for (const auto& handler : s.handlers) {
          if (handler.type) expr(*handler.type);
          if (!handler.name.empty()) check_bound_name(handler.name, handler.line, handler.column);
          block(handler.body);
        }
        block(s.orelse);
        block(s.finalbody);
        break;
      default:
        if (s.value) expr(*s.value);
        if (s.test) expr(*s.test);
        if (s.target) expr(*s.target);
        if (s.iter) expr(*s.iter);
        for (const auto& target : s.targets) expr(*target);
        block(s.body);
        block(s.orelse);
        block(s.finalbody);
        break;
    }
  }

  void expr(const ast::Expr& e) {
    switch (e.kind) {
      case ast::ExprKind::name:
        check_bound_name(e.name, e.line, e.column);
        return;
      case ast::ExprKind::attribute:
        if (list_.is_blocked_attribute(e.name)) add(ViolationKind::blocked_attribute, e.name, e.line, e.column);
        break;
      case ast::ExprKind::call:
        if (check_call(*e.a)) {
          // The callee's own attribute is already reported as the call.
          if (e.a->kind == ast::ExprKind::attribute) {
            expr(*e.a->a);
          }
          for (const auto& item : e.items) expr(*item);
          for (const auto& keyword : e.keywords) expr(*keyword.value);
          return;
        }
        break;
      case ast::ExprKind::lambda:
        params(e.params, e.line, e.column);
        break;
      default:
        break;
    }
    children(e);
  }

 private:
  void children(const ast::Expr& e) {
    if (e.a) expr(*e.a);
    if (e.b) expr(*e.b);
    if (e.c) expr(*e.c);
    for (const auto& item : e.items) expr(*item);
    for (const auto& value : e.values) expr(*value);
    for (const auto& keyword : e.keywords) expr(*keyword.value);
    for (const auto& gen : e.generators) {
      expr(*gen.target);
      expr(*gen.iter);
      for (const auto& condition : gen.conditions) expr(*condition);
    }
    for (const auto& part : e.parts) {
      if (part.expr) expr(*part.expr);
    }
  }

  void params(const std::vector<ast::Param>& ps, int line, int column) {
    for (const auto& p : ps) {
      check_bound_name(p.name, line, column);
      if (p.default_value) expr(*p.default_value);
    }
  }

  void check_import(const std::string& dotted, int line, int column) {
    const std::string blocked = list_.first_blocked_prefix(dotted);
    if (!blocked.empty()) add(ViolationKind::disallowed_import, blocked, line, column);
  }

  // Bare names only trip the dunder rule. A reference to a blocked builtin
  // such as `f = open` is left to the runtime, where the name is unbound.
  void check_bound_name(const std::string& name, int line, int column) {
    if (list_.block_dunder_attributes && is_dunder(name)) {
      add(ViolationKind::blocked_attribute, name, line, column);
    }
  }

  // Returns true when the call was reported.
  bool check_call(const ast::Expr& callee) {
    if (callee.kind == ast::ExprKind::name) {
      if (list_.is_blocked_call(callee.name)) {
        add(ViolationKind::blocked_call, callee.name, callee.line, callee.column);
        return true;
      }
      return false;
    }
    if (callee.kind != ast::ExprKind::attribute) return false;

    const std::string dotted = ast::dotted_name(callee);
    if (!dotted.empty()) {
      std::size_t pos = 0;
      while (true) {
        const std::size_t dot = dotted.find('.', pos);
        const std::string prefix = dotted.substr(0, dot);
        if (list_.is_blocked_call(prefix)) {
          add(ViolationKind::blocked_call, dotted, callee.line, callee.column);
          return true;
        }
        if (dot == std::string::npos) break;
        pos = dot + 1;
      }
    }
    if (list_.is_blocked_call(callee.name)) {
      add(ViolationKind::blocked_call, dotted.empty() ? callee.name : dotted, callee.line, callee.column);
      return true;
    }
    return false;
  }

  void add(ViolationKind kind, std::string detail, int line, int column) {
    violations_.push_back(Violation{kind, std::move(detail), line, column});
  }

  const AllowList& list_;
  std::vector<Violation> violations_;
};

bool target_binds(const ast::Expr& target, const std::string& name) {
  if (target.kind == ast::ExprKind::name) return target.name == name;
  if (target.kind == ast::ExprKind::tuple || target.kind == ast::ExprKind::list) {
    return std::any_of(target.items.begin(), target.items.end(),
                       [&](const ast::ExprPtr& item) { return target_binds(*item, name); });
  }
  return false;
}

// Module-level bindings only; names bound inside a def are locals.
bool block_binds(const ast::Block& body, const std::string& name) {
  for (const auto& stmt : body) {
    const ast::Stmt& s = *stmt;
    switch (s.kind) {
      case ast::StmtKind::assign:
      case ast::StmtKind::aug_assign:
        for (const auto& target : s.targets) {
          if (target_binds(*target, name)) return true;
        }
        break;
      case ast::StmtKind::for_:
      case ast::StmtKind::with:
        if (s.target && target_binds(*s.target, name)) return true;
        break;
      case ast::StmtKind::function_def:
        if (s.name == name) return true;
        continue;
      case ast::StmtKind::import:
      case ast::StmtKind::import_from:
        for (const auto& alias : s.names) {
          if ((alias.as_name.empty() ? alias.name : alias.as_name) == name) return true;
        }
        break;
      default:
        break;
    }
    if (block_binds(s.body, name) || block_binds(s.orelse, name) || block_binds(s.finalbody, name)) return true;
    for (const auto& handler : s.handlers) {
      if (handler.name == name || block_binds(handler.body, name)) return true;
    }
  }
  return false;
}

}  // namespace

ValidationResult validate_module(const ast::Module& module, const AllowList& list, const ValidatorOptions& options) {
  ValidationResult result;
  if (module.body.empty()) {
    result.violations.push_back(Violation{ViolationKind::empty_program, "program has no statements", 1, 1});
    return result;
  }
  Walker walker(list);
  walker.block(module.body);
  result.violations = walker.take();
  if (options.require_result_assignment && !block_binds(module.body, options.result_name)) {
    result.violations.push_back(
        Violation{ViolationKind::missing_result_binding, "'" + options.result_name + "' is never assigned", 0, 0});
  }
  return result;
}

ValidationResult validate(const std::string& source, const AllowList& list, const ValidatorOptions& options,
                          std::shared_ptr<const ast::Module>* parsed) {
  ParseResult parse = parse_program(source, options.max_parse_depth);
  if (!parse.ok()) {
    ValidationResult result;
    const ParseFailure& failure = *parse.error;
    result.violations.push_back(Violation{ViolationKind::parse_error, failure.describe(), failure.line, failure.column});
    return result;
  }
  ValidationResult result = validate_module(*parse.module, list, options);
  if (parsed) *parsed = parse.module;
  return result;
}

}  // namespace cordon
