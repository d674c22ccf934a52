#include "cordon/parser.hpp"

#include <cstdlib>
#include <initializer_list>
#include <set>

#include "cordon/lexer.hpp"

namespace cordon {

using namespace ast;

namespace {

class Parser {
 public:
  Parser(std::vector<Token> tokens, int max_depth, int base_depth = 0)
      : tokens_(std::move(tokens)), max_depth_(max_depth), depth_(base_depth) {}

  std::shared_ptr<const Module> parse_module() {
    auto mod = std::make_shared<Module>();
    while (!at(TokenKind::end_of_input)) {
      if (at(TokenKind::newline)) {
        advance();
        continue;
      }
      parse_statement(mod->body);
    }
    return mod;
  }

  // Entry point for the expression inside an f-string replacement field.
  ExprPtr parse_embedded_expression() {
    ExprPtr e = parse_testlist();
    while (at(TokenKind::newline)) advance();
    if (!at(TokenKind::end_of_input)) fail("f-string: invalid syntax");
    return e;
  }

 private:
  // Scoped nesting counter. Each instance accounts for one level of tree
  // depth; operator chains add one level per operator via step().
  class Nest {
   public:
    explicit Nest(Parser& p) : p_(p) { step(); }
    ~Nest() { p_.depth_ -= added_; }
    Nest(const Nest&) = delete;
    Nest& operator=(const Nest&) = delete;

    void step() {
      if (++p_.depth_ > p_.max_depth_) {
        --p_.depth_;
        p_.fail("too many nested expressions or blocks (limit " + std::to_string(p_.max_depth_) + ")");
      }
      ++added_;
    }

   private:
    Parser& p_;
    int added_{0};
  };

  // -- token helpers --------------------------------------------------------

  const Token& peek(size_t k = 0) const {
    const size_t i = pos_ + k;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
  }
  bool at(TokenKind kind) const { return peek().kind == kind; }
  bool at_op(const char* op) const { return peek().kind == TokenKind::op && peek().text == op; }
  bool at_keyword(const char* word) const { return peek().kind == TokenKind::name && peek().text == word; }
  const Token& advance() {
    const Token& t = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return t;
  }
  bool accept_op(const char* op) {
    if (!at_op(op)) return false;
    advance();
    return true;
  }
  bool accept_keyword(const char* word) {
    if (!at_keyword(word)) return false;
    advance();
    return true;
  }
  void expect_op(const char* op) {
    if (!accept_op(op)) fail(std::string("expected '") + op + "'");
  }
  void expect_keyword(const char* word) {
    if (!accept_keyword(word)) fail(std::string("expected '") + word + "'");
  }

  [[noreturn]] void fail(const std::string& message) const {
    const Token& t = peek();
    if (t.kind == TokenKind::end_of_input && !t.text.empty()) throw SyntaxError(t.text, t.line, t.column);
    throw SyntaxError(message, t.line, t.column);
  }
  [[noreturn]] void fail_at(const std::string& message, int line, int column) const {
    throw SyntaxError(message, line, column);
  }

  std::string identifier() {
    const Token& t = peek();
    if (t.kind != TokenKind::name || is_keyword(t.text)) fail("expected a name");
    return advance().text;
  }

  template <typename T>
  std::unique_ptr<T> node(const Token& at_token) {
    auto n = std::make_unique<T>();
    n->line = at_token.line;
    n->column = at_token.column;
    return n;
  }

  ExprPtr expr_node(ExprKind kind, const Token& t) {
    auto e = node<Expr>(t);
    e->kind = kind;
    return e;
  }

  StmtPtr stmt_node(StmtKind kind, const Token& t) {
    auto s = node<Stmt>(t);
    s->kind = kind;
    return s;
  }

  // -- statements -----------------------------------------------------------

  void parse_statement(Block& out) {
    const Token& t = peek();
    if (t.kind == TokenKind::indent) fail("unexpected indent");
    if (t.kind == TokenKind::dedent) fail("unexpected dedent");
    if (t.kind == TokenKind::op && t.text == "@") fail("decorators are not supported");
    if (t.kind == TokenKind::name) {
      if (t.text == "if") return out.push_back(parse_if());
      if (t.text == "while") return out.push_back(parse_while());
      if (t.text == "for") return out.push_back(parse_for());
      if (t.text == "def") return out.push_back(parse_def());
      if (t.text == "with") return out.push_back(parse_with());
      if (t.text == "try") return out.push_back(parse_try());
      if (t.text == "class") fail("class definitions are not supported");
      if (t.text == "async") fail("async code is not supported");
    }
    parse_simple_statements(out);
  }

  void parse_simple_statements(Block& out) {
    out.push_back(parse_small_statement());
    while (accept_op(";")) {
      if (at(TokenKind::newline) || at(TokenKind::end_of_input)) break;
      out.push_back(parse_small_statement());
    }
    if (at(TokenKind::end_of_input)) return;
    if (!at(TokenKind::newline)) fail("invalid syntax");
    advance();
  }

  bool at_statement_end() const {
    return at(TokenKind::newline) || at(TokenKind::end_of_input) || at_op(";");
  }

  StmtPtr parse_small_statement() {
    const Token& t = peek();
    if (t.kind == TokenKind::name) {
      if (t.text == "pass") {
        advance();
        return stmt_node(StmtKind::pass, t);
      }
      if (t.text == "break") {
        advance();
        return stmt_node(StmtKind::break_, t);
      }
      if (t.text == "continue") {
        advance();
        return stmt_node(StmtKind::continue_, t);
      }
      if (t.text == "return") {
        advance();
        auto s = stmt_node(StmtKind::return_, t);
        if (!at_statement_end()) s->value = parse_testlist();
        return s;
      }
      if (t.text == "raise") {
        advance();
        auto s = stmt_node(StmtKind::raise, t);
        if (!at_statement_end()) s->value = parse_expression();
        if (at_keyword("from")) fail("'raise ... from' is not supported");
        return s;
      }
      if (t.text == "assert") {
        advance();
        auto s = stmt_node(StmtKind::assert_, t);
        s->test = parse_expression();
        if (accept_op(",")) s->value = parse_expression();
        return s;
      }
      if (t.text == "del") {
        advance();
        auto s = stmt_node(StmtKind::del, t);
        do {
          if (at_statement_end()) break;
          ExprPtr target = parse_bitor();
          check_target(*target, "delete");
          s->targets.push_back(std::move(target));
        } while (accept_op(","));
        if (s->targets.empty()) fail("invalid syntax");
        return s;
      }
      if (t.text == "import") return parse_import();
      if (t.text == "from") return parse_from_import();
      if (t.text == "global" || t.text == "nonlocal") fail("'" + t.text + "' declarations are not supported");
      if (t.text == "yield" || t.text == "await") fail("'" + t.text + "' is not supported");
    }
    return parse_expression_statement();
  }

  std::string parse_dotted_name() {
    std::string name = identifier();
    while (accept_op(".")) name += "." + identifier();
    return name;
  }

  StmtPtr parse_import() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::import, t);
    do {
      ImportAlias alias;
      alias.line = peek().line;
      alias.column = peek().column;
      alias.name = parse_dotted_name();
      if (accept_keyword("as")) alias.as_name = identifier();
      s->names.push_back(std::move(alias));
    } while (accept_op(","));
    return s;
  }

  StmtPtr parse_from_import() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::import_from, t);
    if (at_op(".")) fail("relative imports are not supported");
    s->module = parse_dotted_name();
    expect_keyword("import");
    if (at_op("*")) fail("wildcard imports are not supported");
    const bool parenthesized = accept_op("(");
    do {
      if (parenthesized && at_op(")")) break;
      ImportAlias alias;
      alias.line = peek().line;
      alias.column = peek().column;
      alias.name = identifier();
      if (accept_keyword("as")) alias.as_name = identifier();
      s->names.push_back(std::move(alias));
    } while (accept_op(","));
    if (parenthesized) expect_op(")");
    if (s->names.empty()) fail("expected a name to import");
    return s;
  }

  StmtPtr parse_expression_statement() {
    const Token& t = peek();
    ExprPtr first = parse_testlist();

    // Annotated assignment: the annotation is parsed and dropped.
    if (at_op(":")) {
      if (first->kind != ExprKind::name && first->kind != ExprKind::attribute &&
          first->kind != ExprKind::subscript) {
        fail("illegal target for annotation");
      }
      advance();
      parse_expression();
      if (!accept_op("=")) return stmt_node(StmtKind::pass, t);
      auto s = stmt_node(StmtKind::assign, t);
      s->targets.push_back(std::move(first));
      s->value = parse_testlist();
      return s;
    }

    static const std::set<std::string> kAugOps = {"+=", "-=", "*=", "/=", "//=", "%=", "**=",
                                                  "&=", "|=", "^=", "<<=", ">>="};
    if (peek().kind == TokenKind::op && kAugOps.count(peek().text) != 0) {
      if (first->kind != ExprKind::name && first->kind != ExprKind::attribute &&
          first->kind != ExprKind::subscript) {
        fail_at("illegal expression for augmented assignment", first->line, first->column);
      }
      auto s = stmt_node(StmtKind::aug_assign, t);
      const std::string op = advance().text;
      s->op = op.substr(0, op.size() - 1);
      s->targets.push_back(std::move(first));
      s->value = parse_testlist();
      return s;
    }

    if (at_op("=")) {
      auto s = stmt_node(StmtKind::assign, t);
      check_target(*first, "assign to");
      s->targets.push_back(std::move(first));
      while (accept_op("=")) {
        ExprPtr next = parse_testlist();
        if (at_op("=")) {
          check_target(*next, "assign to");
          s->targets.push_back(std::move(next));
        } else {
          s->value = std::move(next);
        }
      }
      return s;
    }

    auto s = stmt_node(StmtKind::expr, t);
    s->value = std::move(first);
    return s;
  }

  void check_target(const Expr& e, const char* verb) const {
    switch (e.kind) {
      case ExprKind::name:
      case ExprKind::attribute:
      case ExprKind::subscript:
        return;
      case ExprKind::tuple:
      case ExprKind::list:
        for (const auto& item : e.items) check_target(*item, verb);
        return;
      case ExprKind::constant:
        fail_at(std::string("cannot ") + verb + " literal", e.line, e.column);
      case ExprKind::call:
        fail_at(std::string("cannot ") + verb + " function call", e.line, e.column);
      default:
        fail_at(std::string("cannot ") + verb + " expression", e.line, e.column);
    }
  }

  void parse_block(Block& out) {
    expect_op(":");
    Nest nest(*this);
    if (!at(TokenKind::newline)) {
      parse_simple_statements(out);
      return;
    }
    advance();
    if (!at(TokenKind::indent)) fail("expected an indented block");
    advance();
    while (!at(TokenKind::dedent) && !at(TokenKind::end_of_input)) {
      if (at(TokenKind::newline)) {
        advance();
        continue;
      }
      parse_statement(out);
    }
    if (at(TokenKind::dedent)) advance();
  }

  StmtPtr parse_if() {
    const Token& t = advance();
    Nest nest(*this);
    auto s = stmt_node(StmtKind::if_, t);
    s->test = parse_expression();
    parse_block(s->body);
    if (at_keyword("elif")) {
      s->orelse.push_back(parse_if());
    } else if (accept_keyword("else")) {
      parse_block(s->orelse);
    }
    return s;
  }

  StmtPtr parse_while() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::while_, t);
    s->test = parse_expression();
    parse_block(s->body);
    if (accept_keyword("else")) parse_block(s->orelse);
    return s;
  }

  StmtPtr parse_for() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::for_, t);
    s->target = parse_target_list();
    expect_keyword("in");
    s->iter = parse_testlist();
    parse_block(s->body);
    if (accept_keyword("else")) parse_block(s->orelse);
    return s;
  }

  std::vector<Param> parse_params(const char* terminator) {
    std::vector<Param> params;
    std::set<std::string> seen;
    bool saw_default = false;
    while (!at_op(terminator)) {
      if (at_op("*") || at_op("**") || at_op("/")) fail("variadic and positional-only parameters are not supported");
      const Token& pt = peek();
      Param p;
      p.name = identifier();
      if (!seen.insert(p.name).second) fail_at("duplicate argument '" + p.name + "' in function definition", pt.line, pt.column);
      // Annotations only make sense on def parameters; lambda uses ':' as terminator.
      if (std::string(terminator) == ")" && accept_op(":")) parse_expression();
      if (accept_op("=")) {
        p.default_value = parse_expression();
        saw_default = true;
      } else if (saw_default) {
        fail_at("non-default argument follows default argument", pt.line, pt.column);
      }
      params.push_back(std::move(p));
      if (!accept_op(",")) break;
    }
    return params;
  }

  StmtPtr parse_def() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::function_def, t);
    s->name = identifier();
    expect_op("(");
    s->params = parse_params(")");
    expect_op(")");
    if (accept_op("->")) parse_expression();
    parse_block(s->body);
    return s;
  }

  StmtPtr parse_with() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::with, t);
    s->value = parse_expression();
    if (accept_keyword("as")) {
      s->target = parse_bitor();
      check_target(*s->target, "assign to");
    }
    if (at_op(",")) fail("multiple context managers in one 'with' are not supported");
    parse_block(s->body);
    return s;
  }

  StmtPtr parse_try() {
    const Token& t = advance();
    auto s = stmt_node(StmtKind::try_, t);
    parse_block(s->body);
    while (at_keyword("except")) {
      const Token& ht = advance();
      ExceptHandler h;
      h.line = ht.line;
      h.column = ht.column;
      if (!at_op(":")) {
        h.type = parse_expression();
        if (accept_keyword("as")) h.name = identifier();
      }
      parse_block(h.body);
      s->handlers.push_back(std::move(h));
    }
    if (!s->handlers.empty() && accept_keyword("else")) parse_block(s->orelse);
    if (accept_keyword("finally")) parse_block(s->finalbody);
    if (s->handlers.empty() && s->finalbody.empty()) fail("expected 'except' or 'finally' block");
    return s;
  }

  // -- expressions ----------------------------------------------------------

  bool at_testlist_end() const {
    if (at(TokenKind::newline) || at(TokenKind::end_of_input)) return true;
    if (peek().kind != TokenKind::op) return at_keyword("in");
    static const std::set<std::string> kStops = {"=", ")", "]", "}", ";", ":", "+=", "-=", "*=", "/=",
                                                 "//=", "%=", "**=", "&=", "|=", "^=", "<<=", ">>="};
    return kStops.count(peek().text) != 0;
  }

  // expression (',' expression)* [',']; a bare tuple when a comma appears.
  ExprPtr parse_testlist() {
    const Token& t = peek();
    ExprPtr first = parse_expression();
    if (!at_op(",")) return first;
    auto tuple = expr_node(ExprKind::tuple, t);
    tuple->items.push_back(std::move(first));
    while (accept_op(",")) {
      if (at_testlist_end()) break;
      tuple->items.push_back(parse_expression());
    }
    return tuple;
  }

  // Loop targets stop before 'in', so they are parsed below comparisons.
  ExprPtr parse_target_list() {
    const Token& t = peek();
    ExprPtr first = parse_bitor();
    if (!at_op(",")) {
      check_target(*first, "assign to");
      return first;
    }
    auto tuple = expr_node(ExprKind::tuple, t);
    tuple->items.push_back(std::move(first));
    while (accept_op(",")) {
      if (at_keyword("in")) break;
      tuple->items.push_back(parse_bitor());
    }
    check_target(*tuple, "assign to");
    return tuple;
  }

  ExprPtr parse_expression() {
    Nest nest(*this);
    if (at_keyword("lambda")) return parse_lambda();
    const Token& t = peek();
    ExprPtr body = parse_or();
    if (!at_keyword("if")) return body;
    advance();
    auto e = expr_node(ExprKind::conditional, t);
    e->b = std::move(body);
    e->a = parse_or();
    expect_keyword("else");
    e->c = parse_expression();
    return e;
  }

  ExprPtr parse_lambda() {
    const Token& t = advance();
    auto e = expr_node(ExprKind::lambda, t);
    e->params = parse_params(":");
    expect_op(":");
    e->a = parse_expression();
    return e;
  }

  ExprPtr parse_or() {
    const Token& t = peek();
    ExprPtr first = parse_and();
    if (!at_keyword("or")) return first;
    auto e = expr_node(ExprKind::bool_op, t);
    e->op = "or";
    e->items.push_back(std::move(first));
    while (accept_keyword("or")) e->items.push_back(parse_and());
    return e;
  }

  ExprPtr parse_and() {
    const Token& t = peek();
    ExprPtr first = parse_not();
    if (!at_keyword("and")) return first;
    auto e = expr_node(ExprKind::bool_op, t);
    e->op = "and";
    e->items.push_back(std::move(first));
    while (accept_keyword("and")) e->items.push_back(parse_not());
    return e;
  }

  ExprPtr parse_not() {
    if (!at_keyword("not")) return parse_comparison();
    const Token& t = advance();
    Nest nest(*this);
    auto e = expr_node(ExprKind::unary, t);
    e->op = "not";
    e->a = parse_not();
    return e;
  }

  bool accept_comparison_op(std::string& op) {
    const Token& t = peek();
    if (t.kind == TokenKind::op) {
      static const std::set<std::string> kOps = {"<", ">", "==", ">=", "<=", "!="};
      if (kOps.count(t.text) == 0) return false;
      op = advance().text;
      return true;
    }
    if (t.kind != TokenKind::name) return false;
    if (t.text == "in") {
      advance();
      op = "in";
      return true;
    }
    if (t.text == "not" && peek(1).kind == TokenKind::name && peek(1).text == "in") {
      advance();
      advance();
      op = "not in";
      return true;
    }
    if (t.text == "is") {
      advance();
      op = accept_keyword("not") ? "is not" : "is";
      return true;
    }
    return false;
  }

  ExprPtr parse_comparison() {
    const Token& t = peek();
    ExprPtr left = parse_bitor();
    std::string op;
    if (!accept_comparison_op(op)) return left;
    auto e = expr_node(ExprKind::compare, t);
    e->a = std::move(left);
    do {
      e->ops.push_back(op);
      e->items.push_back(parse_bitor());
    } while (accept_comparison_op(op));
    return e;
  }

  // Left-associative binary level. Each operator adds a level of tree depth.
  template <typename Next>
  ExprPtr parse_binary_level(std::initializer_list<const char*> ops, Next next) {
    Nest chain(*this);
    ExprPtr left = (this->*next)();
    while (peek().kind == TokenKind::op) {
      const char* matched = nullptr;
      for (const char* op : ops) {
        if (peek().text == op) matched = op;
      }
      if (matched == nullptr) break;
      const Token& t = advance();
      chain.step();
      auto e = expr_node(ExprKind::binary, t);
      e->line = left->line;
      e->column = left->column;
      e->op = matched;
      e->a = std::move(left);
      e->b = (this->*next)();
      left = std::move(e);
    }
    return left;
  }

  ExprPtr parse_bitor() { return parse_binary_level({"|"}, &Parser::parse_bitxor); }
  ExprPtr parse_bitxor() { return parse_binary_level({"^"}, &Parser::parse_bitand); }
  ExprPtr parse_bitand() { return parse_binary_level({"&"}, &Parser::parse_shift); }
  ExprPtr parse_shift() { return parse_binary_level({"<<", ">>"}, &Parser::parse_arith); }
  ExprPtr parse_arith() { return parse_binary_level({"+", "-"}, &Parser::parse_term); }
  ExprPtr parse_term() { return parse_binary_level({"*", "/", "//", "%", "@"}, &Parser::parse_factor); }

  ExprPtr parse_factor() {
    if (at_op("-") || at_op("+") || at_op("~")) {
      const Token& t = advance();
      Nest nest(*this);
      auto e = expr_node(ExprKind::unary, t);
      e->op = t.text;
      e->a = parse_factor();
      return e;
    }
    return parse_power();
  }

  ExprPtr parse_power() {
    ExprPtr base = parse_primary();
    if (!at_op("**")) return base;
    const Token& t = advance();
    Nest nest(*this);
    auto e = expr_node(ExprKind::binary, t);
    e->line = base->line;
    e->column = base->column;
    e->op = "**";
    e->a = std::move(base);
    e->b = parse_factor();
    return e;
  }

  ExprPtr parse_primary() {
    Nest chain(*this);
    ExprPtr e = parse_atom();
    while (true) {
      if (at_op("(")) {
        const Token& t = advance();
        chain.step();
        auto call = expr_node(ExprKind::call, t);
        call->line = e->line;
        call->column = e->column;
        call->a = std::move(e);
        parse_call_arguments(*call);
        e = std::move(call);
      } else if (at_op("[")) {
        const Token& t = advance();
        chain.step();
        auto sub = expr_node(ExprKind::subscript, t);
        sub->line = e->line;
        sub->column = e->column;
        sub->a = std::move(e);
        sub->b = parse_subscript_list();
        expect_op("]");
        e = std::move(sub);
      } else if (at_op(".")) {
        advance();
        chain.step();
        const Token& name_token = peek();
        auto attr = expr_node(ExprKind::attribute, name_token);
        attr->name = identifier();
        attr->a = std::move(e);
        e = std::move(attr);
      } else {
        break;
      }
    }
    return e;
  }

  void parse_call_arguments(Expr& call) {
    std::set<std::string> keyword_names;
    while (!at_op(")")) {
      if (at_op("*") || at_op("**")) fail("argument unpacking is not supported");
      if (peek().kind == TokenKind::name && !is_keyword(peek().text) && peek(1).kind == TokenKind::op &&
          peek(1).text == "=") {
        const Token& kt = advance();
        advance();
        if (!keyword_names.insert(kt.text).second) {
          fail_at("keyword argument repeated: " + kt.text, kt.line, kt.column);
        }
        call.keywords.push_back(Keyword{kt.text, parse_expression()});
      } else {
        if (!call.keywords.empty()) fail("positional argument follows keyword argument");
        const Token& t = peek();
        ExprPtr arg = parse_expression();
        if (at_keyword("for")) {
          if (!call.items.empty()) fail("generator expression must be parenthesized");
          auto comp = expr_node(ExprKind::list_comp, t);
          comp->a = std::move(arg);
          parse_comprehension_clauses(*comp);
          call.items.push_back(std::move(comp));
          if (!at_op(")")) fail("generator expression must be parenthesized");
          break;
        }
        call.items.push_back(std::move(arg));
      }
      if (!accept_op(",")) break;
    }
    expect_op(")");
  }

  ExprPtr parse_subscript_list() {
    const Token& t = peek();
    ExprPtr first = parse_subscript_item();
    if (!at_op(",")) return first;
    auto tuple = expr_node(ExprKind::tuple, t);
    tuple->items.push_back(std::move(first));
    while (accept_op(",")) {
      if (at_op("]")) break;
      tuple->items.push_back(parse_subscript_item());
    }
    return tuple;
  }

  ExprPtr parse_subscript_item() {
    const Token& t = peek();
    ExprPtr lower;
    if (!at_op(":")) {
      lower = parse_expression();
      if (!at_op(":")) return lower;
    }
    advance();
    auto s = expr_node(ExprKind::slice, t);
    s->a = std::move(lower);
    if (!at_op(":") && !at_op("]") && !at_op(",")) s->b = parse_expression();
    if (accept_op(":")) {
      if (!at_op("]") && !at_op(",")) s->c = parse_expression();
    }
    return s;
  }

  void parse_comprehension_clauses(Expr& comp) {
    while (at_keyword("for")) {
      advance();
      Comprehension gen;
      gen.target = parse_target_list();
      expect_keyword("in");
      gen.iter = parse_or();
      while (at_keyword("if")) {
        advance();
        gen.conditions.push_back(parse_or());
      }
      comp.generators.push_back(std::move(gen));
    }
    if (at_keyword("async")) fail("async comprehensions are not supported");
  }

  ExprPtr parse_atom() {
    const Token& t = peek();
    switch (t.kind) {
      case TokenKind::name: {
        if (t.text == "True" || t.text == "False") {
          advance();
          auto e = expr_node(ExprKind::constant, t);
          e->constant = (t.text == "True");
          return e;
        }
        if (t.text == "None") {
          advance();
          return expr_node(ExprKind::constant, t);
        }
        if (t.text == "yield" || t.text == "await") fail("'" + t.text + "' is not supported");
        if (is_keyword(t.text)) fail("invalid syntax");
        advance();
        auto e = expr_node(ExprKind::name, t);
        e->name = t.text;
        return e;
      }
      case TokenKind::integer: {
        advance();
        auto e = expr_node(ExprKind::constant, t);
        e->constant = static_cast<std::int64_t>(std::strtoll(t.text.c_str(), nullptr, 10));
        return e;
      }
      case TokenKind::floating: {
        advance();
        auto e = expr_node(ExprKind::constant, t);
        e->constant = std::strtod(t.text.c_str(), nullptr);
        return e;
      }
      case TokenKind::string:
      case TokenKind::fstring:
        return parse_strings();
      case TokenKind::op:
        if (t.text == "(") return parse_paren();
        if (t.text == "[") return parse_list();
        if (t.text == "{") return parse_dict();
        break;
      case TokenKind::newline:
      case TokenKind::end_of_input:
        fail("unexpected end of line");
      default:
        break;
    }
    fail("invalid syntax");
  }

  ExprPtr parse_paren() {
    const Token& t = advance();
    if (accept_op(")")) return expr_node(ExprKind::tuple, t);
    ExprPtr first = parse_expression();
    if (at_keyword("for")) {
      auto comp = expr_node(ExprKind::list_comp, t);
      comp->a = std::move(first);
      parse_comprehension_clauses(*comp);
      expect_op(")");
      return comp;
    }
    if (!at_op(",")) {
      expect_op(")");
      return first;
    }
    auto tuple = expr_node(ExprKind::tuple, t);
    tuple->items.push_back(std::move(first));
    while (accept_op(",")) {
      if (at_op(")")) break;
      tuple->items.push_back(parse_expression());
    }
    expect_op(")");
    return tuple;
  }

  ExprPtr parse_list() {
    const Token& t = advance();
    auto list = expr_node(ExprKind::list, t);
    if (accept_op("]")) return list;
    ExprPtr first = parse_expression();
    if (at_keyword("for")) {
      auto comp = expr_node(ExprKind::list_comp, t);
      comp->a = std::move(first);
      parse_comprehension_clauses(*comp);
      expect_op("]");
      return comp;
    }
    list->items.push_back(std::move(first));
    while (accept_op(",")) {
      if (at_op("]")) break;
      list->items.push_back(parse_expression());
    }
    expect_op("]");
    return list;
  }

  ExprPtr parse_dict() {
    const Token& t = advance();
    auto dict = expr_node(ExprKind::dict, t);
    if (accept_op("}")) return dict;
    if (at_op("**")) fail("dict unpacking is not supported");
    ExprPtr key = parse_expression();
    if (!at_op(":")) fail("set literals are not supported");
    advance();
    ExprPtr value = parse_expression();
    if (at_keyword("for")) {
      auto comp = expr_node(ExprKind::dict_comp, t);
      comp->a = std::move(key);
      comp->b = std::move(value);
      parse_comprehension_clauses(*comp);
      expect_op("}");
      return comp;
    }
    dict->items.push_back(std::move(key));
    dict->values.push_back(std::move(value));
    while (accept_op(",")) {
      if (at_op("}")) break;
      if (at_op("**")) fail("dict unpacking is not supported");
      dict->items.push_back(parse_expression());
      expect_op(":");
      dict->values.push_back(parse_expression());
    }
    expect_op("}");
    return dict;
  }

  // Adjacent literals concatenate; any f-string among them makes the whole
  // run an f-string.
  ExprPtr parse_strings() {
    const Token& first = peek();
    std::vector<FStringPart> parts;
    bool formatted = false;
    while (at(TokenKind::string) || at(TokenKind::fstring)) {
      const Token& t = advance();
      if (t.kind == TokenKind::string) {
        FStringPart p;
        p.literal = t.text;
        parts.push_back(std::move(p));
      } else {
        formatted = true;
        split_fstring(t, parts);
      }
    }
    if (!formatted) {
      std::string joined;
      for (const auto& p : parts) joined += p.literal;
      auto e = expr_node(ExprKind::constant, first);
      e->constant = std::move(joined);
      return e;
    }
    auto e = expr_node(ExprKind::fstring, first);
    e->parts = std::move(parts);
    return e;
  }

  void split_fstring(const Token& t, std::vector<FStringPart>& parts) {
    const bool raw = !t.text.empty() && t.text[0] == 'r';
    const std::string body = t.text.substr(1);
    std::string pending;
    auto flush = [&]() {
      if (pending.empty()) return;
      FStringPart p;
      p.literal = raw ? pending : decode_escapes(pending, t.line, t.column);
      parts.push_back(std::move(p));
      pending.clear();
    };

    size_t i = 0;
    while (i < body.size()) {
      const char c = body[i];
      if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
        pending += '{';
        i += 2;
        continue;
      }
      if (c == '}') {
        if (i + 1 < body.size() && body[i + 1] == '}') {
          pending += '}';
          i += 2;
          continue;
        }
        fail_at("f-string: single '}' is not allowed", t.line, t.column);
      }
      if (c != '{') {
        pending += c;
        ++i;
        continue;
      }
      flush();
      ++i;
      // Expression text runs to the first top-level '}', '!' (not "!=") or ':'.
      const size_t start = i;
      int nesting = 0;
      char quote = 0;
      for (; i < body.size(); ++i) {
        const char ch = body[i];
        if (quote != 0) {
          if (ch == quote) quote = 0;
          continue;
        }
        if (ch == '\'' || ch == '"') {
          quote = ch;
        } else if (ch == '(' || ch == '[' || ch == '{') {
          ++nesting;
        } else if (ch == ')' || ch == ']' || ch == '}') {
          if (nesting == 0) break;
          --nesting;
        } else if (nesting == 0 && ch == '!' && !(i + 1 < body.size() && body[i + 1] == '=')) {
          break;
        } else if (nesting == 0 && ch == ':') {
          break;
        }
      }
      if (i >= body.size()) fail_at("f-string: expecting '}'", t.line, t.column);

      FStringPart part;
      const std::string text = body.substr(start, i - start);
      if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        fail_at("f-string: empty expression not allowed", t.line, t.column);
      }
      part.expr = parse_fstring_expression(text, t);

      if (body[i] == '!') {
        if (i + 1 >= body.size() || (body[i + 1] != 'r' && body[i + 1] != 's' && body[i + 1] != 'a')) {
          fail_at("f-string: invalid conversion character", t.line, t.column);
        }
        part.conversion = body[i + 1];
        i += 2;
        if (i >= body.size() || (body[i] != ':' && body[i] != '}')) {
          fail_at("f-string: expecting '}'", t.line, t.column);
        }
      }
      if (body[i] == ':') {
        ++i;
        const size_t spec_start = i;
        while (i < body.size() && body[i] != '}') {
          if (body[i] == '{') fail_at("f-string: nested format specifications are not supported", t.line, t.column);
          ++i;
        }
        if (i >= body.size()) fail_at("f-string: expecting '}'", t.line, t.column);
        part.format_spec = body.substr(spec_start, i - spec_start);
      }
      ++i;  // closing '}'
      parts.push_back(std::move(part));
    }
    flush();
  }

  ExprPtr parse_fstring_expression(const std::string& text, const Token& at_token) {
    // Parenthesized so that whitespace and newlines inside the field are
    // insignificant, exactly as inside any other bracket.
    std::vector<Token> tokens;
    try {
      tokens = tokenize("(" + text + ")");
    } catch (const SyntaxError& e) {
      fail_at(std::string("f-string: ") + e.what(), at_token.line, at_token.column);
    }
    for (auto& tok : tokens) {
      tok.column = at_token.column;
      tok.line = at_token.line + tok.line - 1;
    }
    Parser sub(std::move(tokens), max_depth_, depth_);
    return sub.parse_embedded_expression();
  }

  std::vector<Token> tokens_;
  size_t pos_{0};
  int max_depth_;
  int depth_;
};

}  // namespace

std::string ast::dotted_name(const Expr& expr) {
  if (expr.kind == ExprKind::name) return expr.name;
  if (expr.kind == ExprKind::attribute && expr.a) {
    std::string base = dotted_name(*expr.a);
    if (base.empty()) return "";
    return base + "." + expr.name;
  }
  return "";
}

std::string ParseFailure::describe() const {
  return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message;
}

ParseResult parse_program(const std::string& source, int max_depth) {
  ParseResult result;
  try {
    Parser parser(tokenize(source), max_depth);
    result.module = parser.parse_module();
  } catch (const SyntaxError& e) {
    result.module.reset();
    result.error = ParseFailure{e.what(), e.line(), e.column()};
  }
  return result;
}

}  // namespace cordon
