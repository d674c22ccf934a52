#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include "cordon/allow_list.hpp"
#include "cordon/classifier.hpp"
#include "cordon/config.hpp"
#include "cordon/dataset.hpp"
#include "cordon/environment.hpp"
#include "cordon/hash.hpp"
#include "cordon/jsonlite.hpp"
#include "cordon/lexer.hpp"
#include "cordon/observability.hpp"
#include "cordon/parser.hpp"
#include "cordon/runtime.hpp"
#include "cordon/types.hpp"
#include "cordon/validator.hpp"
#include "cordon/version.hpp"

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool starts_with(const std::string& s, const std::string& prefix) { return s.compare(0, prefix.size(), prefix) == 0; }
bool contains(const std::string& s, const std::string& needle) { return s.find(needle) != std::string::npos; }

std::shared_ptr<const cordon::Dataset> x_dataset() {
  return std::make_shared<const cordon::Dataset>(
      std::vector<cordon::Column>{cordon::Column::numeric("x", {1.0, 2.0, 3.0})});
}

std::shared_ptr<const cordon::Dataset> sales_dataset() {
  return std::make_shared<const cordon::Dataset>(std::vector<cordon::Column>{
      cordon::Column::text("k", {"a", "b", "a"}), cordon::Column::numeric("v", {1.0, 2.0, 3.0})});
}

cordon::ExecutionRequest make_request(const std::string& source,
                                      std::shared_ptr<const cordon::Dataset> dataset = x_dataset(),
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
  cordon::ExecutionRequest req;
  req.request_id = "test";
  req.program.source = source;
  req.dataset = std::move(dataset);
  req.timeout = timeout;
  return req;
}

const cordon::Engine& thread_engine() {
  static const cordon::Engine engine{cordon::EngineConfig{}};
  return engine;
}

cordon::ExecutionOutcome run(const std::string& source,
                             std::shared_ptr<const cordon::Dataset> dataset = x_dataset()) {
  return thread_engine().execute(make_request(source, std::move(dataset)));
}

// Payload of a successful run; fails the test otherwise.
cordon::jsonlite::Value result_of(const std::string& source,
                                  std::shared_ptr<const cordon::Dataset> dataset = x_dataset()) {
  const auto outcome = run(source, std::move(dataset));
  if (!outcome.success()) {
    std::cerr << "FAIL: expected success for:\n" << source << "\n  got: " << cordon::summarize(outcome) << "\n";
    std::exit(1);
  }
  return outcome.success()->artifact.payload;
}

cordon::jsonlite::Value J(double d) { return cordon::jsonlite::Value(d); }
cordon::jsonlite::Value J(std::int64_t i) { return cordon::jsonlite::Value(i); }
cordon::jsonlite::Value J(const char* s) { return cordon::jsonlite::Value(s); }

// ============================================================================
// Hashing & datasets
// ============================================================================

void test_blake3_known_vectors() {
  expect(cordon::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(cordon::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const auto req = cordon::request_hash("payload");
  const auto art = cordon::artifact_hash("payload");
  expect(req.size() == 64 && art.size() == 64, "digests are 64 hex chars");
  expect(req != art, "request and artifact domains must differ");
}

void test_dataset_fingerprint() {
  const auto a = x_dataset();
  const auto b = x_dataset();
  expect(a->fingerprint() == b->fingerprint(), "equal datasets share a fingerprint");

  cordon::Dataset c = *a;
  expect(c.fingerprint() == a->fingerprint(), "copy keeps the fingerprint");
  c.set_column(cordon::Column::numeric("x", {1.0, 2.0, 3.0000001}));
  expect(c.fingerprint() != a->fingerprint(), "one changed cell changes the fingerprint");
}

void test_csv_parsing() {
  const auto d = cordon::parse_csv("x,name,flag\n1,a,true\n2.5,b,false\n,c,true\n");
  expect(d.row_count() == 3 && d.col_count() == 3, "csv shape");
  expect(d.column("x")->type == cordon::ColumnType::numeric, "x inferred numeric");
  expect(d.column("name")->type == cordon::ColumnType::text, "name inferred text");
  expect(d.column("flag")->type == cordon::ColumnType::boolean, "flag inferred boolean");
  expect(d.column("x")->is_missing(2), "empty cell is missing");

  bool threw = false;
  try {
    cordon::parse_csv("a,b\n1\n");
  } catch (const cordon::DatasetError&) {
    threw = true;
  }
  expect(threw, "ragged csv must throw DatasetError");
}

// ============================================================================
// Lexer & parser
// ============================================================================

void test_lexer_indentation() {
  const auto tokens = cordon::tokenize("if x:\n    y = 1\nz = 2\n");
  int indents = 0;
  int dedents = 0;
  for (const auto& t : tokens) {
    if (t.kind == cordon::TokenKind::indent) ++indents;
    if (t.kind == cordon::TokenKind::dedent) ++dedents;
  }
  expect(indents == 1 && dedents == 1, "one indent and one dedent");
  expect(tokens.back().kind == cordon::TokenKind::end_of_input, "token stream ends with end_of_input");
}

void test_parser_errors() {
  auto r = cordon::parse_program("def f(:\n    pass\n");
  expect(!r.module && r.error.has_value(), "malformed def is a parse failure");
  expect(r.error->line == 1, "parse failure reports line 1");
  expect(starts_with(r.error->describe(), "line 1, column "), "describe() carries the position");

  expect(cordon::parse_program("class A:\n    pass\n").error.has_value(), "class is not part of the language");
  expect(cordon::parse_program("x = b'raw'\n").error.has_value(), "byte strings are rejected");
  const auto unclosed = cordon::parse_program("x = 1\nresult = (1 + 2\n");
  expect(unclosed.error.has_value(), "unterminated bracket");
  expect(unclosed.error->line == 2 && unclosed.error->column == 10, "unclosed bracket points at the opener");
  expect(contains(unclosed.error->message, "'(' was never closed"), "unclosed bracket message");

  const auto earlier = cordon::parse_program("result = [1 2\n");
  expect(earlier.error.has_value() && !contains(earlier.error->message, "never closed"),
         "a syntax error inside the bracket is reported before the unclosed bracket");
  expect(cordon::parse_program("x = 99999999999999999999\n").error.has_value(),
         "integer literal beyond 64 bits is a parse failure");
  expect(cordon::parse_program("x = [i for i in range(3)]\n").module != nullptr, "comprehension parses");
}

void test_parser_depth_bound() {
  std::string deep = "x = " + std::string(5000, '(') + "1" + std::string(5000, ')') + "\n";
  auto r = cordon::parse_program(deep);
  expect(r.error.has_value(), "excessive nesting is a parse failure, not a crash");
}

// ============================================================================
// Interpreter semantics
// ============================================================================

void test_arithmetic() {
  expect(result_of("result = 7 // 2 + 2 ** 3\n") == J(std::int64_t{11}), "int arithmetic");
  expect(result_of("result = 7 / 2\n") == J(3.5), "true division yields float");
  expect(result_of("result = -7 % 3\n") == J(std::int64_t{2}), "modulo follows the divisor sign");
  expect(result_of("a, b = 1, 2\nresult = a * 10 + b\n") == J(std::int64_t{12}), "tuple unpacking");
  expect(result_of("x = 5\nx += 2\nx *= 3\nresult = x\n") == J(std::int64_t{21}), "augmented assignment");
  expect(result_of("result = 1 < 2 < 3\n") == cordon::jsonlite::Value(true), "chained comparison");
}

void test_strings() {
  expect(result_of("n = 2\nresult = f\"{n + 1}-{'a'}\"\n") == J("3-a"), "f-string");
  expect(result_of("result = '%d-%s' % (3, 'x')\n") == J("3-x"), "percent formatting");
  expect(result_of("result = 'a,b,c'.split(',')[1].upper()\n") == J("B"), "string methods");
  expect(result_of("result = 'abc'[::-1]\n") == J("cba"), "string slicing");
}

void test_container_methods() {
  expect(result_of("v = [3, 1, 2]\nv.sort(reverse=True)\nresult = v[0] * 10 + v[2]\n") == J(std::int64_t{31}),
         "list.sort honours reverse");
  expect(result_of("d = {'a': 1, 'b': 2}\nresult = sum([v for k, v in d.items()])\n") == J(std::int64_t{3}),
         "dict.items yields pairs");
  expect(result_of("d = {'a': 1}\nresult = d.pop('zz', 7) + d.pop('a')\n") == J(std::int64_t{8}),
         "dict.pop with and without a default");
  const auto outcome = run("d = {}\nresult = d.pop('missing')\n");
  expect(outcome.failure() && starts_with(outcome.failure()->message, "KeyError: 'missing'"),
         "dict.pop of a missing key names the key: " + (outcome.failure() ? outcome.failure()->message : ""));
  expect(result_of("result = ' x '.strip().upper().center(5, '*')\n") == J("**X**"), "chained str methods");
  expect(result_of("result = 'k' in dataset\n", sales_dataset()) == cordon::jsonlite::Value(true),
         "in tests frame column names");
}

void test_functions_and_closures() {
  expect(result_of("def sq(x, p=2):\n    return x ** p\nresult = sum([sq(i) for i in range(4)])\n") ==
             J(std::int64_t{14}),
         "defaults and comprehension");
  expect(result_of("f = lambda x: x * 3\nresult = f(4)\n") == J(std::int64_t{12}), "lambda");
  expect(result_of("def outer(k):\n    def inner(v):\n        return v + k\n    return inner\n"
                   "result = outer(10)(5)\n") == J(std::int64_t{15}),
         "closure captures enclosing scope");
  expect(result_of("def f(a, b=1):\n    return a - b\nresult = f(b=3, a=10)\n") == J(std::int64_t{7}),
         "keyword arguments");
}

void test_control_flow() {
  expect(result_of("total = 0\nfor i in range(10):\n    if i == 5:\n        break\n    if i % 2:\n"
                   "        continue\n    total += i\nresult = total\n") == J(std::int64_t{6}),
         "break and continue");
  expect(result_of("i = 0\nwhile i < 3:\n    i += 1\nelse:\n    i = 100\nresult = i\n") == J(std::int64_t{100}),
         "while-else runs when the loop was not broken");
  expect(result_of("d = {'b': 1, 'a': 2}\nresult = sorted(d)[0]\n") == J("a"), "sorted dict keys");
  expect(result_of("result = {k: v for k, v in zip('ab', [1, 2])}['b']\n") == J(std::int64_t{2}),
         "dict comprehension");
}

void test_exceptions() {
  expect(result_of("try:\n    x = 1 / 0\nexcept ZeroDivisionError as e:\n    result = 'caught'\n") == J("caught"),
         "except binds the handled type");
  expect(result_of("log = []\ntry:\n    raise ValueError('bad')\nexcept Exception:\n    log.append(1)\n"
                   "finally:\n    log.append(2)\nresult = len(log)\n") == J(std::int64_t{2}),
         "finally runs after a handled error");

  const auto outcome = run("d = {}\nresult = d['missing']\n");
  const auto* f = outcome.failure();
  expect(f != nullptr, "uncaught KeyError is a runtime failure");
  expect(starts_with(f->message, "KeyError"), "message names the error type: " + f->message);
  expect(contains(f->message, "(line 2)"), "message carries the line: " + f->message);
  expect(f->code == cordon::ErrorCode::runtime_error, "runtime_error code");
}

void test_integer_overflow() {
  const auto outcome = run("result = 2 ** 200\n");
  expect(outcome.failure() && starts_with(outcome.failure()->message, "OverflowError"),
         "integer overflow raises OverflowError");
}

void test_nan_arguments_rejected() {
  auto outcome = run("import numeric\nresult = numeric.percentile(dataset['x'], numeric.nan)\n");
  expect(outcome.failure() && starts_with(outcome.failure()->message, "ValueError"),
         "NaN percentile is a ValueError");
  expect(outcome.failure()->code == cordon::ErrorCode::runtime_error, "NaN percentile is a runtime failure");

  outcome = run("import numeric\nresult = numeric.percentile(dataset['x'], [50, numeric.nan])\n");
  expect(outcome.failure() && starts_with(outcome.failure()->message, "ValueError"),
         "NaN inside a percentile list is a ValueError");

  outcome = run("import numeric\nresult = '%d' % numeric.nan\n");
  expect(outcome.failure() && starts_with(outcome.failure()->message, "OverflowError"),
         "NaN cannot be formatted as an integer");

  expect(result_of("import numeric\nresult = numeric.percentile(dataset['x'], 50)\n") == J(2.0),
         "in-range percentile still works");
}

void test_format_field_index_overflow() {
  const auto outcome = run("result = '{99999999999999999999999}'.format(1)\n");
  const auto* f = outcome.failure();
  expect(f != nullptr && starts_with(f->message, "ValueError"), "oversized field index is a ValueError");
  expect(!contains(f->message, "InternalError"), "no internal error text reaches the feedback");
  expect(f->code == cordon::ErrorCode::runtime_error, "runtime_error code");

  expect(result_of("result = '{1}-{0}'.format('a', 'b')\n") == J("b-a"), "numbered fields still work");
}

void test_missing_result() {
  const auto unbound = run("x = 1\n");
  expect(unbound.failure() && unbound.failure()->message == "missing or invalid result",
         "unbound result is a missing result");
  expect(unbound.failure()->code == cordon::ErrorCode::missing_result, "missing_result code");

  const auto wrong_shape = run("result = [1, 2]\n");
  expect(wrong_shape.failure() && wrong_shape.failure()->code == cordon::ErrorCode::missing_result,
         "a list is not a recognized result shape");
}

void test_print_capture() {
  const auto outcome = run("print('hello', 3)\nresult = 1\n");
  expect(outcome.success() != nullptr, "print does not disturb the result");
  expect(outcome.metadata().output == "hello 3\n", "print output is captured");
}

// ============================================================================
// Tabular runtime
// ============================================================================

void test_dataset_mean_scalar() {
  const auto dataset = x_dataset();
  const std::string before = dataset->fingerprint();
  const auto outcome = run("result = dataset.mean()\n", dataset);
  expect(outcome.success() != nullptr, "dataset.mean() succeeds");
  expect(outcome.success()->artifact.kind == cordon::ArtifactKind::scalar, "single-column mean is a scalar");
  expect(outcome.success()->artifact.payload == J(2.0), "mean of [1,2,3] is 2.0");
  expect(dataset->fingerprint() == before, "source dataset unchanged");
}

void test_series_operations() {
  expect(result_of("result = dataset['x'].sum()\n") == J(6.0), "series sum");
  expect(result_of("result = dataset[dataset['x'] > 1].shape[0]\n") == J(std::int64_t{2}), "boolean mask filter");
  expect(result_of("result = (dataset['x'] * 2).max()\n") == J(6.0), "series arithmetic");
  expect(result_of("result = len(df)\n") == J(std::int64_t{3}), "df alias bound");
}

void test_groupby_table() {
  const auto outcome = run("result = dataset.groupby('k')['v'].sum()\n", sales_dataset());
  expect(outcome.success() && outcome.success()->artifact.kind == cordon::ArtifactKind::table,
         "groupby result is a table");
  const auto& payload = std::get<cordon::jsonlite::Object>(outcome.success()->artifact.payload.v);
  const auto& rows = std::get<cordon::jsonlite::Array>(payload.at("rows").v);
  expect(rows.size() == 2, "two groups");
  const auto& first = std::get<cordon::jsonlite::Array>(rows[0].v);
  expect(first[0] == J("a") && first[1] == J(4.0), "group a sums to 4");
}

void test_chart_figure() {
  const auto outcome = run("import chart\nresult = chart.bar(dataset, x='k', y='v', title='Sales')\n", sales_dataset());
  expect(outcome.success() && outcome.success()->artifact.kind == cordon::ArtifactKind::figure,
         "chart.bar yields a figure");
  const auto& spec = std::get<cordon::jsonlite::Object>(outcome.success()->artifact.payload.v);
  const auto& data = std::get<cordon::jsonlite::Array>(spec.at("data").v);
  expect(!data.empty(), "figure has traces");
  const auto& trace = std::get<cordon::jsonlite::Object>(data[0].v);
  expect(cordon::jsonlite::get_string(trace, "type") == "bar", "trace type is bar");
}

void test_dataset_mutation_isolated() {
  const auto dataset = x_dataset();
  const std::string before = dataset->fingerprint();
  const auto outcome = run("dataset['x'] = dataset['x'] * 0\ndf['y'] = 1\nresult = dataset['x'].sum()\n", dataset);
  expect(outcome.success() && outcome.success()->artifact.payload == J(0.0), "program sees its own copy mutated");
  expect(dataset->fingerprint() == before, "caller dataset bit-identical after mutation");
  expect(dataset->col_count() == 1, "added column did not leak");
}

// ============================================================================
// Static validation
// ============================================================================

void test_disallowed_import_scenario() {
  cordon::AllowList list = cordon::AllowList::defaults();
  list.modules = {"numeric", "tabular"};
  const auto r = cordon::validate("import network_client\nresult = 1\n", list);
  expect(r.violations.size() == 1, "exactly one violation");
  expect(r.violations[0].kind == cordon::ViolationKind::disallowed_import, "DisallowedImport");
  expect(r.violations[0].detail == "network_client", "detail names the module");
  expect(r.violations[0].line == 1, "violation on line 1");
}

void test_dotted_import_prefix() {
  const auto list = cordon::AllowList::defaults();
  const auto r = cordon::validate("import numeric.linalg.inner\nresult = 1\n", list);
  expect(r.has(cordon::ViolationKind::disallowed_import), "unknown submodule rejected");
  expect(r.violations[0].detail == "numeric.linalg", "detail is the first non-permitted prefix");

  expect(cordon::validate("import numeric as np\nresult = np.mean([1])\n", list).ok(), "permitted import");
  expect(cordon::validate("from os import path\n", list).has(cordon::ViolationKind::disallowed_import),
         "from-import checks the module");
}

void test_blocked_calls_and_attributes() {
  const auto list = cordon::AllowList::defaults();

  auto r = cordon::validate("result = open('/etc/passwd')\n", list);
  expect(r.violations.size() == 1 && r.violations[0].kind == cordon::ViolationKind::blocked_call, "open blocked");

  r = cordon::validate("result = dataset.eval('x + 1')\n", list);
  expect(r.violations.size() == 1 && r.violations[0].kind == cordon::ViolationKind::blocked_call,
         "terminal attribute call reported once as BlockedCall");
  expect(r.violations[0].detail == "dataset.eval", "detail is the dotted callee");
  expect(r.violations[0].line == 1 && r.violations[0].column > 0, "blocked call carries its position");

  r = cordon::validate("result = eval('1')\n", list);
  expect(r.violations.size() == 1 && r.violations[0].detail == "eval", "bare callee detail is the name");

  r = cordon::validate("result = ().__class__.__bases__\n", list);
  expect(r.has(cordon::ViolationKind::blocked_attribute), "dunder attribute blocked");

  r = cordon::validate("b = __builtins__\n", list);
  expect(r.has(cordon::ViolationKind::blocked_attribute), "bare dunder name blocked");

  expect(cordon::validate("lst = [3, 1]\nlst.remove(3)\nresult = lst[0]\n", list).ok(),
         "list.remove is not a blocked call");
}

void test_violation_order_and_collection() {
  const auto r = cordon::validate("import os\nx = eval('1')\nimport socket\n", cordon::AllowList::defaults());
  expect(r.violations.size() == 3, "every violation is collected");
  expect(r.violations[0].line == 1 && r.violations[1].line == 2 && r.violations[2].line == 3, "source order");
}

void test_parse_error_and_empty_program() {
  const auto list = cordon::AllowList::defaults();
  auto r = cordon::validate("if True\n    x = 1\n", list);
  expect(r.violations.size() == 1 && r.violations[0].kind == cordon::ViolationKind::parse_error,
         "single ParseError violation");

  r = cordon::validate("# nothing but a comment\n\n", list);
  expect(r.violations.size() == 1 && r.violations[0].kind == cordon::ViolationKind::empty_program,
         "comment-only program is EmptyProgram");
}

void test_missing_result_binding_option() {
  cordon::ValidatorOptions options;
  options.require_result_assignment = true;
  const auto list = cordon::AllowList::defaults();
  expect(cordon::validate("x = 1\n", list, options).has(cordon::ViolationKind::missing_result_binding),
         "no module-level result binding");
  expect(cordon::validate("def f():\n    result = 1\nf()\n", list, options)
             .has(cordon::ViolationKind::missing_result_binding),
         "binding inside a def does not count");
  expect(cordon::validate("result = 1\n", list, options).ok(), "module-level binding satisfies the check");
  expect(cordon::validate("x = 1\n", list).ok(), "check is off by default");
}

void test_rejection_short_circuits() {
  const auto start = std::chrono::steady_clock::now();
  const auto outcome = run("import os\nwhile True:\n    pass\n");
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(outcome.rejected() != nullptr, "rejected before execution");
  expect(elapsed < std::chrono::seconds(2), "executor never reached");
}

// ============================================================================
// Capability restriction
// ============================================================================

void test_runtime_blocked_builtin() {
  const auto outcome = run("f = open\nresult = f('/etc/passwd')\n");
  expect(outcome.failure() != nullptr, "alias of a blocked builtin fails at runtime");
  expect(starts_with(outcome.failure()->message, "NameError"), "blocked builtin is simply unbound");
}

void test_resolver_rechecks() {
  auto list = std::make_shared<const cordon::AllowList>(cordon::AllowList::defaults());
  cordon::AllowListResolver resolver(list);
  auto blocked = resolver.resolve("os.path");
  expect(blocked.status == cordon::ResolveResult::Status::blocked && blocked.detail == "os", "os blocked");
  auto ok = resolver.resolve("math");
  expect(ok.status == cordon::ResolveResult::Status::ok && ok.module != nullptr, "math resolves");
  expect(resolver.resolve("math").module == ok.module, "modules are cached per environment");
}

void test_environment_builtins_filtered() {
  auto custom = cordon::AllowList::defaults();
  custom.builtins.erase("sorted");
  const auto outcome = thread_engine().execute(make_request("result = sorted([2, 1])[0]\n"));
  expect(outcome.success() != nullptr, "sorted available by default");

  const cordon::Engine narrow(cordon::EngineConfig{}, std::make_shared<const cordon::AllowList>(custom));
  const auto denied = narrow.execute(make_request("result = sorted([2, 1])[0]\n"));
  expect(denied.failure() && starts_with(denied.failure()->message, "NameError"),
         "builtin outside the list is unbound");
}

// ============================================================================
// Bounded execution
// ============================================================================

void test_timeout_thread_mode() {
  const auto start = std::chrono::steady_clock::now();
  const auto outcome =
      thread_engine().execute(make_request("while True:\n    pass\n", x_dataset(), std::chrono::milliseconds(100)));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(outcome.timed_out(), "infinite loop times out");
  expect(elapsed < std::chrono::milliseconds(2100), "timeout honoured within overhead");
}

void test_timeout_not_catchable() {
  const auto outcome = thread_engine().execute(make_request(
      "while True:\n    try:\n        x = 1\n    except Exception:\n        pass\n", x_dataset(),
      std::chrono::milliseconds(100)));
  expect(outcome.timed_out(), "script cannot swallow the timeout");
}

void test_process_mode() {
  cordon::EngineConfig config;
  config.isolation = cordon::IsolationMode::process;
  const cordon::Engine engine(config);

  const auto ok = engine.execute(make_request("result = dataset['x'].sum()\n"));
  expect(ok.success() && ok.success()->artifact.payload == J(6.0), "process mode returns the artifact");

  const auto slow = engine.execute(make_request("while True:\n    pass\n", x_dataset(), std::chrono::milliseconds(150)));
  expect(slow.timed_out(), "process mode enforces the deadline");

  const auto failing = engine.execute(make_request("result = 1 / 0\n"));
  expect(failing.failure() && starts_with(failing.failure()->message, "ZeroDivisionError"),
         "process mode carries the error message");
}

void test_recursion_limit() {
  const auto outcome = run("def f(n):\n    return f(n + 1)\nresult = f(0)\n");
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::resource_exhausted,
         "unbounded recursion hits the call depth limit");
}

void test_collection_limit() {
  const auto outcome = run("result = [0] * 1000000000\n");
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::resource_exhausted,
         "oversized list hits the collection limit");
}

// User plus system CPU seconds consumed by this process.
double process_cpu_seconds() {
  rusage usage{};
  getrusage(RUSAGE_SELF, &usage);
  return static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
         static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
}

void test_native_loops_stop_after_timeout() {
  expect(result_of("result = len('' * 10**17) + len([] * 10**17) + len(() * 10**17)\n") == J(std::int64_t{0}),
         "repeating an empty sequence yields an empty one");

  auto outcome = run("import statistics\nresult = statistics.quantiles([1, 2, 3], 10**12)\n");
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::resource_exhausted,
         "quantiles count is bounded by the collection limit");

  outcome = thread_engine().execute(make_request(
      "import statistics\nresult = statistics.quantiles(list(range(2000)), 5000000)\n", x_dataset(),
      std::chrono::milliseconds(200)));
  expect(outcome.timed_out(), "long native loop times out");

  // The detached worker must see the stop flag and exit instead of running on.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  const double before = process_cpu_seconds();
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  const double spent = process_cpu_seconds() - before;
  expect(spent < 0.25, "abandoned worker keeps burning CPU: " + std::to_string(spent) + "s");
}

void test_deep_nesting_release() {
  const auto timeout = std::chrono::milliseconds(30000);
  auto outcome = thread_engine().execute(make_request(
      "a = []\nfor i in range(300000):\n    a = [a]\na = None\n"
      "d = {}\nfor i in range(300000):\n    d = {'k': d}\nd = None\n"
      "t = ()\nfor i in range(300000):\n    t = (t,)\nresult = 1\n",
      x_dataset(), timeout));
  expect(outcome.success() != nullptr, "dropping a deep chain does not exhaust the stack: " +
                                           cordon::summarize(outcome));

  outcome = thread_engine().execute(make_request(
      "t = ()\nfor i in range(1000):\n    t = (t,)\nresult = {t: 1}\n", x_dataset(), timeout));
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::resource_exhausted,
         "hashing a deeply nested tuple hits the depth limit");
}

void test_cancellation_token() {
  auto req = make_request("while True:\n    pass\n");
  req.cancellation = std::make_shared<cordon::CancellationToken>();
  req.cancellation->cancel();
  const auto outcome = thread_engine().execute(req);
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::cancelled,
         "cancelled request is a runtime failure");
}

// ============================================================================
// Engine
// ============================================================================

void test_invalid_requests() {
  auto req = make_request("result = 1\n");
  req.program.attempt = 0;
  auto outcome = thread_engine().execute(req);
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::invalid_request, "attempt 0 rejected");

  req = make_request("result = 1\n");
  req.dataset = nullptr;
  outcome = thread_engine().execute(req);
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::invalid_request, "null dataset rejected");

  req = make_request("result = 1\n");
  req.result_name = "not a name";
  outcome = thread_engine().execute(req);
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::invalid_request,
         "non-identifier result name rejected");
}

void test_idempotence() {
  const auto req = make_request("import numeric\nresult = numeric.std(dataset['x'])\n");
  const auto a = thread_engine().execute(req);
  const auto b = thread_engine().execute(req);
  expect(a.kind() == b.kind(), "same variant");
  expect(a.success() && a.metadata().artifact_digest == b.metadata().artifact_digest, "same artifact digest");
  expect(a.metadata().request_digest == b.metadata().request_digest, "same request digest");
  expect(a.metadata().request_digest.size() == 64, "request digest is BLAKE3 hex");
}

void test_custom_result_name() {
  auto req = make_request("answer = 42\n");
  req.result_name = "answer";
  const auto outcome = thread_engine().execute(req);
  expect(outcome.success() && outcome.success()->artifact.payload == J(std::int64_t{42}), "custom result binding");
}

void test_concurrent_executions() {
  std::atomic<int> good{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([i, &good] {
      const auto outcome = run("result = dataset['x'].sum() + " + std::to_string(i) + "\n");
      if (outcome.success() && outcome.success()->artifact.payload == J(6.0 + i)) good.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(good.load() == 8, "concurrent executions are independent");
}

void test_request_id_sanitization() {
  expect(cordon::sanitize_request_id("../a/b..c") == "abc", "path characters dropped");
  expect(cordon::sanitize_request_id(std::string(300, 'z')).size() == 128, "request id capped");
}

std::mutex g_events_mu;
std::vector<cordon::ExecutionEvent> g_events;

void capture_event(const cordon::ExecutionEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

void test_event_emission() {
  cordon::set_execution_event_hook(capture_event);
  auto req = make_request("import os\n");
  req.request_id = "evt/1";
  thread_engine().execute(req);
  cordon::set_execution_event_hook(nullptr);

  std::lock_guard<std::mutex> lk(g_events_mu);
  expect(!g_events.empty(), "event emitted");
  const auto& ev = g_events.back();
  expect(ev.request_id == "evt1", "event carries the sanitized request id");
  expect(ev.outcome == "validation_rejected" || ev.outcome == cordon::to_string(cordon::OutcomeKind::validation_rejected),
         "event records the outcome");
  expect(ev.violations == 1, "event records the violation count");

  const auto round = cordon::event_from_json(cordon::event_to_json(ev));
  expect(round && round->request_id == ev.request_id && round->violations == ev.violations,
         "event JSON line reads back");
  expect(cordon::global_engine_stats().total_executions.load() > 0, "stats counted");
}

// ============================================================================
// Classifier
// ============================================================================

void test_classifier() {
  cordon::RawOutcome raw;
  raw.kind = cordon::RawOutcomeKind::normal_completion;
  auto outcome = cordon::classify(raw);
  expect(outcome.failure() && outcome.failure()->code == cordon::ErrorCode::missing_result,
         "completion without artifact is a missing result");

  raw.kind = cordon::RawOutcomeKind::timed_out;
  expect(cordon::classify(raw).timed_out(), "timed out maps to Timeout");
  expect(cordon::summarize(cordon::classify(raw)) == "timed out", "timeout summary");

  cordon::ValidationResult v;
  v.violations.push_back({cordon::ViolationKind::disallowed_import, "network_client", 1, 1});
  const auto summary = cordon::summarize(cordon::classify(v));
  expect(summary == "rejected: DisallowedImport: network_client (line 1, column 1)", "rejection summary: " + summary);

  raw.kind = cordon::RawOutcomeKind::uncaught_error;
  raw.message = std::string(5000, 'e');
  expect(cordon::summarize(cordon::classify(raw)).size() <= 1030, "summary is bounded");
}

// ============================================================================
// Configuration
// ============================================================================

void test_allow_list_json() {
  std::optional<cordon::jsonlite::JsonError> err;
  auto list = cordon::allow_list_from_json("{\"modules\":[\"numeric\",\"tabular\"]}", &err);
  expect(list.has_value() && !err, "partial allow-list parses");
  expect(list->modules.size() == 2, "modules replaced");
  expect(list->builtins == cordon::AllowList::defaults().builtins, "missing keys keep defaults");

  auto bad = cordon::allow_list_from_json("{\"modules\":[\"numeric\"],\"bogus\":1}", &err);
  expect(!bad && err && err->code == "allowlist_invalid", "unknown key rejected");

  auto round = cordon::allow_list_from_json(cordon::allow_list_to_json(cordon::AllowList::defaults()), &err);
  expect(round && round->blocked_calls == cordon::AllowList::defaults().blocked_calls, "JSON rendering reads back");
}

void test_allow_list_lint() {
  expect(cordon::check_allow_list(cordon::AllowList::defaults()).errors.empty(), "defaults lint clean");

  auto list = cordon::AllowList::defaults();
  list.modules.clear();
  expect(!cordon::check_allow_list(list).errors.empty(), "empty module list is an error");

  list = cordon::AllowList::defaults();
  list.modules.insert("network_client");
  expect(!cordon::check_allow_list(list).errors.empty(), "module without implementation is an error");

  list = cordon::AllowList::defaults();
  list.builtins.insert("open");
  expect(!cordon::check_allow_list(list).errors.empty(), "blocked builtin permitted is an error");

  list = cordon::AllowList::defaults();
  list.block_dunder_attributes = false;
  const auto lint = cordon::check_allow_list(list);
  expect(lint.errors.empty() && !lint.warnings.empty(), "disabled dunder blocking is a warning");
}

void test_config_from_env() {
  ::setenv("CORDON_TIMEOUT_MS", "1500", 1);
  ::setenv("CORDON_ISOLATION", "process", 1);
  std::vector<std::string> problems;
  auto config = cordon::EngineConfig::from_env(&problems);
  expect(problems.empty(), "valid env has no problems");
  expect(config.default_timeout_ms == 1500, "timeout read");
  expect(config.isolation == cordon::IsolationMode::process, "isolation read");

  ::setenv("CORDON_TIMEOUT_MS", "soon", 1);
  problems.clear();
  cordon::EngineConfig::from_env(&problems);
  expect(!problems.empty(), "malformed number reported");
  ::unsetenv("CORDON_TIMEOUT_MS");
  ::unsetenv("CORDON_ISOLATION");

  cordon::EngineConfig zero;
  zero.default_timeout_ms = 0;
  expect(!cordon::validate_config(zero).empty(), "zero timeout invalid");
  expect(!cordon::parse_isolation_mode("vm").has_value(), "unknown isolation mode");
}

void test_version_compatibility() {
  expect(cordon::version::check_compatibility().ok, "current schema compatible");
  expect(!cordon::version::check_compatibility(cordon::version::OUTCOME_SCHEMA_VERSION + 1).ok,
         "future schema incompatible");
  const auto manifest = cordon::version::current_manifest();
  expect(manifest.hash_primitive == "blake3", "manifest names BLAKE3");
}

}  // namespace

int main() {
  std::cout << "=== Cordon Engine Test Suite ===\n";

  std::cout << "\n[Hashing & Datasets]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("dataset fingerprint", test_dataset_fingerprint);
  run_test("csv parsing", test_csv_parsing);

  std::cout << "\n[Language]\n";
  run_test("lexer indentation", test_lexer_indentation);
  run_test("parser errors", test_parser_errors);
  run_test("parser depth bound", test_parser_depth_bound);
  run_test("arithmetic", test_arithmetic);
  run_test("strings", test_strings);
  run_test("container methods", test_container_methods);
  run_test("functions and closures", test_functions_and_closures);
  run_test("control flow", test_control_flow);
  run_test("exceptions", test_exceptions);
  run_test("integer overflow", test_integer_overflow);
  run_test("NaN arguments rejected", test_nan_arguments_rejected);
  run_test("format field index overflow", test_format_field_index_overflow);
  run_test("missing result", test_missing_result);
  run_test("print capture", test_print_capture);

  std::cout << "\n[Tabular Runtime]\n";
  run_test("dataset.mean() scalar", test_dataset_mean_scalar);
  run_test("series operations", test_series_operations);
  run_test("groupby table", test_groupby_table);
  run_test("chart figure", test_chart_figure);
  run_test("dataset mutation isolated", test_dataset_mutation_isolated);

  std::cout << "\n[Static Validation]\n";
  run_test("disallowed import scenario", test_disallowed_import_scenario);
  run_test("dotted import prefix", test_dotted_import_prefix);
  run_test("blocked calls and attributes", test_blocked_calls_and_attributes);
  run_test("violation order", test_violation_order_and_collection);
  run_test("parse error and empty program", test_parse_error_and_empty_program);
  run_test("missing result binding option", test_missing_result_binding_option);
  run_test("rejection short-circuits", test_rejection_short_circuits);

  std::cout << "\n[Capability Restriction]\n";
  run_test("runtime blocked builtin", test_runtime_blocked_builtin);
  run_test("resolver rechecks", test_resolver_rechecks);
  run_test("environment builtins filtered", test_environment_builtins_filtered);

  std::cout << "\n[Bounded Execution]\n";
  run_test("timeout (thread)", test_timeout_thread_mode);
  run_test("timeout not catchable", test_timeout_not_catchable);
  run_test("process mode", test_process_mode);
  run_test("recursion limit", test_recursion_limit);
  run_test("collection limit", test_collection_limit);
  run_test("native loops stop after timeout", test_native_loops_stop_after_timeout);
  run_test("deep nesting release", test_deep_nesting_release);
  run_test("cancellation token", test_cancellation_token);

  std::cout << "\n[Engine]\n";
  run_test("invalid requests", test_invalid_requests);
  run_test("idempotence", test_idempotence);
  run_test("custom result name", test_custom_result_name);
  run_test("concurrent executions (8 threads)", test_concurrent_executions);
  run_test("request_id sanitization", test_request_id_sanitization);
  run_test("event emission", test_event_emission);
  run_test("classifier", test_classifier);

  std::cout << "\n[Configuration]\n";
  run_test("allow-list JSON", test_allow_list_json);
  run_test("allow-list lint", test_allow_list_lint);
  run_test("config from env", test_config_from_env);
  run_test("version compatibility", test_version_compatibility);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
