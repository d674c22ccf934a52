#include "cordon/runtime.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "cordon/classifier.hpp"
#include "cordon/executor.hpp"
#include "cordon/hash.hpp"
#include "cordon/isolation.hpp"
#include "cordon/observability.hpp"

namespace cordon {

namespace {

constexpr std::size_t kMaxRequestIdBytes = 128;
// Source text larger than this is rejected before parsing.
constexpr std::size_t kMaxSourceBytes = 1 * 1024 * 1024;

bool is_identifier(const std::string& s) {
  if (s.empty()) return false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    if (!alpha && (i == 0 || c < '0' || c > '9')) return false;
  }
  return true;
}

// Empty when the request is well-formed.
std::string check_request(const ExecutionRequest& request) {
  if (request.program.attempt == 0) return "attempt must be >= 1";
  if (request.timeout.count() <= 0) return "timeout must be > 0";
  if (!request.dataset) return "dataset is required";
  if (!is_identifier(request.result_name)) return "result name must be an identifier";
  if (request.program.source.size() > kMaxSourceBytes) return "program source exceeds 1 MiB";
  return "";
}

std::uint64_t since(std::chrono::steady_clock::time_point start) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count());
}

ErrorCode outcome_code(const ExecutionOutcome& outcome) {
  if (const auto* f = outcome.failure()) return f->code;
  if (outcome.rejected()) return ErrorCode::validation_rejected;
  if (outcome.timed_out()) return ErrorCode::timeout;
  return ErrorCode::none;
}

}  // namespace

std::string sanitize_request_id(const std::string& id) {
  std::string out;
  out.reserve(std::min(id.size(), kMaxRequestIdBytes));
  for (char c : id) {
    if (out.size() >= kMaxRequestIdBytes) break;
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_') {
      out.push_back(c);
    }
  }
  return out;
}

Engine::Engine(EngineConfig config, std::shared_ptr<const AllowList> allow_list)
    : config_(std::move(config)), allow_list_(allow_list ? std::move(allow_list) : global_allow_list()) {}

ValidatorOptions Engine::validator_options(const std::string& result_name) const {
  ValidatorOptions options;
  options.require_result_assignment = config_.require_result_assignment;
  options.result_name = result_name;
  options.max_parse_depth = config_.limits.max_parse_depth;
  return options;
}

ValidationResult Engine::validate(const std::string& source, const std::string& result_name) const {
  return cordon::validate(source, *allow_list_, validator_options(result_name));
}

ExecutionOutcome Engine::execute(const ExecutionRequest& request) const {
  const auto start = std::chrono::steady_clock::now();

  OutcomeMetadata meta;
  meta.request_id = sanitize_request_id(request.request_id);
  meta.attempt = request.program.attempt;

  ExecutionEvent ev;
  ev.request_id = meta.request_id;
  ev.tenant_id = sanitize_request_id(request.tenant_id);
  ev.attempt = meta.attempt;
  ev.isolation = to_string(config_.isolation);
  ev.bytes_source = request.program.source.size();

  auto finish = [&](ExecutionOutcome outcome) {
    meta.duration_ns = since(start);
    if (const auto* s = outcome.success()) meta.artifact_digest = s->artifact.digest();
    ev.artifact_digest = meta.artifact_digest;
    ev.duration_ns = meta.duration_ns;
    ev.outcome = to_string(outcome.kind());
    const ErrorCode code = outcome_code(outcome);
    ev.error_code = to_string(code);
    if (const auto* r = outcome.rejected()) ev.violations = r->violations.size();
    ev.bytes_output = meta.output.size();
    emit_execution_event(ev, outcome.kind(), code);
    return outcome.with_metadata(meta);
  };

  // 1. Request checks.
  if (std::string problem = check_request(request); !problem.empty()) {
    return finish(ExecutionOutcome(RuntimeFailure{"invalid request: " + problem, ErrorCode::invalid_request}));
  }

  // 2. Determinism anchor.
  meta.request_digest = request_hash(canonicalize_request(request));
  ev.request_digest = meta.request_digest;
  ev.execution_id = meta.request_digest;

  // 3. Static validation.
  std::shared_ptr<const ast::Module> module;
  ValidationResult validation;
  {
    ScopeTimer timer(ev.validate_ns);
    validation = cordon::validate(request.program.source, *allow_list_, validator_options(request.result_name),
                                  &module);
  }
  if (!validation.ok()) return finish(classify(validation));

  // 4-5. Fresh environment; the guard binds on the worker.
  auto guard = std::make_shared<const IsolationGuard>(request.dataset, config_.dataset_binding, config_.bind_df_alias);
  auto task = std::make_shared<ExecutionTask>();
  task->module = module;
  task->environment = build_environment(allow_list_, config_.limits);
  task->prepare = [guard](Interpreter& interp) { guard->bind(interp); };
  task->capture = [guard, name = request.result_name](const Interpreter& interp) {
    return guard->capture(interp, name);
  };

  // 6-7. Bounded run.
  ExecutorOptions options;
  options.mode = config_.isolation;
  options.max_memory_bytes = config_.max_memory_bytes;
  options.max_file_descriptors = config_.max_file_descriptors;
  options.enforce_network_isolation = config_.enforce_network_isolation;
  RawOutcome raw = run_bounded(std::move(task), request.timeout, request.cancellation, options);
  ev.run_ns = raw.run_ns;
  meta.output = raw.output;

  if (!guard->source_intact()) {
    ev.integrity_ok = false;
    log_diagnostic("integrity: dataset fingerprint changed during request " + meta.request_id);
  }

  // 8. Classification.
  return finish(classify(raw));
}

EngineSetup load_engine_setup() {
  EngineSetup setup;
  setup.config = EngineConfig::from_env(&setup.errors);
  for (auto& e : validate_config(setup.config)) setup.errors.push_back(std::move(e));

  AllowList list = AllowList::defaults();
  if (!setup.config.allow_list_path.empty()) {
    std::optional<jsonlite::JsonError> err;
    auto loaded = load_allow_list_file(setup.config.allow_list_path, &err);
    if (!loaded) {
      setup.errors.push_back("allow-list " + setup.config.allow_list_path + ": " + (err ? err->message : "invalid"));
      return setup;
    }
    list = std::move(*loaded);
  }
  AllowListLint lint = check_allow_list(list);
  for (auto& e : lint.errors) setup.errors.push_back(std::move(e));
  setup.warnings = std::move(lint.warnings);
  setup.allow_list = std::make_shared<const AllowList>(std::move(list));
  return setup;
}

const Engine& global_engine() {
  static const Engine engine = [] {
    EngineSetup setup = load_engine_setup();
    if (!setup.ok()) {
      std::string message = "engine configuration invalid:";
      for (const auto& e : setup.errors) message += " " + e + ";";
      throw std::runtime_error(message);
    }
    for (const auto& w : setup.warnings) log_diagnostic("warning: " + w);
    init_allow_list(setup.allow_list);
    return Engine(std::move(setup.config), global_allow_list());
  }();
  return engine;
}

ExecutionOutcome execute(const ExecutionRequest& request) { return global_engine().execute(request); }

}  // namespace cordon
