// gauntlet.cpp: escape-attempt gauntlet.
//
// Runs a fixed set of hostile candidate programs through the engine and
// checks that each one is contained:
//
// A) Capability escape: imports, blocked calls, dunder traversal.
//    Expected: ValidationRejected with the named violation kind.
// B) Runtime escape: references the validator cannot see.
//    Expected: RuntimeFailure; the capability never materializes.
// C) Resource abuse: loops, recursion, allocation, output floods.
//    Expected: Timeout or RuntimeFailure(resource_exhausted); no wedge.
// D) Dataset isolation: in-place mutation of the bound dataset.
//    Expected: the caller's fingerprint is unchanged.
//
// Each case runs in thread mode, and the resource cases again in process
// mode. Produces: artifacts/reports/CONTAINMENT_REPORT.json

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "cordon/config.hpp"
#include "cordon/dataset.hpp"
#include "cordon/jsonlite.hpp"
#include "cordon/runtime.hpp"
#include "cordon/types.hpp"

namespace fs = std::filesystem;

namespace {

void write_file(const std::string& path, const std::string& data) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream ofs(path, std::ios::trunc | std::ios::binary);
  ofs << data;
}

struct Attempt {
  std::string name;
  std::string category;
  std::string source;
  cordon::OutcomeKind expected{cordon::OutcomeKind::validation_rejected};
  std::optional<cordon::ViolationKind> violation;
  std::optional<cordon::ErrorCode> code;
  bool also_process{false};
};

struct AttemptResult {
  std::string name;
  std::string category;
  std::string isolation;
  bool pass{false};
  std::string detail;
};

std::vector<Attempt> attempts() {
  using cordon::ErrorCode;
  using cordon::OutcomeKind;
  using cordon::ViolationKind;
  std::vector<Attempt> v;

  // A) capability escape
  v.push_back({"import_os", "capability", "import os\nresult = 1\n", OutcomeKind::validation_rejected,
               ViolationKind::disallowed_import, std::nullopt});
  v.push_back({"import_network_client", "capability", "import network_client\nresult = 1\n",
               OutcomeKind::validation_rejected, ViolationKind::disallowed_import, std::nullopt});
  v.push_back({"from_subprocess", "capability", "from subprocess import run\nresult = run('id')\n",
               OutcomeKind::validation_rejected, ViolationKind::disallowed_import, std::nullopt});
  v.push_back({"dotted_submodule", "capability", "import tabular.io\nresult = 1\n", OutcomeKind::validation_rejected,
               ViolationKind::disallowed_import, std::nullopt});
  v.push_back({"open_file", "capability", "result = open('/etc/passwd').read()\n", OutcomeKind::validation_rejected,
               ViolationKind::blocked_call, std::nullopt});
  v.push_back({"eval_string", "capability", "result = eval('1 + 1')\n", OutcomeKind::validation_rejected,
               ViolationKind::blocked_call, std::nullopt});
  v.push_back({"dunder_import", "capability", "result = __import__('os')\n", OutcomeKind::validation_rejected,
               ViolationKind::blocked_call, std::nullopt});
  v.push_back({"class_traversal", "capability", "result = ().__class__.__bases__[0].__subclasses__()\n",
               OutcomeKind::validation_rejected, ViolationKind::blocked_attribute, std::nullopt});
  v.push_back({"builtins_name", "capability", "b = __builtins__\nresult = 1\n", OutcomeKind::validation_rejected,
               ViolationKind::blocked_attribute, std::nullopt});
  v.push_back({"dataset_to_csv", "capability", "dataset.to_csv('/tmp/leak.csv')\nresult = 1\n",
               OutcomeKind::validation_rejected, ViolationKind::blocked_call, std::nullopt});
  v.push_back({"frame_query", "capability", "q = dataset.query\nresult = 1\n", OutcomeKind::validation_rejected,
               ViolationKind::blocked_attribute, std::nullopt});

  // B) runtime escape
  v.push_back({"alias_open", "runtime", "f = open\nresult = f('/etc/passwd')\n", OutcomeKind::runtime_failure,
               std::nullopt, ErrorCode::runtime_error});
  v.push_back({"string_attribute", "runtime", "name = 'ev' + 'al'\nresult = name()\n", OutcomeKind::runtime_failure,
               std::nullopt, ErrorCode::runtime_error});

  // C) resource abuse
  v.push_back({"infinite_loop", "resource", "while True:\n    pass\n", OutcomeKind::timeout, std::nullopt,
               std::nullopt, true});
  v.push_back({"loop_swallows_errors", "resource",
               "while True:\n    try:\n        x = 1\n    except Exception:\n        pass\n", OutcomeKind::timeout,
               std::nullopt, std::nullopt, true});
  v.push_back({"unbounded_recursion", "resource", "def f(n):\n    return f(n + 1)\nresult = f(0)\n",
               OutcomeKind::runtime_failure, std::nullopt, ErrorCode::resource_exhausted, true});
  v.push_back({"list_bomb", "resource", "result = [0] * 1000000000\n", OutcomeKind::runtime_failure, std::nullopt,
               ErrorCode::resource_exhausted, true});
  v.push_back({"string_bomb", "resource", "s = 'x'\nwhile True:\n    s = s + s\n", OutcomeKind::runtime_failure,
               std::nullopt, ErrorCode::resource_exhausted, true});
  v.push_back({"print_flood", "resource", "for i in range(100000):\n    print('spam' * 10)\nresult = 1\n",
               OutcomeKind::runtime_failure, std::nullopt, ErrorCode::resource_exhausted});

  // D) dataset isolation
  v.push_back({"mutate_dataset", "isolation",
               "dataset['a'] = dataset['a'] * 0\ndf['b'] = 'x'\nresult = dataset['a'].sum()\n", OutcomeKind::success,
               std::nullopt, std::nullopt, true});
  return v;
}

std::shared_ptr<const cordon::Dataset> sample_dataset() {
  return std::make_shared<const cordon::Dataset>(
      std::vector<cordon::Column>{cordon::Column::numeric("a", {1.0, 2.0, 3.0}),
                                  cordon::Column::text("b", {"p", "q", "r"})});
}

AttemptResult run_attempt(const cordon::Engine& engine, const Attempt& a,
                          const std::shared_ptr<const cordon::Dataset>& dataset) {
  AttemptResult r;
  r.name = a.name;
  r.category = a.category;
  r.isolation = cordon::to_string(engine.config().isolation);

  const std::string before = dataset->fingerprint();
  cordon::ExecutionRequest req;
  req.request_id = "gauntlet-" + a.name;
  req.program.source = a.source;
  req.dataset = dataset;
  req.timeout = std::chrono::milliseconds(300);

  const auto outcome = engine.execute(req);
  bool pass = outcome.kind() == a.expected;
  std::string detail = "outcome=" + cordon::to_string(outcome.kind());

  if (a.violation) {
    const auto* rej = outcome.rejected();
    bool found = false;
    if (rej) {
      for (const auto& v : rej->violations) found = found || v.kind == *a.violation;
    }
    pass = pass && found;
    detail += " violation=" + cordon::to_string(*a.violation) + (found ? "" : "(missing)");
  }
  if (a.code) {
    const auto* f = outcome.failure();
    pass = pass && f != nullptr && f->code == *a.code;
    detail += " code=" + (f ? cordon::to_string(f->code) : std::string("none"));
  }
  if (dataset->fingerprint() != before) {
    pass = false;
    detail += " fingerprint_changed";
  }
  r.pass = pass;
  r.detail = detail;
  return r;
}

}  // namespace

int main() {
  const auto dataset = sample_dataset();
  std::vector<AttemptResult> results;

  cordon::EngineConfig thread_config;
  thread_config.isolation = cordon::IsolationMode::thread;
  const cordon::Engine thread_engine(thread_config);

  cordon::EngineConfig process_config;
  process_config.isolation = cordon::IsolationMode::process;
  process_config.max_memory_bytes = 512ull * 1024 * 1024;
  const cordon::Engine process_engine(process_config);

  for (const auto& a : attempts()) {
    results.push_back(run_attempt(thread_engine, a, dataset));
    if (a.also_process) results.push_back(run_attempt(process_engine, a, dataset));
  }

  bool all_pass = true;
  for (const auto& r : results) all_pass = all_pass && r.pass;

  std::ostringstream report;
  report << "{"
         << "\"schema\":\"containment_report_v1\""
         << ",\"pass\":" << (all_pass ? "true" : "false") << ",\"attempts\":[";
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (i > 0) report << ",";
    const auto& r = results[i];
    report << "{"
           << "\"name\":\"" << r.name << "\""
           << ",\"category\":\"" << r.category << "\""
           << ",\"isolation\":\"" << r.isolation << "\""
           << ",\"pass\":" << (r.pass ? "true" : "false") << ",\"detail\":\""
           << cordon::jsonlite::escape(r.detail) << "\""
           << "}";
  }
  report << "]}";

  const std::string report_path = "artifacts/reports/CONTAINMENT_REPORT.json";
  write_file(report_path, report.str());
  std::cout << "[gauntlet] report written: " << report_path << "\n";

  for (const auto& r : results) {
    std::cout << "  [" << r.category << "/" << r.isolation << "] " << r.name << ": " << (r.pass ? "PASS" : "FAIL")
              << "  " << r.detail << "\n";
  }
  std::cout << "[gauntlet] overall=" << (all_pass ? "PASS" : "FAIL") << "\n";
  return all_pass ? 0 : 1;
}
