#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cordon/allow_list.hpp"
#include "cordon/classifier.hpp"
#include "cordon/config.hpp"
#include "cordon/dataset.hpp"
#include "cordon/hash.hpp"
#include "cordon/jsonlite.hpp"
#include "cordon/observability.hpp"
#include "cordon/runtime.hpp"
#include "cordon/types.hpp"
#include "cordon/version.hpp"

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

std::string quoted(const std::string& s) { return "\"" + cordon::jsonlite::escape(s) + "\""; }

void usage() {
  std::cerr << "usage:\n"
            << "  cordon validate <script> [--result NAME] [--allowlist FILE]\n"
            << "  cordon exec <script> --data <csv> [--result NAME] [--timeout-ms N]\n"
            << "                       [--isolation thread|process] [--allowlist FILE]\n"
            << "                       [--attempt N] [--request-id ID] [--summary]\n"
            << "  cordon allowlist [--allowlist FILE]\n"
            << "  cordon stats [--events FILE]\n"
            << "  cordon doctor\n"
            << "  cordon version\n";
}

std::string flag(int argc, char** argv, int from, const std::string& name, const std::string& fallback = "") {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == name && i + 1 < argc) return argv[i + 1];
  }
  return fallback;
}

bool has_flag(int argc, char** argv, int from, const std::string& name) {
  for (int i = from; i < argc; ++i)
    if (std::string(argv[i]) == name) return true;
  return false;
}

bool parse_u64(const std::string& text, std::uint64_t* out) {
  if (text.empty()) return false;
  std::uint64_t v = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    if (v > (UINT64_MAX - static_cast<std::uint64_t>(c - '0')) / 10) return false;
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
  }
  *out = v;
  return true;
}

std::optional<cordon::OutcomeKind> parse_outcome_kind(const std::string& text) {
  for (auto k : {cordon::OutcomeKind::success, cordon::OutcomeKind::validation_rejected,
                 cordon::OutcomeKind::runtime_failure, cordon::OutcomeKind::timeout}) {
    if (cordon::to_string(k) == text) return k;
  }
  return std::nullopt;
}

cordon::ErrorCode parse_error_code(const std::string& text) {
  for (std::size_t i = 0; i < cordon::EngineStats::kErrorCodes; ++i) {
    const auto code = static_cast<cordon::ErrorCode>(i);
    if (cordon::to_string(code) == text) return code;
  }
  return cordon::ErrorCode::none;
}

// Environment setup, with --allowlist and --isolation overrides applied.
// Returns false (after printing the errors) when the setup is fatal.
bool setup_from_args(int argc, char** argv, cordon::EngineSetup* setup) {
  const std::string allowlist = flag(argc, argv, 2, "--allowlist");
  if (!allowlist.empty()) ::setenv("CORDON_ALLOWLIST", allowlist.c_str(), 1);
  *setup = cordon::load_engine_setup();

  const std::string isolation = flag(argc, argv, 2, "--isolation");
  if (!isolation.empty()) {
    auto mode = cordon::parse_isolation_mode(isolation);
    if (!mode) {
      setup->errors.push_back("--isolation must be thread or process");
    } else {
      setup->config.isolation = *mode;
    }
  }
  for (const auto& w : setup->warnings) std::cerr << "warning: " << w << "\n";
  if (!setup->ok()) {
    std::cout << "{\"ok\":false,\"errors\":[";
    for (std::size_t i = 0; i < setup->errors.size(); ++i) {
      if (i) std::cout << ",";
      std::cout << quoted(setup->errors[i]);
    }
    std::cout << "]}\n";
    return false;
  }
  return true;
}

int cmd_validate(int argc, char** argv) {
  if (argc < 3) {
    usage();
    return 1;
  }
  std::string source;
  if (!read_file(argv[2], &source)) {
    std::cerr << "cannot read " << argv[2] << "\n";
    return 1;
  }
  cordon::EngineSetup setup;
  if (!setup_from_args(argc, argv, &setup)) return 2;
  cordon::Engine engine(setup.config, setup.allow_list);
  auto result = engine.validate(source, flag(argc, argv, 3, "--result", "result"));
  std::cout << cordon::outcome_to_json(cordon::classify(result)) << "\n";
  return result.ok() ? 0 : 3;
}

int cmd_exec(int argc, char** argv) {
  if (argc < 3) {
    usage();
    return 1;
  }
  const std::string data_path = flag(argc, argv, 3, "--data");
  if (data_path.empty()) {
    std::cerr << "--data is required\n";
    return 1;
  }

  cordon::ExecutionRequest request;
  if (!read_file(argv[2], &request.program.source)) {
    std::cerr << "cannot read " << argv[2] << "\n";
    return 1;
  }
  try {
    request.dataset = std::make_shared<const cordon::Dataset>(cordon::load_csv(data_path));
  } catch (const cordon::DatasetError& e) {
    std::cerr << "dataset: " << e.what() << "\n";
    return 1;
  }

  cordon::EngineSetup setup;
  if (!setup_from_args(argc, argv, &setup)) return 2;

  std::uint64_t n = 0;
  request.timeout = std::chrono::milliseconds(setup.config.default_timeout_ms);
  if (const auto t = flag(argc, argv, 3, "--timeout-ms"); !t.empty()) {
    if (!parse_u64(t, &n) || n == 0) {
      std::cerr << "--timeout-ms must be a positive integer\n";
      return 1;
    }
    request.timeout = std::chrono::milliseconds(n);
  }
  if (const auto a = flag(argc, argv, 3, "--attempt"); !a.empty()) {
    if (!parse_u64(a, &n) || n == 0 || n > UINT32_MAX) {
      std::cerr << "--attempt must be a positive integer\n";
      return 1;
    }
    request.program.attempt = static_cast<std::uint32_t>(n);
  }
  request.result_name = flag(argc, argv, 3, "--result", "result");
  request.request_id = flag(argc, argv, 3, "--request-id", "cli");

  cordon::Engine engine(setup.config, setup.allow_list);
  auto outcome = engine.execute(request);
  if (has_flag(argc, argv, 3, "--summary")) {
    std::cout << cordon::summarize(outcome) << "\n";
  } else {
    std::cout << cordon::outcome_to_json(outcome) << "\n";
  }
  switch (outcome.kind()) {
    case cordon::OutcomeKind::success:
      return 0;
    case cordon::OutcomeKind::validation_rejected:
      return 3;
    case cordon::OutcomeKind::runtime_failure:
      return 4;
    case cordon::OutcomeKind::timeout:
      return 5;
  }
  return 4;
}

int cmd_allowlist(int argc, char** argv) {
  cordon::EngineSetup setup;
  if (!setup_from_args(argc, argv, &setup)) return 2;
  std::cout << cordon::allow_list_to_json(*setup.allow_list) << "\n";
  return 0;
}

// Replays a CORDON_EVENT_LOG file into a fresh EngineStats.
int cmd_stats(int argc, char** argv) {
  const char* env_path = std::getenv("CORDON_EVENT_LOG");
  const std::string path = flag(argc, argv, 2, "--events", env_path ? env_path : "");
  if (path.empty()) {
    std::cerr << "no event log: pass --events FILE or set CORDON_EVENT_LOG\n";
    return 1;
  }
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    return 1;
  }
  cordon::EngineStats stats;
  std::size_t skipped = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    auto ev = cordon::event_from_json(line);
    auto kind = ev ? parse_outcome_kind(ev->outcome) : std::nullopt;
    if (!kind) {
      ++skipped;
      continue;
    }
    stats.record_execution(*ev, *kind, parse_error_code(ev->error_code));
  }
  if (skipped) std::cerr << "skipped " << skipped << " malformed line(s)\n";
  std::cout << stats.to_json() << "\n";
  return 0;
}

int cmd_doctor() {
  std::vector<std::string> blockers;
  auto setup = cordon::load_engine_setup();
  for (const auto& e : setup.errors) blockers.push_back(e);

  auto h = cordon::hash_runtime_info();
  // BLAKE3 empty-input vector.
  if (cordon::blake3_hex("") != "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    blockers.push_back("hash_vector_mismatch");
  }
  auto compat = cordon::version::check_compatibility();
  if (!compat.ok) blockers.push_back(compat.error_code + ": " + compat.description);

  std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false") << ",\"blockers\":[";
  for (std::size_t i = 0; i < blockers.size(); ++i) {
    if (i) std::cout << ",";
    std::cout << quoted(blockers[i]);
  }
  std::cout << "],\"warnings\":[";
  for (std::size_t i = 0; i < setup.warnings.size(); ++i) {
    if (i) std::cout << ",";
    std::cout << quoted(setup.warnings[i]);
  }
  std::cout << "]";
  std::cout << ",\"hash_primitive\":" << quoted(h.primitive);
  std::cout << ",\"config\":" << cordon::config_to_json(setup.config);
  std::cout << ",\"version\":" << cordon::version::manifest_to_json(cordon::version::current_manifest());
  std::cout << "}\n";
  return blockers.empty() ? 0 : 2;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  if (cmd == "validate") return cmd_validate(argc, argv);
  if (cmd == "exec") return cmd_exec(argc, argv);
  if (cmd == "allowlist") return cmd_allowlist(argc, argv);
  if (cmd == "stats") return cmd_stats(argc, argv);
  if (cmd == "doctor") return cmd_doctor();
  if (cmd == "version") {
    std::cout << cordon::version::manifest_to_json(cordon::version::current_manifest()) << "\n";
    return 0;
  }
  usage();
  return 1;
}
