#pragma once

// cordon/types.hpp: Core data structures for the cordon safe-execution engine.
//
// LIFECYCLE:
//   - AllowList (allow_list.hpp) outlives every request: loaded once at startup,
//     shared read-only as std::shared_ptr<const AllowList>.
//   - ExecutionRequest / ExecutionOutcome are created per call and never
//     persisted by the engine. Persistence belongs to the caller.
//
// CONCURRENCY NOTES:
//   - ExecutionRequest/ExecutionOutcome are value types. The only shared
//     pieces are the immutable dataset handle (shared_ptr<const Dataset>) and
//     the optional CancellationToken, whose single flag is atomic.
//
// MEMORY OWNERSHIP:
//   - ExecutionOutcome is fully owned: the Artifact payload is a self-contained
//     JSON value tree with no references into the interpreter that produced it.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cordon/dataset.hpp"
#include "cordon/jsonlite.hpp"

namespace cordon {

enum class ErrorCode {
  none,
  invalid_request,
  validation_rejected,
  import_blocked,
  attribute_blocked,
  runtime_error,
  missing_result,
  timeout,
  cancelled,
  resource_exhausted,
  worker_crashed,
  spawn_failed,
  config_invalid,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Static validation
// ---------------------------------------------------------------------------

enum class ViolationKind {
  parse_error,
  empty_program,
  disallowed_import,
  blocked_call,
  blocked_attribute,
  missing_result_binding,
};

// "ParseError", "DisallowedImport", ...: the spelling the retry loop shows the LLM.
std::string to_string(ViolationKind kind);

struct Violation {
  ViolationKind kind{ViolationKind::parse_error};
  std::string detail;
  int line{0};
  int column{0};

  // One-line rendering: "DisallowedImport: network_client (line 1, column 1)".
  std::string describe() const;

  bool operator==(const Violation& other) const {
    return kind == other.kind && detail == other.detail && line == other.line && column == other.column;
  }
};

struct ValidationResult {
  std::vector<Violation> violations;  // source order (line, column)

  bool ok() const { return violations.empty(); }
  bool has(ViolationKind kind) const;
};

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

struct CandidateProgram {
  std::string source;
  std::uint32_t attempt{1};  // 1..=N, assigned by the LLM-calling collaborator
};

// Caller-side cooperative cancellation. Polled by the interpreter at the same
// points as the timeout flag.
class CancellationToken {
 public:
  void cancel() noexcept { flag_.store(true, std::memory_order_release); }
  bool cancelled() const noexcept { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
};

struct ExecutionRequest {
  std::string request_id;
  // NOTE: tenant_id is excluded from the request digest, like every other
  // routing-only field.
  std::string tenant_id;
  CandidateProgram program;
  // Must reference an already-validated, already-profiled dataset.
  std::shared_ptr<const Dataset> dataset;
  std::chrono::milliseconds timeout{30000};
  std::string result_name{"result"};
  std::shared_ptr<CancellationToken> cancellation;
};

// Deterministic serialization of the semantic request fields.
std::string canonicalize_request(const ExecutionRequest& request);

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------

enum class ArtifactKind { scalar, table, figure };

std::string to_string(ArtifactKind kind);

struct Artifact {
  ArtifactKind kind{ArtifactKind::scalar};
  jsonlite::Value payload;

  // {"kind":"scalar","value":2.0}
  std::string to_json() const;
  std::string digest() const;

  bool operator==(const Artifact& other) const { return kind == other.kind && payload == other.payload; }
};

std::optional<Artifact> artifact_from_json(const jsonlite::Value& value);

// ---------------------------------------------------------------------------
// Executor output (before classification)
// ---------------------------------------------------------------------------

enum class RawOutcomeKind { normal_completion, uncaught_error, timed_out };

struct RawOutcome {
  RawOutcomeKind kind{RawOutcomeKind::uncaught_error};
  // uncaught_error: "ErrorType: text (line N)"
  std::string message;
  ErrorCode error_code{ErrorCode::none};
  // normal_completion: set when the expected binding held a recognized shape.
  std::optional<Artifact> artifact;
  // Bounded print() capture.
  std::string output;
  std::uint64_t run_ns{0};
};

// ---------------------------------------------------------------------------
// Classified outcome
// ---------------------------------------------------------------------------

enum class OutcomeKind { success, validation_rejected, runtime_failure, timeout };

std::string to_string(OutcomeKind kind);

struct Success {
  Artifact artifact;
};

struct ValidationRejected {
  std::vector<Violation> violations;
};

struct RuntimeFailure {
  std::string message;
  ErrorCode code{ErrorCode::runtime_error};
};

struct Timeout {};

// Not part of the outcome's meaning; filled in by the engine for callers
// that log or compare outcomes.
struct OutcomeMetadata {
  std::string request_id;
  std::string request_digest;
  std::string artifact_digest;
  std::string output;
  std::uint32_t attempt{0};
  std::uint64_t duration_ns{0};
};

class ExecutionOutcome {
 public:
  using Variant = std::variant<Success, ValidationRejected, RuntimeFailure, Timeout>;

  explicit ExecutionOutcome(Variant value, OutcomeMetadata metadata = {})
      : value_(std::move(value)), metadata_(std::move(metadata)) {}

  OutcomeKind kind() const;

  const Success* success() const { return std::get_if<Success>(&value_); }
  const ValidationRejected* rejected() const { return std::get_if<ValidationRejected>(&value_); }
  const RuntimeFailure* failure() const { return std::get_if<RuntimeFailure>(&value_); }
  bool timed_out() const { return std::holds_alternative<Timeout>(value_); }

  const Variant& value() const { return value_; }
  const OutcomeMetadata& metadata() const { return metadata_; }

  // Copy with metadata replaced. The variant itself is never mutated.
  ExecutionOutcome with_metadata(OutcomeMetadata metadata) const { return ExecutionOutcome(value_, std::move(metadata)); }

 private:
  Variant value_;
  OutcomeMetadata metadata_;
};

std::string outcome_to_json(const ExecutionOutcome& outcome);

}  // namespace cordon
