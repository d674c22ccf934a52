#include "cordon/classifier.hpp"

namespace cordon {

namespace {

constexpr const char* kMissingResult = "missing or invalid result";

// Bounds the feedback line; a runaway error message must not flood a prompt.
constexpr std::size_t kMaxSummaryBytes = 1024;

}  // namespace

ExecutionOutcome classify(const ValidationResult& validation) {
  return ExecutionOutcome(ValidationRejected{validation.violations});
}

ExecutionOutcome classify(const RawOutcome& raw) {
  switch (raw.kind) {
    case RawOutcomeKind::normal_completion:
      if (raw.artifact) return ExecutionOutcome(Success{*raw.artifact});
      return ExecutionOutcome(RuntimeFailure{kMissingResult, ErrorCode::missing_result});
    case RawOutcomeKind::uncaught_error:
      return ExecutionOutcome(RuntimeFailure{raw.message.empty() ? "unknown error" : raw.message,
                                             raw.error_code == ErrorCode::none ? ErrorCode::runtime_error
                                                                                : raw.error_code});
    case RawOutcomeKind::timed_out:
      return ExecutionOutcome(Timeout{});
  }
  return ExecutionOutcome(RuntimeFailure{"unknown error", ErrorCode::runtime_error});
}

std::string summarize(const ExecutionOutcome& outcome) {
  std::string out;
  if (const auto* s = outcome.success()) {
    out = "succeeded: " + to_string(s->artifact.kind) + " result";
  } else if (const auto* r = outcome.rejected()) {
    out = "rejected: ";
    for (std::size_t i = 0; i < r->violations.size(); ++i) {
      if (i) out += "; ";
      out += r->violations[i].describe();
    }
  } else if (const auto* f = outcome.failure()) {
    out = "failed: " + f->message;
  } else {
    out = "timed out";
  }
  if (out.size() > kMaxSummaryBytes) {
    out.resize(kMaxSummaryBytes);
    out += "...";
  }
  return out;
}

}  // namespace cordon
