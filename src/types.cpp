#include "cordon/types.hpp"

#include "cordon/hash.hpp"

namespace cordon {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_request: return "invalid_request";
    case ErrorCode::validation_rejected: return "validation_rejected";
    case ErrorCode::import_blocked: return "import_blocked";
    case ErrorCode::attribute_blocked: return "attribute_blocked";
    case ErrorCode::runtime_error: return "runtime_error";
    case ErrorCode::missing_result: return "missing_result";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::resource_exhausted: return "resource_exhausted";
    case ErrorCode::worker_crashed: return "worker_crashed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(ViolationKind kind) {
  switch (kind) {
    case ViolationKind::parse_error: return "ParseError";
    case ViolationKind::empty_program: return "EmptyProgram";
    case ViolationKind::disallowed_import: return "DisallowedImport";
    case ViolationKind::blocked_call: return "BlockedCall";
    case ViolationKind::blocked_attribute: return "BlockedAttribute";
    case ViolationKind::missing_result_binding: return "MissingResultBinding";
  }
  return "ParseError";
}

std::string to_string(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::scalar: return "scalar";
    case ArtifactKind::table: return "table";
    case ArtifactKind::figure: return "figure";
  }
  return "scalar";
}

std::string to_string(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::success: return "success";
    case OutcomeKind::validation_rejected: return "validation_rejected";
    case OutcomeKind::runtime_failure: return "runtime_failure";
    case OutcomeKind::timeout: return "timeout";
  }
  return "runtime_failure";
}

std::string Violation::describe() const {
  std::string out = to_string(kind);
  if (!detail.empty()) out += ": " + detail;
  if (line > 0) {
    out += " (line " + std::to_string(line);
    if (column > 0) out += ", column " + std::to_string(column);
    out += ")";
  }
  return out;
}

bool ValidationResult::has(ViolationKind kind) const {
  for (const auto& v : violations) {
    if (v.kind == kind) return true;
  }
  return false;
}

// Fixed field order, length-prefixed source. Changing this changes every
// request digest.
std::string canonicalize_request(const ExecutionRequest& request) {
  std::string out;
  out.reserve(request.program.source.size() + 192);
  out += "{\"dataset\":\"";
  out += request.dataset ? request.dataset->fingerprint() : std::string();
  out += "\",\"result_name\":\"";
  out += jsonlite::escape(request.result_name);
  out += "\",\"source\":\"";
  out += jsonlite::escape(request.program.source);
  out += "\",\"timeout_ms\":";
  out += std::to_string(request.timeout.count());
  out += "}";
  return out;
}

std::string Artifact::to_json() const {
  jsonlite::Object o;
  o["kind"] = to_string(kind);
  o["value"] = payload;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::string Artifact::digest() const { return artifact_hash(to_json()); }

std::optional<Artifact> artifact_from_json(const jsonlite::Value& value) {
  if (!value.is_object()) return std::nullopt;
  const auto& o = std::get<jsonlite::Object>(value.v);
  const std::string kind = jsonlite::get_string(o, "kind");
  auto it = o.find("value");
  if (it == o.end()) return std::nullopt;
  Artifact a;
  if (kind == "scalar") a.kind = ArtifactKind::scalar;
  else if (kind == "table") a.kind = ArtifactKind::table;
  else if (kind == "figure") a.kind = ArtifactKind::figure;
  else return std::nullopt;
  a.payload = it->second;
  return a;
}

OutcomeKind ExecutionOutcome::kind() const {
  switch (value_.index()) {
    case 0: return OutcomeKind::success;
    case 1: return OutcomeKind::validation_rejected;
    case 2: return OutcomeKind::runtime_failure;
    default: return OutcomeKind::timeout;
  }
}

std::string outcome_to_json(const ExecutionOutcome& outcome) {
  jsonlite::Object o;
  o["outcome"] = to_string(outcome.kind());
  if (const auto* s = outcome.success()) {
    jsonlite::Object art;
    art["kind"] = to_string(s->artifact.kind);
    art["value"] = s->artifact.payload;
    o["artifact"] = std::move(art);
  } else if (const auto* r = outcome.rejected()) {
    jsonlite::Array list;
    for (const auto& v : r->violations) {
      jsonlite::Object item;
      item["kind"] = to_string(v.kind);
      item["detail"] = v.detail;
      item["line"] = v.line;
      item["column"] = v.column;
      list.emplace_back(std::move(item));
    }
    o["violations"] = std::move(list);
  } else if (const auto* f = outcome.failure()) {
    o["message"] = f->message;
    o["error_code"] = to_string(f->code);
  }
  const auto& m = outcome.metadata();
  jsonlite::Object meta;
  meta["request_id"] = m.request_id;
  meta["request_digest"] = m.request_digest;
  meta["artifact_digest"] = m.artifact_digest;
  meta["attempt"] = static_cast<std::int64_t>(m.attempt);
  meta["duration_ns"] = static_cast<std::int64_t>(m.duration_ns);
  if (!m.output.empty()) meta["output"] = m.output;
  o["metadata"] = std::move(meta);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace cordon
