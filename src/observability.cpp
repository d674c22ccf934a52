#include "cordon/observability.hpp"

#include <algorithm>
#include <bit>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "cordon/jsonlite.hpp"

namespace cordon {

namespace {

inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return b >= LatencyHistogram::kBuckets ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

std::atomic<ExecutionEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of the bucket.
      const double lo = i == 0 ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  std::string out;
  out.reserve(256);
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_us\":" + fixed(mean_us(), "%.2f");
  out += ",\"p50_ms\":" + fixed(p50 / 1000.0, "%.3f");
  out += ",\"p95_ms\":" + fixed(p95 / 1000.0, "%.3f");
  out += ",\"p99_ms\":" + fixed(p99 / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_execution(const ExecutionEvent& ev, OutcomeKind kind, ErrorCode code) {
  total_executions.fetch_add(1, std::memory_order_relaxed);
  switch (kind) {
    case OutcomeKind::success: successes.fetch_add(1, std::memory_order_relaxed); break;
    case OutcomeKind::validation_rejected: validation_rejections.fetch_add(1, std::memory_order_relaxed); break;
    case OutcomeKind::runtime_failure: runtime_failures.fetch_add(1, std::memory_order_relaxed); break;
    case OutcomeKind::timeout: timeouts.fetch_add(1, std::memory_order_relaxed); break;
  }
  if (code != ErrorCode::none) failure_codes_[static_cast<std::size_t>(code)].fetch_add(1, std::memory_order_relaxed);
  if (!ev.integrity_ok) integrity_violations.fetch_add(1, std::memory_order_relaxed);

  latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<ExecutionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<ExecutionEvent> out;
  out.reserve(ring_buffer_.size());
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(768);
  out += "{\"total_executions\":" + std::to_string(total_executions.load(std::memory_order_relaxed));
  out += ",\"outcomes\":{\"success\":" + std::to_string(successes.load(std::memory_order_relaxed));
  out += ",\"validation_rejected\":" + std::to_string(validation_rejections.load(std::memory_order_relaxed));
  out += ",\"runtime_failure\":" + std::to_string(runtime_failures.load(std::memory_order_relaxed));
  out += ",\"timeout\":" + std::to_string(timeouts.load(std::memory_order_relaxed));
  out += "},\"integrity_violations\":" + std::to_string(integrity_violations.load(std::memory_order_relaxed));

  out += ",\"failure_codes\":{";
  bool first = true;
  for (std::size_t i = 1; i < kErrorCodes; ++i) {
    const std::uint64_t n = failure_codes_[i].load(std::memory_order_relaxed);
    if (n == 0) continue;
    if (!first) out += ',';
    first = false;
    out += '"' + to_string(static_cast<ErrorCode>(i)) + "\":" + std::to_string(n);
  }
  out += '}';
  out += ",\"latency\":" + latency_histogram.to_json();
  out += '}';
  return out;
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

std::string event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["execution_id"] = ev.execution_id;
  o["request_id"] = ev.request_id;
  o["tenant_id"] = ev.tenant_id;
  o["request_digest"] = ev.request_digest;
  o["artifact_digest"] = ev.artifact_digest;
  o["outcome"] = ev.outcome;
  o["error_code"] = ev.error_code;
  o["attempt"] = static_cast<std::int64_t>(ev.attempt);
  o["violations"] = static_cast<std::int64_t>(ev.violations);
  o["isolation"] = ev.isolation;
  o["duration_ns"] = static_cast<std::int64_t>(ev.duration_ns);
  o["validate_ns"] = static_cast<std::int64_t>(ev.validate_ns);
  o["run_ns"] = static_cast<std::int64_t>(ev.run_ns);
  o["bytes_source"] = static_cast<std::int64_t>(ev.bytes_source);
  o["bytes_output"] = static_cast<std::int64_t>(ev.bytes_output);
  o["integrity_ok"] = ev.integrity_ok;
  return jsonlite::to_json(o);
}

std::optional<ExecutionEvent> event_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  auto u64 = [&o](const char* key) { return static_cast<std::uint64_t>(std::max<std::int64_t>(0, jsonlite::get_i64(o, key))); };
  ExecutionEvent ev;
  ev.execution_id = jsonlite::get_string(o, "execution_id");
  ev.request_id = jsonlite::get_string(o, "request_id");
  ev.tenant_id = jsonlite::get_string(o, "tenant_id");
  ev.request_digest = jsonlite::get_string(o, "request_digest");
  ev.artifact_digest = jsonlite::get_string(o, "artifact_digest");
  ev.outcome = jsonlite::get_string(o, "outcome");
  ev.error_code = jsonlite::get_string(o, "error_code");
  ev.attempt = static_cast<std::uint32_t>(u64("attempt"));
  ev.violations = static_cast<std::size_t>(u64("violations"));
  ev.isolation = jsonlite::get_string(o, "isolation");
  ev.duration_ns = u64("duration_ns");
  ev.validate_ns = u64("validate_ns");
  ev.run_ns = u64("run_ns");
  ev.bytes_source = static_cast<std::size_t>(u64("bytes_source"));
  ev.bytes_output = static_cast<std::size_t>(u64("bytes_output"));
  ev.integrity_ok = jsonlite::get_bool(o, "integrity_ok", true);
  return ev;
}

void set_execution_event_hook(ExecutionEventHook hook) { g_event_hook.store(hook, std::memory_order_release); }

void emit_execution_event(const ExecutionEvent& ev, OutcomeKind kind, ErrorCode code) {
  global_engine_stats().record_execution(ev, kind, code);

  if (ExecutionEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("CORDON_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  const std::string line = event_to_json(ev) + "\n";
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  } else {
    log_diagnostic(std::string("cannot append to CORDON_EVENT_LOG ") + log_path);
  }
}

void log_diagnostic(const std::string& message) { std::cerr << "[cordon] " << message << "\n"; }

}  // namespace cordon
