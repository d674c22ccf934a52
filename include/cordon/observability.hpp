#pragma once

// cordon/observability.hpp: Structured execution observability.
//
// ExecutionEvent is the observable unit: every execute() emits exactly one,
// which is recorded into the global EngineStats and then either handed to a
// registered hook or appended as one JSONL line to CORDON_EVENT_LOG.
//
// Events carry digests and metadata only. Program source, captured output
// and result payloads never leave the engine through this path.
//
// EXTENSION_POINT: event_exporter
//   Register a hook with set_execution_event_hook() to forward events to an
//   external collector. Invariant: the hook must not block execute().

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cordon/types.hpp"

namespace cordon {

struct ExecutionEvent {
  std::string execution_id;  // = request_digest
  std::string request_id;
  std::string tenant_id;
  std::string request_digest;
  std::string artifact_digest;

  std::string outcome;     // to_string(OutcomeKind)
  std::string error_code;  // to_string(ErrorCode), empty on success
  std::uint32_t attempt{0};
  std::size_t violations{0};
  std::string isolation;   // "thread" | "process"

  // Duration breakdown (nanoseconds)
  std::uint64_t duration_ns{0};  // whole execute()
  std::uint64_t validate_ns{0};
  std::uint64_t run_ns{0};

  std::size_t bytes_source{0};
  std::size_t bytes_output{0};

  // False when the caller's dataset fingerprint changed during the run.
  bool integrity_ok{true};
};

// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // p in [0.0, 1.0]; microseconds; 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// Thread-safe. Counters are atomic; the ring of recent events is guarded by
// a mutex. Exposed through `cordon stats` and `cordon doctor`.
class EngineStats {
 public:
  static constexpr std::size_t kErrorCodes = static_cast<std::size_t>(ErrorCode::config_invalid) + 1;
  static constexpr std::size_t kMaxRecentEvents = 256;

  void record_execution(const ExecutionEvent& ev, OutcomeKind kind, ErrorCode code);
  std::string to_json() const;
  std::vector<ExecutionEvent> recent_events_snapshot() const;

  alignas(64) std::atomic<std::uint64_t> total_executions{0};
  alignas(64) std::atomic<std::uint64_t> successes{0};
  alignas(64) std::atomic<std::uint64_t> validation_rejections{0};
  alignas(64) std::atomic<std::uint64_t> runtime_failures{0};
  alignas(64) std::atomic<std::uint64_t> timeouts{0};
  alignas(64) std::atomic<std::uint64_t> integrity_violations{0};

  LatencyHistogram latency_histogram;

 private:
  std::array<std::atomic<std::uint64_t>, kErrorCodes> failure_codes_{};

  mutable std::mutex ring_mu_;
  std::vector<ExecutionEvent> ring_buffer_;
  std::size_t ring_head_{0};  // next slot to overwrite once full
};

EngineStats& global_engine_stats();

std::string event_to_json(const ExecutionEvent& ev);
// Inverse of event_to_json() for one JSONL line; nullopt when not an object.
std::optional<ExecutionEvent> event_from_json(const std::string& line);

// Records `ev` and forwards it (hook, else JSONL to CORDON_EVENT_LOG).
void emit_execution_event(const ExecutionEvent& ev, OutcomeKind kind, ErrorCode code);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
void set_execution_event_hook(ExecutionEventHook hook);

// Operator diagnostics: "[cordon] <message>" on stderr.
void log_diagnostic(const std::string& message);

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace cordon
