#pragma once

// cordon/executor.hpp: Bounded Executor.
//
// Runs a validated program under a wall-clock deadline and reports exactly
// one RawOutcome: normal_completion, uncaught_error or timed_out.
//
// MODES:
//   thread   The program runs on a dedicated std::thread. The caller waits on
//            a condition variable until the deadline. On expiry the stop flag
//            is raised and the worker is detached; it owns everything it
//            touches through the shared ExecutionTask and stops at its next
//            interrupt check.
//   process  The program runs in a fork()ed child with rlimits,
//            PR_SET_NO_NEW_PRIVS and a best-effort network namespace. The
//            child sends its outcome as one JSON document over a pipe; the
//            parent SIGKILLs the process group at the deadline. Abnormal
//            child termination is an uncaught_error (worker_crashed).

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "cordon/ast.hpp"
#include "cordon/config.hpp"
#include "cordon/environment.hpp"
#include "cordon/interpreter.hpp"
#include "cordon/types.hpp"

namespace cordon {

// Everything a worker needs. Shared with the worker so an abandoned thread
// never outlives what it reads.
struct ExecutionTask {
  std::shared_ptr<const ast::Module> module;
  ExecutionEnvironment environment;
  // Binds inputs into the fresh interpreter before the first statement.
  std::function<void(Interpreter&)> prepare;
  // Reads the result after normal completion; nullopt = missing or invalid.
  std::function<std::optional<Artifact>(const Interpreter&)> capture;
};

struct ExecutorOptions {
  IsolationMode mode{IsolationMode::thread};
  std::uint64_t max_memory_bytes{0};
  std::uint64_t max_file_descriptors{64};
  bool enforce_network_isolation{true};
};

/**
 * @brief Runs `task` with a deadline of `timeout` from now.
 * @param token Optional caller cancellation, polled like the deadline.
 */
RawOutcome run_bounded(std::shared_ptr<const ExecutionTask> task, std::chrono::milliseconds timeout,
                       std::shared_ptr<CancellationToken> token, const ExecutorOptions& options = {});

// Runs `task` on the calling thread; the building block of both modes.
RawOutcome run_in_place(const ExecutionTask& task, const ExecutionControl& control);

std::string raw_outcome_to_json(const RawOutcome& outcome);
std::optional<RawOutcome> raw_outcome_from_json(const std::string& text);

}  // namespace cordon
