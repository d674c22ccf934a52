#include "cordon/executor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <sched.h>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>

#include "cordon/dataset.hpp"
#include "cordon/interpreter.hpp"
#include "cordon/jsonlite.hpp"

namespace cordon {

namespace {

// Upper bound on the outcome document a child may send.
constexpr std::size_t kMaxFrameBytes = 64 * 1024 * 1024;

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count());
}

RawOutcome uncaught(std::string message, ErrorCode code) {
  RawOutcome out;
  out.kind = RawOutcomeKind::uncaught_error;
  out.message = std::move(message);
  out.error_code = code;
  return out;
}

RawOutcome timed_out() {
  RawOutcome out;
  out.kind = RawOutcomeKind::timed_out;
  out.error_code = ErrorCode::timeout;
  return out;
}

const char* raw_kind_name(RawOutcomeKind kind) {
  switch (kind) {
    case RawOutcomeKind::normal_completion: return "normal_completion";
    case RawOutcomeKind::uncaught_error: return "uncaught_error";
    case RawOutcomeKind::timed_out: return "timed_out";
  }
  return "uncaught_error";
}

ErrorCode error_code_from_string(const std::string& s) {
  for (ErrorCode code : {ErrorCode::invalid_request, ErrorCode::validation_rejected, ErrorCode::import_blocked,
                         ErrorCode::attribute_blocked, ErrorCode::runtime_error, ErrorCode::missing_result,
                         ErrorCode::timeout, ErrorCode::cancelled, ErrorCode::resource_exhausted,
                         ErrorCode::worker_crashed, ErrorCode::spawn_failed, ErrorCode::config_invalid}) {
    if (to_string(code) == s) return code;
  }
  return ErrorCode::none;
}

// ---------------------------------------------------------------------------
// thread mode
// ---------------------------------------------------------------------------

struct SharedResult {
  std::mutex mu;
  std::condition_variable cv;
  bool done{false};
  RawOutcome outcome;
};

RawOutcome run_thread(std::shared_ptr<const ExecutionTask> task, std::chrono::milliseconds timeout,
                      std::shared_ptr<CancellationToken> token) {
  auto state = std::make_shared<SharedResult>();
  auto stop = std::make_shared<std::atomic<bool>>(false);
  const auto start = std::chrono::steady_clock::now();

  std::thread worker;
  try {
    worker = std::thread([task, state, stop, token] {
      RawOutcome outcome = run_in_place(*task, ExecutionControl{stop, token});
      std::lock_guard<std::mutex> lk(state->mu);
      state->outcome = std::move(outcome);
      state->done = true;
      state->cv.notify_all();
    });
  } catch (const std::system_error& e) {
    return uncaught(std::string("SpawnFailed: ") + e.what(), ErrorCode::spawn_failed);
  }

  std::unique_lock<std::mutex> lk(state->mu);
  const bool finished = state->cv.wait_until(lk, start + timeout, [&] { return state->done; });
  if (!finished) {
    stop->store(true, std::memory_order_relaxed);
    lk.unlock();
    // Abandoned: the worker keeps `task`, `state` and `stop` alive and exits
    // at its next interrupt check.
    worker.detach();
    RawOutcome out = timed_out();
    out.run_ns = elapsed_ns(start);
    return out;
  }
  RawOutcome out = std::move(state->outcome);
  lk.unlock();
  worker.join();
  out.run_ns = elapsed_ns(start);
  return out;
}

// ---------------------------------------------------------------------------
// process mode
// ---------------------------------------------------------------------------

void set_limit(int resource, rlim_t value) {
  struct rlimit rl;
  rl.rlim_cur = value;
  rl.rlim_max = value;
  setrlimit(resource, &rl);
}

bool write_all(int fd, const std::string& data) {
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  return true;
}

[[noreturn]] void child_main(const ExecutionTask& task, int fd, std::chrono::milliseconds timeout,
                             const ExecutorOptions& options) {
  setsid();
  if (options.enforce_network_isolation) {
    // Needs CAP_SYS_ADMIN on most distributions; best effort.
    unshare(CLONE_NEWNET);
  }
  prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
  if (options.max_memory_bytes > 0) set_limit(RLIMIT_AS, options.max_memory_bytes);
  if (options.max_file_descriptors > 0) set_limit(RLIMIT_NOFILE, options.max_file_descriptors);
  set_limit(RLIMIT_FSIZE, 0);
  set_limit(RLIMIT_CORE, 0);
  {
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>((timeout.count() + 999) / 1000);
    rl.rlim_max = rl.rlim_cur + 1;
    setrlimit(RLIMIT_CPU, &rl);
  }

  // The deadline is the parent's; the child runs without a stop flag.
  const RawOutcome outcome = run_in_place(task, ExecutionControl{});
  const bool ok = write_all(fd, raw_outcome_to_json(outcome));
  close(fd);
  _exit(ok ? 0 : 3);
}

RawOutcome run_process(const std::shared_ptr<const ExecutionTask>& task, std::chrono::milliseconds timeout,
                       const std::shared_ptr<CancellationToken>& token, const ExecutorOptions& options) {
  const auto start = std::chrono::steady_clock::now();
  int pipefd[2];
  if (pipe(pipefd) != 0) return uncaught("SpawnFailed: pipe() failed", ErrorCode::spawn_failed);

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    return uncaught("SpawnFailed: fork() failed", ErrorCode::spawn_failed);
  }
  if (pid == 0) {
    close(pipefd[0]);
    child_main(*task, pipefd[1], timeout, options);
  }

  close(pipefd[1]);
  fcntl(pipefd[0], F_SETFL, O_NONBLOCK);

  const auto deadline = start + timeout;
  std::string frame;
  char buf[4096];
  int status = 0;
  bool expired = false;
  bool cancelled = false;
  bool oversized = false;
  while (true) {
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
      if (frame.size() + static_cast<std::size_t>(n) > kMaxFrameBytes) {
        oversized = true;
        break;
      }
      frame.append(buf, static_cast<std::size_t>(n));
    }
    if (waitpid(pid, &status, WNOHANG) == pid) break;
    cancelled = token && token->cancelled();
    expired = std::chrono::steady_clock::now() >= deadline;
    if (expired || cancelled || oversized) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  if (!expired && !cancelled && !oversized) {
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0 && frame.size() + static_cast<std::size_t>(n) <= kMaxFrameBytes) {
      frame.append(buf, static_cast<std::size_t>(n));
    }
  }
  close(pipefd[0]);

  RawOutcome out;
  if (expired) {
    out = timed_out();
  } else if (cancelled) {
    out = uncaught("cancelled", ErrorCode::cancelled);
  } else if (oversized) {
    out = uncaught("ResourceLimit: result too large", ErrorCode::resource_exhausted);
  } else if (WIFSIGNALED(status)) {
    const int sig = WTERMSIG(status);
    // RLIMIT_CPU delivers SIGXCPU, then SIGKILL at the hard limit.
    out = sig == SIGXCPU ? timed_out()
                         : uncaught("WorkerCrashed: worker terminated by signal " + std::to_string(sig),
                                    ErrorCode::worker_crashed);
  } else if (auto parsed = raw_outcome_from_json(frame); parsed && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    out = std::move(*parsed);
  } else {
    out = uncaught("WorkerCrashed: worker exited with status " +
                       std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1),
                   ErrorCode::worker_crashed);
  }
  out.run_ns = elapsed_ns(start);
  return out;
}

}  // namespace

RawOutcome run_in_place(const ExecutionTask& task, const ExecutionControl& control) {
  RawOutcome out;
  // The interpreter's teardown must run before the outcome is returned, so
  // the output buffer is copied out inside the scope.
  try {
    Interpreter interp(task.environment, control);
    try {
      if (task.prepare) task.prepare(interp);
      interp.run(task.module);
      out.kind = RawOutcomeKind::normal_completion;
      out.output = interp.output();
      if (task.capture) out.artifact = task.capture(interp);
      return out;
    } catch (const ScriptError& e) {
      out = uncaught(e.describe(), ErrorCode::runtime_error);
    } catch (const CapabilityViolation& e) {
      out = uncaught(e.describe(), e.kind() == CapabilityViolation::Kind::import_blocked
                                       ? ErrorCode::import_blocked
                                       : ErrorCode::attribute_blocked);
    } catch (const ResourceLimitExceeded& e) {
      std::string message = std::string("ResourceLimit: ") + e.what();
      if (e.line() > 0) message += " (line " + std::to_string(e.line()) + ")";
      out = uncaught(std::move(message), ErrorCode::resource_exhausted);
    } catch (const ExecutionCancelled& e) {
      out = e.by_caller() ? uncaught("cancelled", ErrorCode::cancelled) : timed_out();
    } catch (const DatasetError& e) {
      out = uncaught(std::string("ValueError: ") + e.what(), ErrorCode::runtime_error);
    }
    out.output = interp.output();
  } catch (const std::bad_alloc&) {
    out = uncaught("MemoryError: out of memory", ErrorCode::resource_exhausted);
  } catch (const std::exception& e) {
    out = uncaught(std::string("InternalError: ") + e.what(), ErrorCode::runtime_error);
  }
  return out;
}

RawOutcome run_bounded(std::shared_ptr<const ExecutionTask> task, std::chrono::milliseconds timeout,
                       std::shared_ptr<CancellationToken> token, const ExecutorOptions& options) {
  if (options.mode == IsolationMode::process) return run_process(task, timeout, token, options);
  return run_thread(std::move(task), timeout, std::move(token));
}

std::string raw_outcome_to_json(const RawOutcome& outcome) {
  jsonlite::Object o;
  o["kind"] = raw_kind_name(outcome.kind);
  o["message"] = outcome.message;
  o["error_code"] = to_string(outcome.error_code);
  o["output"] = outcome.output;
  if (outcome.artifact) {
    std::optional<jsonlite::JsonError> err;
    o["artifact"] = jsonlite::parse_value(outcome.artifact->to_json(), &err);
  }
  return jsonlite::to_json(o);
}

std::optional<RawOutcome> raw_outcome_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(text, &err);
  if (err) return std::nullopt;

  RawOutcome out;
  const std::string kind = jsonlite::get_string(o, "kind");
  if (kind == "normal_completion") {
    out.kind = RawOutcomeKind::normal_completion;
  } else if (kind == "uncaught_error") {
    out.kind = RawOutcomeKind::uncaught_error;
  } else if (kind == "timed_out") {
    out.kind = RawOutcomeKind::timed_out;
  } else {
    return std::nullopt;
  }
  out.message = jsonlite::get_string(o, "message");
  out.error_code = error_code_from_string(jsonlite::get_string(o, "error_code"));
  out.output = jsonlite::get_string(o, "output");
  if (auto it = o.find("artifact"); it != o.end()) {
    out.artifact = artifact_from_json(it->second);
    if (!out.artifact) return std::nullopt;
  }
  return out;
}

}  // namespace cordon
