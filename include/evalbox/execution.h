#ifndef INCLUDE_EVALBOX_EXECUTION_H_
#define INCLUDE_EVALBOX_EXECUTION_H_

#include <queue>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <future>
#include <optional>
#include <condition_variable>

#include <nlohmann/json.hpp>
#include "config.h"

// the caller-visible reason of a failed execution
#define ENUM_ERROR_KIND_ \
  X(SYNTAX, "Syntax Error") \
  X(NAME, "Undefined Name") \
  X(VALUE, "Value Error") \
  X(ZERO_DIVISION, "Division by Zero") \
  X(MEMORY_LIMIT, "Memory Limit Exceeded") \
  X(TIMEOUT, "Time Limit Exceeded") \
  X(EXECUTION_FAILED, "Execution Failed")
enum class ErrorKind {
#define X(name, desc) name,
  ENUM_ERROR_KIND_
#undef X
};

struct ExecutionError {
  ErrorKind kind;
  std::string message;
};

class ExecutionRequest {
 public:
  std::string code;
  // name -> value mappings; must be JSON objects if present
  std::optional<nlohmann::json> initial_globals, initial_locals;
  bool capture_final_locals;

  ExecutionRequest() : capture_final_locals(false) {}
  ExecutionRequest(std::string code, bool capture_final_locals = false) :
      code(std::move(code)), capture_final_locals(capture_final_locals) {}
};

class ExecutionResult {
 public:
  bool success;
  std::string captured_stdout, captured_stderr;
  std::optional<ExecutionError> error;
  double execution_time_seconds;
  double memory_used_mb;
  // whether the worker ran under the address space limit; the limit is advisory otherwise
  bool memory_limit_applied;
  std::optional<nlohmann::json> final_locals; // only set on request

  ExecutionResult() :
      success(false), execution_time_seconds(0), memory_used_mb(0), memory_limit_applied(false) {}

  static ExecutionResult Failure(ErrorKind kind, std::string message, double execution_time_seconds) {
    ExecutionResult ret;
    ret.error = ExecutionError{kind, std::move(message)};
    ret.execution_time_seconds = execution_time_seconds;
    return ret;
  }
};

// Run one snippet in a fresh worker process and wait for it (at most timeout + grace period).
// Faults of the snippet or of the worker are reported inside the result; this never throws for them.
ExecutionResult Execute(const ExecutorConfig&, const ExecutionRequest&);

// Runs Execute on background threads so that callers serving other requests are not blocked
class ExecutionPool {
  std::vector<std::thread> threads_;
  std::queue<std::packaged_task<ExecutionResult()>> tasks_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_;

  void WorkLoop_();
 public:
  explicit ExecutionPool(size_t num_threads);
  ~ExecutionPool();
  ExecutionPool(const ExecutionPool&) = delete;
  ExecutionPool& operator=(const ExecutionPool&) = delete;

  std::future<ExecutionResult> Submit(ExecutorConfig, ExecutionRequest);
  size_t QueueSize();
};

// Whether this host supports an address space limit at all. Constant on Linux;
// ExecutionResult::memory_limit_applied tells whether a given run actually got it.
bool MemoryLimitSupported();
// Whether the worker executable is present in the data directory
bool WorkerAvailable();

#endif  // INCLUDE_EVALBOX_EXECUTION_H_
