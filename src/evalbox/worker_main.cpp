#include <unistd.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <evalbox/logger.h>
#include "worker_io.h"
#include "worker_runtime.h"

// Protocol: one request frame on stdin, one outcome frame on kChannelFd.
// Exiting without an outcome is reported as EXECUTION_FAILED by the launching side.
int main() {
  // fd 1 is /dev/null in the worker
  spdlog::set_default_logger(spdlog::stderr_color_mt("worker"));
  InitLogger(0, "[worker %P] %+");
  spdlog::cfg::load_env_levels(); // SPDLOG_LEVEL
  auto payload = ReadFrame(0);
  if (!payload) {
    spdlog::error("Failed to read request");
    return 1;
  }
  close(0);
  auto req = ParseRequest(*payload);
  if (!req) return 1;

  // before the interpreter allocates anything
  bool applied = ApplyMemoryLimit(req->memory_limit_mb);
  const pid_t worker_pid = getpid();
  auto outcome = RunSnippet(*req, applied);
  // a process the snippet forked must not report as well
  if (getpid() != worker_pid) _exit(0);
  if (!outcome) return 1;
  if (!WriteFrame(kChannelFd, SerializeOutcome(*outcome))) {
    spdlog::error("Failed to write outcome");
    _exit(1);
  }
  spdlog::default_logger()->flush();
  // skip interpreter and static teardown
  _exit(0);
}
