#include "reconciler.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <thread>
#include <cstring>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils.h"
#include "worker_io.h"

namespace {

constexpr std::chrono::milliseconds kPollSlice(50);
constexpr std::chrono::milliseconds kReapInterval(10);
// a snippet writing garbage into the channel must not exhaust our memory
constexpr size_t kMaxChannelBytes = 256UL * 1024 * 1024;

// Read whatever is available on the channel; returns false on EOF
bool DrainChannel(int fd, std::string& buf, bool& overflow) {
  char tmp[65536];
  while (true) {
    ssize_t ret = read(fd, tmp, sizeof(tmp));
    if (ret < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
      spdlog::warn("Failed reading worker channel: {}", strerror(errno));
      return false;
    }
    if (ret == 0) return false;
    if (buf.size() + ret > kMaxChannelBytes) {
      overflow = true;
    } else {
      buf.append(tmp, ret);
    }
  }
}

// detect exit without reaping, so that the process group id stays reserved until Reap()
bool HasExited(pid_t pid) {
  siginfo_t info = {};
  while (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
    if (errno != EINTR) return true;
  }
  return info.si_pid == pid;
}

// kill whatever is left in the worker's group (including the snippet's descendants) and reap the worker
int Reap(pid_t pid) {
  int status = 0;
  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  return status;
}

struct Channel {
  int fd;
  std::string buf;
  bool open = true, overflow = false;

  explicit Channel(int fd) : fd(fd) {}

  // wait at most slice for data (or just sleep once the channel is at EOF)
  void Wait(SteadyClock::duration slice) {
    if (open) {
      struct pollfd pfd = {fd, POLLIN, 0};
      int wait_ms = std::max<long>(1, std::chrono::ceil<std::chrono::milliseconds>(slice).count());
      if (poll(&pfd, 1, wait_ms) > 0) open = DrainChannel(fd, buf, overflow);
    } else {
      std::this_thread::sleep_for(std::min<SteadyClock::duration>(slice, kReapInterval));
    }
  }
  void DrainRest() {
    if (open) open = DrainChannel(fd, buf, overflow);
  }
  std::optional<RawWorkerOutcome> Outcome() const {
    if (overflow) return std::nullopt;
    auto payload = DecodeFrame(buf);
    if (!payload) return std::nullopt;
    return ParseOutcome(*payload);
  }
};

// SIGTERM the whole group, give it kTerminateGrace to report, then SIGKILL
int TerminateWorker(pid_t pid, Channel& channel) {
  spdlog::debug("Sending SIGTERM to worker group {}", pid);
  kill(-pid, SIGTERM);
  auto grace_deadline = SteadyClock::now() + kTerminateGrace;
  while (true) {
    auto now = SteadyClock::now();
    if (now >= grace_deadline) break;
    channel.Wait(std::min<SteadyClock::duration>(grace_deadline - now, kReapInterval));
    if (HasExited(pid)) {
      channel.DrainRest();
      return Reap(pid);
    }
  }
  spdlog::warn("Worker pid={} survived SIGTERM; sending SIGKILL", pid);
  return Reap(pid);
}

} // namespace

ExecutionResult OutcomeToResult(const RawWorkerOutcome& outcome, double execution_time_seconds) {
  ExecutionResult ret;
  ret.success = outcome.success;
  ret.captured_stdout = outcome.stdout_text;
  ret.captured_stderr = outcome.stderr_text;
  ret.execution_time_seconds = execution_time_seconds;
  ret.memory_used_mb = outcome.memory_used_mb;
  ret.memory_limit_applied = outcome.memory_limit_applied;
  if (outcome.success) {
    ret.final_locals = outcome.final_locals;
  } else {
    ErrorKind kind = outcome.error_kind ? ErrorKindFromName(*outcome.error_kind) : ErrorKind::EXECUTION_FAILED;
    ret.error = ExecutionError{kind, outcome.error_message.value_or("Unknown error")};
  }
  return ret;
}

ExecutionResult Reconcile(WorkerHandle&& handle, long timeout_seconds) {
  WorkerHandle worker(std::move(handle));
  const pid_t pid = worker.Pid();
  Channel channel(worker.ChannelFd());
  auto start = SteadyClock::now();
  auto deadline = start + std::chrono::seconds(timeout_seconds);
  fcntl(channel.fd, F_SETFL, fcntl(channel.fd, F_GETFL) | O_NONBLOCK);

  bool exited = false;
  while (true) {
    auto now = SteadyClock::now();
    if (now >= deadline) break;
    channel.Wait(std::min<SteadyClock::duration>(deadline - now, kPollSlice));
    // a descendant may hold the channel open after the worker is gone, so we don't rely on EOF alone
    if (HasExited(pid)) {
      exited = true;
      channel.DrainRest();
      break;
    }
  }
  double elapsed = SecondsSince(start);

  if (!exited) {
    spdlog::warn("Worker pid={} exceeded timeout of {}s", pid, timeout_seconds);
    int status = TerminateWorker(pid, channel);
    worker.Release();
    spdlog::debug("Worker pid={} {}", pid, DescribeWaitStatus(status));
    auto ret = ExecutionResult::Failure(
        ErrorKind::TIMEOUT, fmt::format("Code execution timeout after {} seconds", timeout_seconds), elapsed);
    // output the snippet produced before it was terminated
    if (auto outcome = channel.Outcome()) {
      ret.captured_stdout = std::move(outcome->stdout_text);
      ret.captured_stderr = std::move(outcome->stderr_text);
      ret.memory_used_mb = outcome->memory_used_mb;
      ret.memory_limit_applied = outcome->memory_limit_applied;
    }
    return ret;
  }
  int status = Reap(pid);
  worker.Release();
  spdlog::debug("Worker pid={} {} after {:.3f}s, channel bytes={}",
                pid, DescribeWaitStatus(status), elapsed, channel.buf.size());

  auto outcome = channel.Outcome();
  if (!outcome) {
    spdlog::warn("Worker pid={} {} without reporting an outcome", pid, DescribeWaitStatus(status));
    return ExecutionResult::Failure(
        ErrorKind::EXECUTION_FAILED,
        fmt::format("Code execution failed without error message (worker {})", DescribeWaitStatus(status)),
        elapsed);
  }
  if (!outcome->memory_limit_applied) {
    spdlog::warn("Worker pid={} ran without an enforced memory limit", pid);
  }
  return OutcomeToResult(*outcome, elapsed);
}
