#include "launcher.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <mutex>
#include <cstring>
#include <system_error>

#include <spdlog/spdlog.h>
#include <evalbox/paths.h>
#include "utils.h"
#include "worker_io.h"

namespace {

std::once_flag sigpipe_flag;

// A worker dying before it reads the request must not kill us by SIGPIPE
void IgnoreSigpipe() {
  std::call_once(sigpipe_flag, []() {
    spdlog::debug("Ignoring SIGPIPE");
    signal(SIGPIPE, SIG_IGN);
  });
}

[[noreturn]] void ThrowErrno(const char* what) {
  throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

WorkerHandle::~WorkerHandle() {
  if (pid_ > 0) {
    spdlog::warn("Worker pid={} abandoned before reconciliation; killing", pid_);
    kill(-pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
  }
  if (channel_fd_ >= 0) close(channel_fd_);
}

void WorkerHandle::Release() {
  pid_ = -1;
  if (channel_fd_ >= 0) close(channel_fd_);
  channel_fd_ = -1;
}

WorkerHandle Launch(const ExecutorConfig& config, const ExecutionRequest& request) {
  IgnoreSigpipe();
  // everything the child needs is prepared before fork
  std::string worker = WorkerPath();
  std::string payload = SerializeRequest({request, config.memory_limit_mb()});
  char* const argv[] = {const_cast<char*>("evalbox-worker"), nullptr};

  // O_CLOEXEC: workers launched concurrently must not inherit each other's pipes
  int inpipe[2], chanpipe[2];
  if (pipe2(inpipe, O_CLOEXEC) < 0) ThrowErrno("pipe");
  if (pipe2(chanpipe, O_CLOEXEC) < 0) {
    int err = errno;
    close(inpipe[0]);
    close(inpipe[1]);
    errno = err;
    ThrowErrno("pipe");
  }
  int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
  pid_t pid = devnull < 0 ? -1 : fork();
  if (pid < 0) {
    int err = errno;
    for (int fd : {inpipe[0], inpipe[1], chanpipe[0], chanpipe[1], devnull}) {
      if (fd >= 0) close(fd);
    }
    errno = err;
    ThrowErrno("fork");
  }
  if (pid == 0) {
    // only async-signal-safe calls from here
    setpgid(0, 0);
    if (dup2(inpipe[0], 0) < 0 || dup2(devnull, 1) < 0 || dup2(chanpipe[1], kChannelFd) < 0) _exit(126);
    execv(worker.c_str(), argv);
    _exit(127);
  }
  // also set from the parent so that kill(-pid) is valid as soon as we return
  setpgid(pid, pid);
  close(inpipe[0]);
  close(chanpipe[1]);
  close(devnull);
  spdlog::debug("Worker launched pid={} channel={} code_length={} memory_limit_mb={}",
                pid, chanpipe[0], request.code.size(), config.memory_limit_mb());
  WorkerHandle handle(pid, chanpipe[0]);
  if (!WriteFrame(inpipe[1], payload)) {
    // the worker exits without an outcome; the reconciler reports it
    spdlog::warn("Failed to send request to worker pid={}: {}", pid, strerror(errno));
  }
  close(inpipe[1]);
  return handle;
}
