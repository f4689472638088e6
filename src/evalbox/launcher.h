#ifndef EVALBOX_LAUNCHER_H_
#define EVALBOX_LAUNCHER_H_

#include <sys/types.h>

#include <evalbox/execution.h>

// Owns a running worker process (leader of its own process group) and the read end of its result channel.
// Consumed by Reconcile(); if destroyed while still owning a worker, the worker group is killed and reaped.
class WorkerHandle {
  pid_t pid_;
  int channel_fd_;
 public:
  WorkerHandle(pid_t pid, int channel_fd) : pid_(pid), channel_fd_(channel_fd) {}
  WorkerHandle(WorkerHandle&& x) noexcept : pid_(x.pid_), channel_fd_(x.channel_fd_) {
    x.pid_ = -1;
    x.channel_fd_ = -1;
  }
  WorkerHandle(const WorkerHandle&) = delete;
  WorkerHandle& operator=(const WorkerHandle&) = delete;
  WorkerHandle& operator=(WorkerHandle&&) = delete;
  ~WorkerHandle();

  pid_t Pid() const { return pid_; }
  int ChannelFd() const { return channel_fd_; }
  // called after the worker has been reaped
  void Release();
};

// Spawn evalbox-worker bound to a fresh result channel and hand it the request.
// Returns right after the process is created; throws std::system_error on failure.
WorkerHandle Launch(const ExecutorConfig&, const ExecutionRequest&);

#endif  // EVALBOX_LAUNCHER_H_
