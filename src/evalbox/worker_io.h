#ifndef EVALBOX_WORKER_IO_H_
#define EVALBOX_WORKER_IO_H_

#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include <evalbox/execution.h>

// Launcher -> worker, written to the worker's stdin
struct WorkerRequest {
  ExecutionRequest request;
  long memory_limit_mb;
};

// Worker -> launcher, written to kChannelFd; untyped until reconciled
struct RawWorkerOutcome {
  bool success;
  std::string stdout_text, stderr_text;
  double memory_used_mb;
  std::optional<nlohmann::json> final_locals;
  std::optional<std::string> error_kind, error_message;
  bool memory_limit_applied;

  RawWorkerOutcome() : success(false), memory_used_mb(0), memory_limit_applied(false) {}
};

constexpr int kChannelFd = 3;

std::string SerializeRequest(const WorkerRequest&);
std::optional<WorkerRequest> ParseRequest(const std::string&);
std::string SerializeOutcome(const RawWorkerOutcome&);
std::optional<RawWorkerOutcome> ParseOutcome(const std::string&);

// Frames are a native long (length) followed by the payload;
// platform dependent, only intended for the same machine
bool WriteFrame(int fd, const std::string& payload);
// blocking; nullopt on EOF before a complete frame or on error
std::optional<std::string> ReadFrame(int fd);
// decode a frame from bytes already read; nullopt if truncated or oversized
std::optional<std::string> DecodeFrame(const std::string& buf);

#endif  // EVALBOX_WORKER_IO_H_
