#include "utils.h"

#include <fmt/format.h>
#include <evalbox/utils.h>

ExecutionResult RunCode(const std::string& code, long timeout, long memory_mb, bool capture_final_locals) {
  return RunRequest(ExecutionRequest(code, capture_final_locals), timeout, memory_mb);
}

ExecutionResult RunRequest(const ExecutionRequest& request, long timeout, long memory_mb) {
  return Execute(ExecutorConfig(timeout, memory_mb), request);
}

std::string Describe(const ExecutionResult& res) {
  return fmt::format("success={} error={} message='{}' stdout='{}' stderr='{}'",
      res.success, res.error ? ErrorKindName(res.error->kind) : "none",
      res.error ? res.error->message : "", res.captured_stdout, res.captured_stderr);
}

::testing::AssertionResult Succeeded(const ExecutionResult& res) {
  if (res.success && !res.error) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure() << Describe(res);
}

::testing::AssertionResult FailedWith(const ExecutionResult& res, ErrorKind kind) {
  if (!res.success && res.error && res.error->kind == kind) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure() << "expected " << ErrorKindName(kind) << ", got " << Describe(res);
}
