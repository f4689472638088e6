#include <evalbox/execution.h>

#include <unistd.h>
#include <sys/resource.h>
#include <system_error>

#include <spdlog/spdlog.h>
#include <evalbox/paths.h>
#include "utils.h"
#include "launcher.h"
#include "reconciler.h"

ExecutionResult Execute(const ExecutorConfig& config, const ExecutionRequest& request) {
  auto start = SteadyClock::now();
  ExecutionResult ret;
  try {
    ret = Reconcile(Launch(config, request), config.timeout_seconds());
  } catch (const std::system_error& err) {
    spdlog::warn("Failed to launch worker: {}", err.what());
    return ExecutionResult::Failure(ErrorKind::EXECUTION_FAILED,
        std::string("Failed to launch worker process: ") + err.what(), SecondsSince(start));
  }
  spdlog::info("Execution finished: success={} error={} time={:.3f}s memory={:.1f}MB",
               ret.success, ret.error ? ErrorKindName(ret.error->kind) : "none",
               ret.execution_time_seconds, ret.memory_used_mb);
  return ret;
}

ExecutionPool::ExecutionPool(size_t num_threads) : stop_(false) {
  if (num_threads == 0) num_threads = 1;
  for (size_t i = 0; i < num_threads; i++) threads_.emplace_back(&ExecutionPool::WorkLoop_, this);
  spdlog::debug("Execution pool started with {} threads", num_threads);
}

ExecutionPool::~ExecutionPool() {
  {
    std::lock_guard lck(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto& i : threads_) i.join();
}

void ExecutionPool::WorkLoop_() {
  while (true) {
    std::packaged_task<ExecutionResult()> task;
    {
      std::unique_lock lck(mtx_);
      cv_.wait(lck, [this]() { return stop_ || !tasks_.empty(); });
      // pending tasks are still run on shutdown so that no future is left without a result
      if (tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

std::future<ExecutionResult> ExecutionPool::Submit(ExecutorConfig config, ExecutionRequest request) {
  std::packaged_task<ExecutionResult()> task(
      [config = std::move(config), request = std::move(request)]() { return Execute(config, request); });
  auto ret = task.get_future();
  {
    std::lock_guard lck(mtx_);
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return ret;
}

size_t ExecutionPool::QueueSize() {
  std::lock_guard lck(mtx_);
  return tasks_.size();
}

bool MemoryLimitSupported() {
  struct rlimit lim;
  return getrlimit(RLIMIT_AS, &lim) == 0;
}

bool WorkerAvailable() {
  return access(WorkerPath().c_str(), X_OK) == 0;
}
