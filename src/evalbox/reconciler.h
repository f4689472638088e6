#ifndef EVALBOX_RECONCILER_H_
#define EVALBOX_RECONCILER_H_

#include <chrono>

#include <evalbox/execution.h>
#include "launcher.h"
#include "worker_io.h"

// how long a worker may take to exit after SIGTERM before it is killed
constexpr std::chrono::milliseconds kTerminateGrace(1000);

// Wait for the worker at most timeout_seconds, escalate termination on overrun,
// and turn whatever the worker reported (or failed to report) into a typed result.
// Always returns within timeout_seconds + kTerminateGrace + teardown.
ExecutionResult Reconcile(WorkerHandle&& handle, long timeout_seconds);

// exposed for testing
ExecutionResult OutcomeToResult(const RawWorkerOutcome&, double execution_time_seconds);

#endif  // EVALBOX_RECONCILER_H_
