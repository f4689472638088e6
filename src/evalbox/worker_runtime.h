#ifndef EVALBOX_WORKER_RUNTIME_H_
#define EVALBOX_WORKER_RUNTIME_H_

#include <optional>

#include "worker_io.h"

// These run inside evalbox-worker only; they are not meant to be called from the launching process.

// Best-effort RLIMIT_AS; returns false if the host refused it, in which case the limit is advisory only
bool ApplyMemoryLimit(long memory_limit_mb);

// Initialize the interpreter and run the snippet to completion, classifying any fault.
// nullopt if the interpreter could not even be started.
std::optional<RawWorkerOutcome> RunSnippet(const WorkerRequest&, bool memory_limit_applied);

#endif  // EVALBOX_WORKER_RUNTIME_H_
