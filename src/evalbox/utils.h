#ifndef EVALBOX_UTILS_H_
#define EVALBOX_UTILS_H_

#include <chrono>

#include <evalbox/utils.h>

using SteadyClock = std::chrono::steady_clock;

inline double SecondsSince(SteadyClock::time_point start) {
  return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

// human-readable description of a waitpid() status
std::string DescribeWaitStatus(int status);

#endif  // EVALBOX_UTILS_H_
