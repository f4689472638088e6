#ifndef INCLUDE_EVALBOX_CONFIG_H_
#define INCLUDE_EVALBOX_CONFIG_H_

#include <stdexcept>

class ConfigurationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Limits of one execution; validated on construction and immutable afterwards
class ExecutorConfig {
  long timeout_seconds_;
  long memory_limit_mb_;
 public:
  // throws ConfigurationError if any value is not positive
  ExecutorConfig(long timeout_seconds = 300, long memory_limit_mb = 1024);

  long timeout_seconds() const { return timeout_seconds_; }
  long memory_limit_mb() const { return memory_limit_mb_; }
};

#endif  // INCLUDE_EVALBOX_CONFIG_H_
