#include <evalbox/config.h>

#include <string>

ExecutorConfig::ExecutorConfig(long timeout_seconds, long memory_limit_mb) :
    timeout_seconds_(timeout_seconds),
    memory_limit_mb_(memory_limit_mb) {
  if (timeout_seconds_ <= 0) {
    throw ConfigurationError("Timeout must be positive, got " + std::to_string(timeout_seconds_));
  }
  if (memory_limit_mb_ <= 0) {
    throw ConfigurationError("Memory limit must be positive, got " + std::to_string(memory_limit_mb_));
  }
}
