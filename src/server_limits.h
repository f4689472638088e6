#ifndef SERVER_LIMITS_H_
#define SERVER_LIMITS_H_

#include <optional>

#include <nlohmann/json_fwd.hpp>
#include <evalbox/config.h>

// Server-wide bounds for per-request limits
class ServerLimits {
 public:
  long min_timeout_seconds, max_timeout_seconds, default_timeout_seconds;
  long min_memory_mb, max_memory_mb, default_memory_mb;

  ServerLimits() :
      min_timeout_seconds(1), max_timeout_seconds(300), default_timeout_seconds(30),
      min_memory_mb(64), max_memory_mb(2048), default_memory_mb(512) {}

  // requires 0 < min <= default <= max; throws std::invalid_argument otherwise
  void Validate() const;
  // absent values take the default, present values are clamped into [min, max]
  ExecutorConfig Resolve(std::optional<long> timeout_seconds, std::optional<long> memory_mb) const;
  nlohmann::json ToJson(bool memory_limit_enforced) const;
};

#endif  // SERVER_LIMITS_H_
