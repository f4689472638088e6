#include "server_limits.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace {

void ValidateBounds(const char* name, long min, long def, long max) {
  if (min <= 0 || min > def || def > max) {
    throw std::invalid_argument(fmt::format(
        "Invalid {} bounds: min={} default={} max={} (need 0 < min <= default <= max)", name, min, def, max));
  }
}

} // namespace

void ServerLimits::Validate() const {
  ValidateBounds("timeout", min_timeout_seconds, default_timeout_seconds, max_timeout_seconds);
  ValidateBounds("memory", min_memory_mb, default_memory_mb, max_memory_mb);
}

ExecutorConfig ServerLimits::Resolve(std::optional<long> timeout_seconds, std::optional<long> memory_mb) const {
  long timeout = timeout_seconds ?
      std::clamp(*timeout_seconds, min_timeout_seconds, max_timeout_seconds) : default_timeout_seconds;
  long memory = memory_mb ? std::clamp(*memory_mb, min_memory_mb, max_memory_mb) : default_memory_mb;
  return ExecutorConfig(timeout, memory);
}

nlohmann::json ServerLimits::ToJson(bool memory_limit_enforced) const {
  return {
    {"min_timeout_seconds", min_timeout_seconds},
    {"max_timeout_seconds", max_timeout_seconds},
    {"default_timeout_seconds", default_timeout_seconds},
    {"min_memory_mb", min_memory_mb},
    {"max_memory_mb", max_memory_mb},
    {"default_memory_mb", default_memory_mb},
    {"memory_limit_enforced", memory_limit_enforced},
  };
}
