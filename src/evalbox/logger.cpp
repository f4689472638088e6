#include <evalbox/logger.h>

spdlog::level::level_enum VerbosityToLevel(int verbosity) {
  switch (verbosity) {
    case 0: return spdlog::level::warn;
    case 1: return spdlog::level::info;
    default: return spdlog::level::debug;
  }
}

void InitLogger(int verbosity, const char* pattern) {
  spdlog::set_pattern(pattern);
  spdlog::set_level(VerbosityToLevel(verbosity));
  spdlog::debug("Logger initialized, level={}", spdlog::level::to_string_view(spdlog::get_level()));
}
