#ifndef INCLUDE_EVALBOX_LOGGER_H_
#define INCLUDE_EVALBOX_LOGGER_H_

#include <spdlog/spdlog.h>

// 0 = warn, 1 = info, 2+ = debug
spdlog::level::level_enum VerbosityToLevel(int verbosity);
void InitLogger(int verbosity, const char* pattern = "[%t] %+");

#endif  // INCLUDE_EVALBOX_LOGGER_H_
