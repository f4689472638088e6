#include "utils.h"

#include <string.h>
#include <sys/wait.h>

#include <fmt/format.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG1(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindToDesc, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kErrorKindNameTable[] = {
#define X(name, desc) #name,
  ENUM_ERROR_KIND_
#undef X
};

ErrorKind ErrorKindFromName(const std::string& str) {
  for (size_t i = 0; i < sizeof(kErrorKindNameTable) / sizeof(kErrorKindNameTable[0]); i++) {
    if (str == kErrorKindNameTable[i]) return (ErrorKind)i;
  }
  return ErrorKind::EXECUTION_FAILED;
}

std::string DescribeWaitStatus(int status) {
  if (WIFEXITED(status)) return fmt::format("exited with status {}", WEXITSTATUS(status));
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    return fmt::format("killed by signal {} ({})", sig, strsignal(sig));
  }
  return fmt::format("ended with wait status {}", status);
}
