#ifndef INCLUDE_EVALBOX_UTILS_H_
#define INCLUDE_EVALBOX_UTILS_H_

#include <string>
#include "execution.h"

const char* ErrorKindName(ErrorKind);
const char* ErrorKindToDesc(ErrorKind);
// unknown names are regarded as EXECUTION_FAILED
ErrorKind ErrorKindFromName(const std::string&);

#endif  // INCLUDE_EVALBOX_UTILS_H_
