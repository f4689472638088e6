#ifndef INCLUDE_EVALBOX_PATHS_H_
#define INCLUDE_EVALBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// directory containing evalbox-worker; set from configuration or by tests
extern fs::path kDataDir;

} // internal

fs::path WorkerPath();

#endif  // INCLUDE_EVALBOX_PATHS_H_
