#include <evalbox/paths.h>

namespace internal {
fs::path kDataDir = fs::path(EVALBOX_DATA_DIR);
} // internal

fs::path WorkerPath() {
  return internal::kDataDir / "evalbox-worker";
}
