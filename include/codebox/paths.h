#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// every execution gets kBoxRoot/<execution id> as its chroot
extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

#endif  // INCLUDE_CODEBOX_PATHS_H_
