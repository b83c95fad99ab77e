#ifndef INCLUDE_GRADEBOX_PATHS_H_
#define INCLUDE_GRADEBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// every workspace is a uniquely named directory under this root
extern fs::path kBoxRoot;

#endif  // INCLUDE_GRADEBOX_PATHS_H_
