#ifndef GRADEBOX_UTILS_H_
#define GRADEBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <gradebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// close every fd >= minfd; async-signal-safe when close_range is available
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

#endif  // GRADEBOX_UTILS_H_
