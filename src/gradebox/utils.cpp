#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToKey, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageId, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG1(MemoryPolicy, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* MemoryPolicyName, MemoryPolicy, ENUM_MEMORY_POLICY_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

bool IsStudentVisible(Outcome outcome) {
  return (int)outcome < (int)Outcome::UNSUPPORTED_LANGUAGE;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}
