#include "workspace.h"

#include <stdlib.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>
#include "paths.h"

Workspace::Workspace() : id_(GetUniqueExecutionId()) {
  if (!CreateDirs(kBoxRoot)) return;
  std::string tpl = WorkspaceTemplate(id_);
  char* res = mkdtemp(tpl.data());
  if (!res) {
    spdlog::warn("mkdtemp {} failed: {}", tpl, strerror(errno));
    return;
  }
  path_ = res;
  spdlog::debug("Workspace {} created at {}", id_, path_.c_str());
}

Workspace::~Workspace() {
  if (path_.empty()) return;
  RemoveAll(path_);
  spdlog::debug("Workspace {} removed", id_);
}

RunDirectory::RunDirectory(fs::path path) {
  if (!CreateDirs(path, kPerm755)) return;
  path_ = std::move(path);
}

RunDirectory::~RunDirectory() {
  if (!path_.empty()) RemoveAll(path_);
}
