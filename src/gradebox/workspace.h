#ifndef GRADEBOX_WORKSPACE_H_
#define GRADEBOX_WORKSPACE_H_

#include "utils.h"

// RAII private directory under kBoxRoot; removed with everything inside on destruction
class Workspace {
  long id_;
  fs::path path_;
 public:
  Workspace();
  ~Workspace();
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  bool Valid() const { return !path_.empty(); }
  long Id() const { return id_; }
  const fs::path& Path() const { return path_; }
};

// A subdirectory of a workspace that lives for a single execution
class RunDirectory {
  fs::path path_;
 public:
  explicit RunDirectory(fs::path path);
  ~RunDirectory();
  RunDirectory(const RunDirectory&) = delete;
  RunDirectory& operator=(const RunDirectory&) = delete;

  bool Valid() const { return !path_.empty(); }
  const fs::path& Path() const { return path_; }
};

#endif  // GRADEBOX_WORKSPACE_H_
