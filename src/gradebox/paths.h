#ifndef GRADEBOX_PATHS_H_
#define GRADEBOX_PATHS_H_

#include <gradebox/paths.h>
#include <gradebox/languages.h>

// inside a workspace created by Workspace (see workspace.h)
fs::path WorkspaceSource(const fs::path& workspace, const LanguageSpec&);
fs::path WorkspaceBinary(const fs::path& workspace, const LanguageSpec&);
// working directory of the seq-th execution; removed after the run
fs::path WorkspaceRunDir(const fs::path& workspace, long seq);
// template for mkdtemp
fs::path WorkspaceTemplate(long id);

#endif  // GRADEBOX_PATHS_H_
