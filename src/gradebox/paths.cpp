#include "paths.h"

fs::path kBoxRoot = "/tmp/gradebox_box";

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

} // namespace

fs::path WorkspaceSource(const fs::path& workspace, const LanguageSpec& spec) {
  return workspace / spec.source_name;
}

fs::path WorkspaceBinary(const fs::path& workspace, const LanguageSpec& spec) {
  return workspace / spec.binary_name;
}

fs::path WorkspaceRunDir(const fs::path& workspace, long seq) {
  return workspace / ("run" + PadInt(seq, 3));
}

fs::path WorkspaceTemplate(long id) {
  return kBoxRoot / ("ws" + PadInt(id, 6) + "_XXXXXX");
}
