#include "paths.h"

fs::path kBoxRoot = "/tmp/codebox";

namespace internal {
fs::path kDataDir = fs::path(CODEBOX_DATA_DIR);
} // internal

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path BoxPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}

// read-only for the jail uid
fs::path BoxHarnessDir(long id, bool inside_box) {
  return BoxRoot(BoxPath(id), inside_box) / "harness";
}
fs::path BoxRunner(long id, bool inside_box) {
  return BoxHarnessDir(id, inside_box) / "run.py";
}
fs::path BoxChecker(long id, bool inside_box) {
  return BoxHarnessDir(id, inside_box) / "check.py";
}
fs::path BoxCode(long id, bool inside_box) {
  return BoxHarnessDir(id, inside_box) / "code.py";
}
fs::path BoxBindings(long id, bool inside_box) {
  return BoxHarnessDir(id, inside_box) / "bindings.json";
}

// tmpfs, the only place writable by the jail uid
fs::path BoxScratch(long id, bool inside_box) {
  return BoxRoot(BoxPath(id), inside_box) / "scratch";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}
