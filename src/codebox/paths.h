#ifndef CODEBOX_PATHS_H_
#define CODEBOX_PATHS_H_

#include <codebox/paths.h>

// for sandbox
// if inside_box = true, the path is relative to the jail root and id is not used
fs::path BoxPath(long id);
fs::path BoxHarnessDir(long id, bool inside_box = false);
fs::path BoxRunner(long id, bool inside_box = false);
fs::path BoxChecker(long id, bool inside_box = false);
fs::path BoxCode(long id, bool inside_box = false);
fs::path BoxBindings(long id, bool inside_box = false);
fs::path BoxScratch(long id, bool inside_box = false);

fs::path SandboxExecPath();

#endif  // CODEBOX_PATHS_H_
