#ifndef CODEBOX_SANDBOX_EXEC_H_
#define CODEBOX_SANDBOX_EXEC_H_

#include <sys/types.h>

#include "sandbox.h"

// We separate this from sandbox.h because this function needs libcodebox and other logging functions,
//   while we need to keep sandbox.h as small as possible (it is linked into sandbox-exec)

// fds as seen by the sandbox-exec helper
constexpr int kHelperReportFd = 3, kHelperStdoutFd = 4, kHelperStderrFd = 5;

// A running sandbox-exec helper. All fds are owned by the caller (read ends, non-blocking):
//   result_fd: receives the raw cjail_result once the jail has finished
//   stdout_fd/stderr_fd: the jailed program's stdout/stderr
//   report_fd: fd 3 inside the jail
struct SandboxProcess {
  pid_t pid;
  int uid;
  int result_fd, stdout_fd, stderr_fd, report_fd;

  SandboxProcess() : pid(-1), uid(-1), result_fd(-1), stdout_fd(-1), stderr_fd(-1), report_fd(-1) {}
  void CloseFds();
};

// before SandboxSpawn:
// 1. create the box dir and everything the jail reads, owned by root
// 2. mount the scratch tmpfs, owned by the slot uid
// assign uid,gid,boxdir accordingly; fd_output/fd_error/fd_input are overridden
bool SandboxSpawn(const SandboxOptions&, SandboxProcess&);

#endif  // CODEBOX_SANDBOX_EXEC_H_
