#include "sandbox_exec.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"

void SandboxProcess::CloseFds() {
  for (int* fd : {&result_fd, &stdout_fd, &stderr_fd, &report_fd}) {
    if (*fd >= 0) close(*fd);
    *fd = -1;
  }
}

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = (const char*)buf;
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

} // namespace

bool SandboxSpawn(const SandboxOptions& opt, SandboxProcess& proc) {
  // 0: options, 1: result, 2: report, 3: stdout, 4: stderr
  int pipes[5][2];
  int created = 0;
  pid_t pid;
  for (; created < 5; created++) {
    if (pipe2(pipes[created], O_CLOEXEC) < 0) goto err;
  }
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    // move everything out of the way first so that dup2 cannot clobber a source
    int in = fcntl(pipes[0][0], F_DUPFD, 10);
    int out = fcntl(pipes[1][1], F_DUPFD, 10);
    int report = fcntl(pipes[2][1], F_DUPFD, 10);
    int jail_out = fcntl(pipes[3][1], F_DUPFD, 10);
    int jail_err = fcntl(pipes[4][1], F_DUPFD, 10);
    if (in < 0 || out < 0 || report < 0 || jail_out < 0 || jail_err < 0) _exit(127);
    if (dup2(in, 0) < 0 || dup2(out, 1) < 0 || dup2(report, kHelperReportFd) < 0 ||
        dup2(jail_out, kHelperStdoutFd) < 0 || dup2(jail_err, kHelperStderrFd) < 0) {
      _exit(127);
    }
    CloseFrom(kHelperStderrFd + 1);
    auto cmd = SandboxExecPath();
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(127);
  }
  spdlog::debug("sandbox-exec pid={} childpid={} boxdir={} uid={} command={}",
      getpid(), pid, opt.boxdir, opt.uid, fmt::format("{}", opt.command));
  close(pipes[0][0]);
  close(pipes[1][1]);
  close(pipes[2][1]);
  close(pipes[3][1]);
  close(pipes[4][1]);
  proc.pid = pid;
  proc.uid = opt.uid;
  proc.result_fd = pipes[1][0];
  proc.report_fd = pipes[2][0];
  proc.stdout_fd = pipes[3][0];
  proc.stderr_fd = pipes[4][0];
  {
    auto vec = opt.Serialize();
    long size = vec.size();
    bool ok = WriteAll(pipes[0][1], &size, sizeof(size)) &&
              WriteAll(pipes[0][1], vec.data(), vec.size());
    int saved_errno = errno;
    close(pipes[0][1]);
    if (!ok) {
      spdlog::warn("Failed sending options to sandbox-exec: {}", strerror(saved_errno));
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      proc.CloseFds();
      proc.pid = -1;
      return false;
    }
  }
  for (int fd : {proc.result_fd, proc.report_fd, proc.stdout_fd, proc.stderr_fd}) {
    if (!SetNonBlocking(fd)) {
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      proc.CloseFds();
      proc.pid = -1;
      return false;
    }
  }
  return true;
err:
  spdlog::warn("SandboxSpawn error: errno={} {}", errno, strerror(errno));
  for (int i = 0; i < created; i++) close(pipes[i][0]), close(pipes[i][1]);
  return false;
}
