#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdexcept>

#include "sandbox.h"
#include "sandbox_exec.h"

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = (char*)buf;
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    ptr += ret;
    len -= ret;
  }
  return true;
}

struct cjail_result SandboxExec(SandboxOptions& opt) {
  struct cjail_result ret = {};
  // the jail reads nothing; its stdout/stderr go to the governor's pipes
  int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd < 0 || dup2(null_fd, 0) < 0) goto err;
  if (null_fd != 0) close(null_fd);
  opt.fd_input = 0;
  opt.fd_output = kHelperStdoutFd;
  opt.fd_error = kHelperStderrFd;
  opt.preserve_fd = true;
  {
    CJailCtxClass ctx;
    opt.ToCJailCtx(ctx);
    if (cjail_exec(&ctx.GetCtx(), &ret) < 0) goto err;
  }
  return ret;
err:
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0 || sz > (16L << 20)) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res = {};
  try {
    SandboxOptions opt(buf);
    res = SandboxExec(opt);
  } catch (const std::out_of_range&) {
    res.oomkill = EINVAL;
    res.timekill = -1;
  }
  // the result goes out in one write, so the reader never sees a partial struct
  if (write(1, &res, sizeof(res)) != (ssize_t)sizeof(res)) return 1;
}
