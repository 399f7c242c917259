#include "utils.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/mount.h>
#include <atomic>
#include <random>
#include <cstring>
#include <fstream>

#include <fmt/core.h>
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

std::string GenerateRequestId() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  uint64_t a = gen(), b = gen();
  // UUID version 4 layout
  return fmt::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
      a >> 32, (a >> 16) & 0xffff, a & 0xfff,
      ((b >> 48) & 0x3fff) | 0x8000, b & 0xffffffffffffULL);
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(Status, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusName, Status, ENUM_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(LimitKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LimitKindName, LimitKind, ENUM_LIMIT_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    spdlog::warn("Failed setting fd {} non-blocking: {}", fd, strerror(errno));
    return false;
  }
  return true;
}

bool MountTmpfs(const fs::path& path, long size_kib, int uid) {
  spdlog::debug("Mount tmpfs on {}, size {}, uid {}", path.c_str(), size_kib, uid);
  std::string data = fmt::format("size={}k,mode=0700,uid={},gid={}", size_kib, uid, uid);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, data.c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  // lazy, so that a process that escaped KillUid cannot pin the box
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
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
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

bool KillUid(int uid) {
  if (uid <= 0) return false;
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed forking killer for uid {}: {}", uid, strerror(errno));
    return false;
  }
  if (pid == 0) {
    // kill(-1) reaches exactly the processes this uid may signal, i.e. its own
    if (setresgid(uid, uid, uid) < 0 || setresuid(uid, uid, uid) < 0) _exit(1);
    kill(-1, SIGKILL);
    _exit(0);
  }
  int status;
  if (waitpid(pid, &status, 0) < 0) return false;
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    spdlog::warn("Killer for uid {} failed", uid);
    return false;
  }
  return true;
}
