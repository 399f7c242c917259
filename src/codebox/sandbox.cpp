#include "sandbox.h"

#include <unistd.h>
#include <sys/mount.h>
#include <cstring>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  auto ReadInt = [&]() {
    if (cur + sizeof(Int) > vec.size()) throw std::out_of_range("truncated sandbox options");
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0 || cur + size > vec.size()) throw std::out_of_range("truncated sandbox options");
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  boxdir = ReadString();
  command.resize(ReadInt());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadInt());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  fd_input = ReadInt();
  fd_output = ReadInt();
  fd_error = ReadInt();
  preserve_fd = ReadInt();
  share_net = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  dirs.resize(ReadInt());
  for (auto& i : dirs) i = ReadString();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str) {
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushInt(fd_input);
  PushInt(fd_output);
  PushInt(fd_error);
  PushInt(preserve_fd);
  PushInt(share_net);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(dirs.size());
  for (auto& i : dirs) PushString(i);
  return ret;
}

void SandboxOptions::FilterDirs() {
  std::error_code ec;
  dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [&](const std::string& dir) {
    return !std::filesystem::is_directory(dir, ec);
  }), dirs.end());
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  ctx.preservefd = preserve_fd;
  ctx.sharenet = share_net;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  // never inherit the service's environment
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.data());
  ctx.working_dir = const_cast<char*>(workdir.data());
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // bind mounts, read-only
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = MS_RDONLY;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
