#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

int CloseFrom(int minfd);
bool SetNonBlocking(int fd);

// the mount root is owned by uid:uid with mode 0700
bool MountTmpfs(const fs::path&, long size_kib, int uid);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

// SIGKILL every process owned by uid (except init); uid must not be 0
bool KillUid(int uid);

#endif  // CODEBOX_UTILS_H_
