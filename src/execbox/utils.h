#ifndef EXECBOX_UTILS_H_
#define EXECBOX_UTILS_H_

#include <filesystem>

#include <execbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

// Mark every fd >= minfd close-on-exec. Only async-signal-safe calls when close_range is available.
int CloexecFrom(int minfd);
bool SetNonblock(int fd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

#endif  // EXECBOX_UTILS_H_
