#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <cctype>
#include <cstring>
#include <climits>
#include <fstream>
#include <random>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <execbox/sandbox.h>
#include <execbox/execution.h>
#include <execbox/validator.h>
#include <execbox/subprocess.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
#endif

#if defined(CLOSE_RANGE_CLOEXEC) && defined(SYS_close_range)
int CloexecFrom(int minfd) {
  return syscall(SYS_close_range, minfd, ~0U, CLOSE_RANGE_CLOEXEC);
}
#else
#include <dirent.h>
int CloexecFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) return -1;
  int dfd = dirfd(fddir);
  for (struct dirent *dent; (dent = readdir(fddir));) {
    if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
    int fd = strtol(dent->d_name, NULL, 10);
    if (fd >= minfd && fd != dfd) {
      int flags = fcntl(fd, F_GETFD);
      if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
  }
  closedir(fddir);
  return 0;
}
#endif // CLOSE_RANGE_CLOEXEC

bool SetNonblock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(ValidationErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ValidationErrorDesc, ValidationErrorKind, ENUM_VALIDATION_ERROR_)
#undef X

#define X(...) X_RETURN_ARG1(Phase, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* PhaseName, Phase, ENUM_PHASE_)
#undef X

#define X(...) X_RETURN_ARG1(StopCause, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StopCauseName, StopCause, ENUM_STOP_CAUSE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kLanguageNameTable[] = {
#define X(name, id) id,
  ENUM_LANGUAGE_
#undef X
};

bool GetLanguage(const std::string& str, Language& lang) {
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) {
      lang = (Language)i;
      return true;
    }
  }
  return false;
}

long ParseByteSize(const std::string& str) {
  size_t pos = 0;
  long value = 0;
  for (; pos < str.size() && isdigit((unsigned char)str[pos]); pos++) {
    int digit = str[pos] - '0';
    if (value > (LONG_MAX - digit) / 10) return -1;
    value = value * 10 + digit;
  }
  if (pos == 0) return -1;
  if (pos == str.size()) return value;
  if (pos + 1 != str.size()) return -1;
  long unit;
  switch (tolower((unsigned char)str[pos])) {
    case 'b': unit = 1; break;
    case 'k': unit = 1L << 10; break;
    case 'm': unit = 1L << 20; break;
    case 'g': unit = 1L << 30; break;
    default: return -1;
  }
  if (value > LONG_MAX / unit) return -1;
  return value * unit;
}

std::string RandomHex() {
  std::random_device rd;
  uint64_t value = (uint64_t)rd() << 32 | rd();
  return fmt::format("{:016x}", value);
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
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}
