#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <fstream>
#include <sstream>

namespace {

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseRange(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseRange(int minfd) {
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

} // namespace

int CloseFrom(int minfd) {
  return CloseRange(minfd);
}

int MoveFdAbove(int fd, int minfd) {
  int ret = fcntl(fd, F_DUPFD, minfd);
  if (ret < 0) return -1;
  close(fd);
  return ret;
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

static const char* kMessageKindTable[] = {
#define X(name, wire) wire,
  ENUM_MESSAGE_KIND_
#undef X
};

const char* MessageKindName(MessageKind kind) {
  return kMessageKindTable[(int)kind];
}

bool GetMessageKind(const std::string& str, MessageKind* kind) {
  for (size_t i = 0; i < sizeof(kMessageKindTable) / sizeof(kMessageKindTable[0]); i++) {
    if (str == kMessageKindTable[i]) {
      *kind = (MessageKind)i;
      return true;
    }
  }
  return false;
}

#define X(...) X_RETURN_ARG2(RunStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RunStatusName, RunStatus, ENUM_RUN_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(DropReason, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* DropReasonName, DropReason, ENUM_DROP_REASON_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

fs::path InsideBox(const fs::path& box, const fs::path& path) {
  return "/" / path.lexically_relative(box);
}

bool WriteAll(int fd, const void* buf, size_t len) {
  auto ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t r = write(fd, ptr, len);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) return false;
    ptr += r;
    len -= r;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  auto ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t r = read(fd, ptr, len);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) return false;
    ptr += r;
    len -= r;
  }
  return true;
}

bool CreateDirs(spdlog::logger& logger, const fs::path& path, fs::perms perms) {
  logger.debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  logger.warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(spdlog::logger& logger, const fs::path& path) {
  logger.debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  logger.warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(spdlog::logger& logger, const fs::path& path, const std::string& content,
               fs::perms perms) {
  logger.debug("Write {} bytes to {}", content.size(), path.c_str());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      logger.warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    logger.warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  std::ostringstream ss;
  ss << fin.rdbuf();
  if (fin.bad()) return false;
  content = ss.str();
  return true;
}
