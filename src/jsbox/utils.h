#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <spdlog/logger.h>
#include <jsbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

fs::path InsideBox(const fs::path& box, const fs::path& path);

// async-signal-safe; for use between fork and exec
int CloseFrom(int minfd);
// Moves fd to a number >= minfd, closing the original; -1 on failure
int MoveFdAbove(int fd, int minfd);

// retry on EINTR and short writes
bool WriteAll(int fd, const void* buf, size_t len);
bool ReadAll(int fd, void* buf, size_t len);

bool CreateDirs(spdlog::logger&, const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(spdlog::logger&, const fs::path&);
bool WriteFile(spdlog::logger&, const fs::path&, const std::string& content,
               fs::perms = fs::perms::unknown);
// false on any read error
bool ReadFile(const fs::path&, std::string& content);

#endif  // UTILS_H_
