#include <jsbox/storage.h>

#include <unistd.h>
#include <atomic>
#include <cctype>

#include "utils.h"

namespace {

std::atomic_long temp_file_seq = 0;

} // namespace

bool IsValidStoreKey(const std::string& key) {
  if (key.empty() || key == "." || key == "..") return false;
  for (char c : key) {
    if (!std::isalnum((unsigned char)c) && c != '_' && c != '.' && c != '-') return false;
  }
  return true;
}

FileStore::FileStore(fs::path dir, std::shared_ptr<spdlog::logger> logger) :
    dir_(std::move(dir)), logger_(std::move(logger)) {}

std::optional<std::string> FileStore::Get(const std::string& key) {
  if (!IsValidStoreKey(key)) return std::nullopt;
  std::string ret;
  std::error_code ec;
  if (!fs::exists(dir_ / key, ec)) return std::nullopt;
  if (!ReadFile(dir_ / key, ret)) {
    logger_->warn("Failed reading {}", (dir_ / key).c_str());
    return std::nullopt;
  }
  return ret;
}

bool FileStore::Set(const std::string& key, const std::string& value) {
  if (!IsValidStoreKey(key)) {
    logger_->warn("Invalid store key {}", key);
    return false;
  }
  if (!CreateDirs(*logger_, dir_)) return false;
  fs::path tmp = dir_ / ("." + key + ".tmp" + std::to_string(getpid()) + "_" +
                         std::to_string(++temp_file_seq));
  if (!WriteFile(*logger_, tmp, value)) {
    std::error_code ec;
    fs::remove(tmp, ec);
    return false;
  }
  std::error_code ec;
  fs::rename(tmp, dir_ / key, ec);
  if (ec) {
    logger_->warn("Failed replacing {}: {}", (dir_ / key).c_str(), ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool FileStore::Remove(const std::string& key) {
  if (!IsValidStoreKey(key)) return false;
  std::error_code ec;
  fs::remove(dir_ / key, ec);
  if (ec) {
    logger_->warn("Failed deleting {}: {}", (dir_ / key).c_str(), ec.message());
    return false;
  }
  return true;
}

std::optional<std::string> MemoryStore::Get(const std::string& key) {
  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

bool MemoryStore::Set(const std::string& key, const std::string& value) {
  if (fail_writes) return false;
  write_count++;
  values_[key] = value;
  return true;
}

bool MemoryStore::Remove(const std::string& key) {
  if (fail_writes) return false;
  values_.erase(key);
  return true;
}
