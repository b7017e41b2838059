#ifndef INCLUDE_JSBOX_STORAGE_H_
#define INCLUDE_JSBOX_STORAGE_H_

#include <memory>
#include <string>
#include <optional>
#include <filesystem>
#include <unordered_map>

#include <spdlog/logger.h>

// Opaque persisted key/value pairs
class KeyValueStore {
 public:
  virtual ~KeyValueStore() {}
  virtual std::optional<std::string> Get(const std::string& key) = 0;
  // false if the value could not be persisted
  virtual bool Set(const std::string& key, const std::string& value) = 0;
  virtual bool Remove(const std::string& key) = 0;
};

// One file per key under a directory; writes go through a temporary file and rename(2).
// Keys are restricted to [A-Za-z0-9_.-].
class FileStore : public KeyValueStore {
  std::filesystem::path dir_;
  std::shared_ptr<spdlog::logger> logger_;
 public:
  FileStore(std::filesystem::path dir, std::shared_ptr<spdlog::logger> logger);
  std::optional<std::string> Get(const std::string& key) override;
  bool Set(const std::string& key, const std::string& value) override;
  bool Remove(const std::string& key) override;
};

class MemoryStore : public KeyValueStore {
  std::unordered_map<std::string, std::string> values_;
 public:
  // simulate a full disk
  bool fail_writes = false;
  int write_count = 0;

  std::optional<std::string> Get(const std::string& key) override;
  bool Set(const std::string& key, const std::string& value) override;
  bool Remove(const std::string& key) override;
};

bool IsValidStoreKey(const std::string& key);

#endif  // INCLUDE_JSBOX_STORAGE_H_
