#ifndef INCLUDE_JSBOX_LIBRARIES_H_
#define INCLUDE_JSBOX_LIBRARIES_H_

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>

#include <spdlog/logger.h>
#include "fetcher.h"
#include "storage.h"

extern const char kLibrariesKey[];
extern const char kOriginsKey[];
extern const std::vector<std::string> kDefaultOrigins;

struct Library {
  std::string id;
  std::string name;
  std::string url;
  std::string origin;
  std::string added_at; // ISO-8601, UTC
};

struct ReferenceCheck {
  bool valid;
  std::string origin;
  bool origin_trusted;
  bool needs_approval;
  std::string error;
  ReferenceCheck() : valid(false), origin_trusted(false), needs_approval(false) {}
};

struct AddResult {
  bool success;
  bool needs_approval;
  std::string origin; // set when approval is needed
  std::string error;
  Library library;    // set on success
  AddResult() : success(false), needs_approval(false) {}
};

struct TrustRequest {
  std::string origin;
  std::string url;
  std::string name;
};

struct LibraryStats {
  size_t library_count;
  size_t origin_count;
  size_t custom_origin_count;
};

// Owns the trusted-origin allow-list and the library references injected into every run.
// Not thread-safe: callers serialize mutations; the engine only calls BuildBundle/BuildPolicy.
class LibraryManager {
 public:
  struct Listener {
    // these functions should not block
    std::function<void(const TrustRequest&)> OnTrustRequest;
    std::function<void(const Library&)> OnLibraryAdded;
    std::function<void(const Library&)> OnLibraryRemoved;
    std::function<void(const std::string&)> OnOriginAdded;
    std::function<void(const std::string&)> OnOriginRemoved;
    std::function<void()> OnCleared;
  };

 private:
  struct CacheEntry {
    std::string code;
    std::string fetched_at;
  };

  KeyValueStore& store_;
  Fetcher& fetcher_;
  std::shared_ptr<spdlog::logger> logger_;
  Listener listener_;
  std::chrono::milliseconds fetch_timeout_;
  bool persist_; // cleared after the first failed write
  long next_seq_;

  std::vector<Library> libraries_;
  std::vector<std::string> origins_; // defaults first, then user-added, no duplicates
  std::unordered_map<std::string, CacheEntry> cache_; // url -> content

  void LoadFromStorage_();
  void Persist_(const char* key, const std::string& value);
  void SaveLibraries_();
  void SaveOrigins_();
  std::string NextId_();

 public:
  LibraryManager(KeyValueStore& store, Fetcher& fetcher, std::shared_ptr<spdlog::logger> logger,
                 Listener listener = {}, std::chrono::milliseconds fetch_timeout = kNetworkTimeout);

  bool IsOriginTrusted(const std::string& origin) const;
  static bool IsDefaultOrigin(const std::string& origin);

  ReferenceCheck ValidateReference(const std::string& url) const;
  // Untrusted origins are never approved implicitly: the result asks for approval and
  // OnTrustRequest fires once; call AddOrigin and retry.
  AddResult AddReference(const std::string& url, const std::string& name = "");
  bool RemoveReference(const std::string& id);

  // false if already trusted or not a hostname
  bool AddOrigin(const std::string& origin);
  // false for built-in origins and unknown ones
  bool RemoveOrigin(const std::string& origin);

  std::vector<Library> GetLibraries() const { return libraries_; }
  std::vector<std::string> GetTrustedOrigins() const { return origins_; }
  LibraryStats GetStats() const;
  bool IsPersistent() const { return persist_; }

  // Drops every library and user-added origin, including their persisted copies
  void Clear();
  // Forgets fetched library content
  void ClearCache();

  // Array elements for the bootstrap's library marker, one per library in insertion order.
  // A library that cannot be fetched becomes a placeholder that reports the failure inside the
  // context instead of failing the bundle.
  std::string BuildBundle();
  // Script execution from 'self' and every trusted origin; no network access from the context
  std::string BuildPolicy() const;
};

#endif  // INCLUDE_JSBOX_LIBRARIES_H_
