#include <jsbox/libraries.h>

#include <cctype>
#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <jsbox/url.h>

const char kLibrariesKey[] = "jsbox_libraries";
const char kOriginsKey[] = "jsbox_trusted_origins";
const std::vector<std::string> kDefaultOrigins = {
  "cdnjs.cloudflare.com",
  "unpkg.com",
  "cdn.jsdelivr.net",
  "code.jquery.com",
  "stackpath.bootstrapcdn.com",
};

namespace {

// text placed inside /* */ must not close it
std::string CommentSafe(std::string str) {
  for (size_t pos = 0; (pos = str.find("*/", pos)) != std::string::npos;) {
    str.replace(pos, 2, "* /");
  }
  for (auto& c : str) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return str;
}

std::string Lower(std::string str) {
  for (auto& c : str) c = std::tolower((unsigned char)c);
  return str;
}

std::string DumpJson(const nlohmann::json& obj) {
  return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

LibraryManager::LibraryManager(KeyValueStore& store, Fetcher& fetcher,
                               std::shared_ptr<spdlog::logger> logger, Listener listener,
                               std::chrono::milliseconds fetch_timeout) :
    store_(store), fetcher_(fetcher), logger_(std::move(logger)), listener_(std::move(listener)),
    fetch_timeout_(fetch_timeout), persist_(true), next_seq_(0),
    origins_(kDefaultOrigins) {
  LoadFromStorage_();
}

void LibraryManager::LoadFromStorage_() {
  if (auto val = store_.Get(kLibrariesKey)) {
    try {
      auto arr = nlohmann::json::parse(*val);
      if (!arr.is_array()) {
        logger_->warn("Ignoring corrupt {}: not an array", kLibrariesKey);
        arr = nlohmann::json::array();
      }
      for (auto& i : arr) {
        if (!i.is_object()) continue;
        Library lib;
        lib.url = i.value("url", std::string());
        auto url = ParseUrl(lib.url);
        if (!url || url->scheme != "https") continue;
        lib.id = i.value("id", std::string());
        lib.name = i.value("name", GuessLibraryName(lib.url));
        lib.origin = url->host;
        lib.added_at = i.value("addedAt", std::string());
        if (lib.id.empty()) lib.id = NextId_();
        bool duplicate = std::any_of(libraries_.begin(), libraries_.end(),
            [&](const Library& x) { return x.url == lib.url || x.id == lib.id; });
        if (!duplicate) libraries_.push_back(std::move(lib));
      }
    } catch (nlohmann::json::exception& e) {
      logger_->warn("Ignoring corrupt {}: {}", kLibrariesKey, e.what());
      libraries_.clear();
    }
  }
  if (auto val = store_.Get(kOriginsKey)) {
    try {
      auto arr = nlohmann::json::parse(*val);
      if (!arr.is_array()) {
        logger_->warn("Ignoring corrupt {}: not an array", kOriginsKey);
        arr = nlohmann::json::array();
      }
      for (auto& i : arr) {
        if (!i.is_string()) continue;
        std::string origin = i.get<std::string>();
        if (IsValidHostname(origin) && !IsOriginTrusted(origin)) origins_.push_back(origin);
      }
    } catch (nlohmann::json::exception& e) {
      logger_->warn("Ignoring corrupt {}: {}", kOriginsKey, e.what());
      origins_ = kDefaultOrigins;
    }
  }
  logger_->info("Loaded {} libraries and {} trusted origins",
                libraries_.size(), origins_.size());
}

void LibraryManager::Persist_(const char* key, const std::string& value) {
  if (!persist_) return;
  if (!store_.Set(key, value)) {
    logger_->warn("Failed persisting {}; further changes are kept in memory only", key);
    persist_ = false;
  }
}

void LibraryManager::SaveLibraries_() {
  nlohmann::json arr = nlohmann::json::array();
  for (auto& i : libraries_) {
    arr.push_back({
      {"id", i.id},
      {"name", i.name},
      {"url", i.url},
      {"origin", i.origin},
      {"addedAt", i.added_at},
    });
  }
  Persist_(kLibrariesKey, DumpJson(arr));
}

void LibraryManager::SaveOrigins_() {
  nlohmann::json arr = nlohmann::json::array();
  for (auto& i : origins_) {
    if (!IsDefaultOrigin(i)) arr.push_back(i);
  }
  Persist_(kOriginsKey, DumpJson(arr));
}

std::string LibraryManager::NextId_() {
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  std::string id;
  do {
    id = fmt::format("lib_{}_{}", now, ++next_seq_);
  } while (std::any_of(libraries_.begin(), libraries_.end(),
                       [&](const Library& x) { return x.id == id; }));
  return id;
}

bool LibraryManager::IsOriginTrusted(const std::string& origin) const {
  return std::find(origins_.begin(), origins_.end(), origin) != origins_.end();
}

bool LibraryManager::IsDefaultOrigin(const std::string& origin) {
  return std::find(kDefaultOrigins.begin(), kDefaultOrigins.end(), origin) != kDefaultOrigins.end();
}

ReferenceCheck LibraryManager::ValidateReference(const std::string& url) const {
  ReferenceCheck ret;
  if (url.empty()) {
    ret.error = "URL is required";
    return ret;
  }
  auto parsed = ParseUrl(url);
  if (!parsed) {
    ret.error = "Invalid URL format";
    return ret;
  }
  if (parsed->scheme != "https") {
    ret.error = "URL must use https";
    return ret;
  }
  if (!IsScriptUrl(url)) {
    ret.error = "URL must point to a JavaScript file (.js)";
    return ret;
  }
  ret.valid = true;
  ret.origin = parsed->host;
  ret.origin_trusted = IsOriginTrusted(ret.origin);
  ret.needs_approval = !ret.origin_trusted;
  return ret;
}

AddResult LibraryManager::AddReference(const std::string& url, const std::string& name) {
  AddResult ret;
  auto check = ValidateReference(url);
  if (!check.valid) {
    logger_->warn("Library validation failed: {}", check.error);
    ret.error = check.error;
    return ret;
  }
  if (std::any_of(libraries_.begin(), libraries_.end(),
                  [&](const Library& x) { return x.url == url; })) {
    logger_->warn("Library already exists: {}", url);
    ret.error = "Library already added";
    return ret;
  }
  std::string display_name = name.empty() ? GuessLibraryName(url) : name;
  if (check.needs_approval) {
    logger_->info("Origin approval needed for {}", check.origin);
    ret.needs_approval = true;
    ret.origin = check.origin;
    if (listener_.OnTrustRequest) listener_.OnTrustRequest({check.origin, url, display_name});
    return ret;
  }

  Library lib;
  lib.id = NextId_();
  lib.name = display_name;
  lib.url = url;
  lib.origin = check.origin;
  lib.added_at = FormatIsoTime(std::chrono::system_clock::now());
  libraries_.push_back(lib);
  SaveLibraries_();
  logger_->info("Library added: {} ({})", lib.name, lib.url);
  if (listener_.OnLibraryAdded) listener_.OnLibraryAdded(lib);
  ret.success = true;
  ret.library = std::move(lib);
  return ret;
}

bool LibraryManager::RemoveReference(const std::string& id) {
  auto it = std::find_if(libraries_.begin(), libraries_.end(),
                         [&](const Library& x) { return x.id == id; });
  if (it == libraries_.end()) {
    logger_->warn("Library not found for removal: {}", id);
    return false;
  }
  Library removed = std::move(*it);
  libraries_.erase(it);
  SaveLibraries_();
  logger_->info("Library removed: {}", removed.name);
  if (listener_.OnLibraryRemoved) listener_.OnLibraryRemoved(removed);
  return true;
}

bool LibraryManager::AddOrigin(const std::string& name) {
  std::string origin = Lower(name);
  if (!IsValidHostname(origin)) {
    logger_->warn("Not a hostname: {}", origin);
    return false;
  }
  if (IsOriginTrusted(origin)) return false;
  origins_.push_back(origin);
  SaveOrigins_();
  logger_->info("Origin added to allowlist: {}", origin);
  if (listener_.OnOriginAdded) listener_.OnOriginAdded(origin);
  return true;
}

bool LibraryManager::RemoveOrigin(const std::string& name) {
  std::string origin = Lower(name);
  if (IsDefaultOrigin(origin)) {
    logger_->warn("Cannot remove default origin: {}", origin);
    return false;
  }
  auto it = std::find(origins_.begin(), origins_.end(), origin);
  if (it == origins_.end()) return false;
  origins_.erase(it);
  SaveOrigins_();
  logger_->info("Origin removed from allowlist: {}", origin);
  if (listener_.OnOriginRemoved) listener_.OnOriginRemoved(origin);
  return true;
}

LibraryStats LibraryManager::GetStats() const {
  return {libraries_.size(), origins_.size(), origins_.size() - kDefaultOrigins.size()};
}

void LibraryManager::Clear() {
  libraries_.clear();
  origins_ = kDefaultOrigins;
  if (persist_ && (!store_.Remove(kLibrariesKey) || !store_.Remove(kOriginsKey))) {
    logger_->warn("Failed clearing persisted libraries; further changes are kept in memory only");
    persist_ = false;
  }
  logger_->info("All libraries and custom origins cleared");
  if (listener_.OnCleared) listener_.OnCleared();
}

void LibraryManager::ClearCache() {
  logger_->debug("Dropping {} cached libraries", cache_.size());
  cache_.clear();
}

std::string LibraryManager::BuildBundle() {
  if (libraries_.empty()) {
    logger_->debug("No libraries to inject");
    return "";
  }
  logger_->info("Fetching content for {} libraries...", libraries_.size());
  std::string ret;
  for (auto& lib : libraries_) {
    auto it = cache_.find(lib.url);
    if (it != cache_.end()) {
      logger_->debug("Using cached content for {}", lib.name);
    } else {
      logger_->debug("Fetching library {} from {}", lib.name, lib.url);
      auto res = fetcher_.Fetch(lib.url, fetch_timeout_);
      if (!res.ok) {
        logger_->error("Failed to fetch library {}: {}", lib.name, res.error);
        ret += fmt::format("/* Library: {} - FAILED TO LOAD */\n/* Error: {} */\n/* URL: {} */\n",
                           CommentSafe(lib.name), CommentSafe(res.error), CommentSafe(lib.url));
        ret += DumpJson({{"name", lib.name}, {"source", lib.url}, {"error", res.error}});
        ret += ",\n";
        continue;
      }
      logger_->debug("Fetched {}: {} characters", lib.name, res.body.size());
      it = cache_.emplace(lib.url, CacheEntry{std::move(res.body),
                          FormatIsoTime(std::chrono::system_clock::now())}).first;
    }
    ret += fmt::format("/* Library: {} */\n/* Source: {} */\n/* Fetched: {} */\n",
                       CommentSafe(lib.name), CommentSafe(lib.url), it->second.fetched_at);
    ret += DumpJson({
      {"name", lib.name},
      {"source", lib.url},
      {"fetched", it->second.fetched_at},
      {"code", it->second.code},
    });
    ret += ",\n";
    std::string version = ExtractVersion(lib.url);
    logger_->debug("  -> {}{}: {:.1f}KB from {}", lib.name, version.empty() ? "" : " v" + version,
                   it->second.code.size() / 1024.0, lib.url);
  }
  logger_->info("Total library bundle size: {:.1f}KB", ret.size() / 1024.0);
  return ret;
}

std::string LibraryManager::BuildPolicy() const {
  std::vector<std::string> sources = {"'self'", "'unsafe-inline'", "'unsafe-eval'"};
  for (auto& i : origins_) {
    std::string src = "https://" + i;
    if (std::find(sources.begin(), sources.end(), src) == sources.end()) sources.push_back(src);
  }
  return fmt::format("script-src {}; connect-src 'none'", fmt::join(sources, " "));
}
