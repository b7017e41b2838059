#ifndef INCLUDE_JSBOX_FETCHER_H_
#define INCLUDE_JSBOX_FETCHER_H_

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/logger.h>

constexpr std::chrono::milliseconds kNetworkTimeout{5000};

struct FetchResult {
  bool ok;
  int status; // HTTP status; 0 for transport failures
  std::string body;
  std::string error;
  FetchResult() : ok(false), status(0) {}
};

class Fetcher {
 public:
  virtual ~Fetcher() {}
  // location must be an http(s) URL
  virtual FetchResult Fetch(const std::string& location, std::chrono::milliseconds timeout) = 0;
};

class HttpFetcher : public Fetcher {
  std::shared_ptr<spdlog::logger> logger_;
 public:
  explicit HttpFetcher(std::shared_ptr<spdlog::logger> logger);
  FetchResult Fetch(const std::string& location, std::chrono::milliseconds timeout) override;
};

#endif  // INCLUDE_JSBOX_FETCHER_H_
