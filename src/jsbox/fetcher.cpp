#include <jsbox/fetcher.h>

#include <jsbox/url.h>

#include "http_utils.h"

namespace {

constexpr size_t kMaxBodySize = 16 << 20;

} // namespace

HttpFetcher::HttpFetcher(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

FetchResult HttpFetcher::Fetch(const std::string& location, std::chrono::milliseconds timeout) {
  FetchResult ret;
  if (!IsHttpUrl(location)) {
    ret.error = "Unsupported URL " + location;
    return ret;
  }

  std::string origin, target;
  if (!http_utils::SplitUrl(location, origin, target)) {
    ret.error = "Invalid URL " + location;
    return ret;
  }
  httplib::Client cli(origin);
  auto sec = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout - sec);
  cli.set_connection_timeout(sec.count(), usec.count());
  cli.set_read_timeout(sec.count(), usec.count());
  cli.set_write_timeout(sec.count(), usec.count());
  cli.set_follow_location(true);
  httplib::Headers headers = {{"Accept", "application/javascript, text/javascript, */*"}};

  // the per-operation timeouts above do not bound a slow trickle; enforce the total here
  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool too_large = false, too_slow = false;
  auto res = HTTPRequest<HTTPGet>(*logger_, cli, target, headers,
      [&](uint64_t current, uint64_t) {
        if (current > kMaxBodySize) too_large = true;
        if (std::chrono::steady_clock::now() > deadline) too_slow = true;
        return !too_large && !too_slow;
      });
  if (!res) {
    if (too_large) {
      ret.error = "Response too large";
    } else if (too_slow) {
      ret.error = "Timed out after " + std::to_string(timeout.count()) + "ms";
    } else {
      ret.error = httplib::to_string(res.error());
    }
    logger_->debug("GET {} failed: {}", location, ret.error);
    return ret;
  }
  ret.status = res->status;
  if (!http_utils::IsSuccess(res->status)) {
    ret.error = "HTTP " + std::to_string(res->status);
    logger_->debug("GET {} returned {}", location, res->status);
    return ret;
  }
  ret.body = std::move(res->body);
  ret.ok = true;
  return ret;
}
