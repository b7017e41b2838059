#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <string>
#include <utility>
#include <httplib.h>
#include <spdlog/logger.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

// "https://host:port" part and path+query part of an http(s) URL
bool SplitUrl(const std::string& url, std::string& origin, std::string& target);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint.c_str(), std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(spdlog::logger& logger, httplib::Client& cli,
                            const std::string& endpoint, T&&... params) {
  logger.debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

#endif  // HTTP_UTILS_H_
