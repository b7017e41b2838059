#include "http_utils.h"

#include <jsbox/url.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str;
}
std::string FormatOneParam(const httplib::Headers& headers) {
  std::string ret;
  for (auto& i : headers) {
    if (ret.size()) ret += ", ";
    ret += i.first + ": " + i.second;
  }
  return "{" + ret + "}";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

bool SplitUrl(const std::string& str, std::string& origin, std::string& target) {
  auto url = ParseUrl(str);
  if (!url || (url->scheme != "http" && url->scheme != "https")) return false;
  origin = url->scheme + "://" + url->host;
  if (url->port) origin += ":" + std::to_string(url->port);
  target = url->path;
  if (url->query.size()) target += "?" + url->query;
  return true;
}

} // namespace http_utils
