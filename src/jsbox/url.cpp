#include <jsbox/url.h>

#include <ctime>
#include <regex>
#include <cctype>
#include <algorithm>

#include <fmt/format.h>

namespace {

std::string Lower(std::string str) {
  for (auto& c : str) c = std::tolower((unsigned char)c);
  return str;
}

// last path segment of an absolute URL without ".js"/".min.js"
std::optional<std::string> ScriptStem(const std::string& str) {
  auto url = ParseUrl(str);
  if (!url) return std::nullopt;
  std::string name = url->path.substr(url->path.rfind('/') + 1);
  static const std::regex kExtension(R"(\.(min\.)?js$)");
  return std::regex_replace(name, kExtension, "");
}

} // namespace

std::optional<Url> ParseUrl(const std::string& str) {
  Url ret;
  size_t scheme_end = str.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;
  ret.scheme = Lower(str.substr(0, scheme_end));
  if (!std::isalpha((unsigned char)ret.scheme[0])) return std::nullopt;
  for (char c : ret.scheme) {
    if (!std::isalnum((unsigned char)c) && c != '+' && c != '-' && c != '.') return std::nullopt;
  }
  size_t auth_begin = scheme_end + 3;
  size_t auth_end = str.find_first_of("/?#", auth_begin);
  if (auth_end == std::string::npos) auth_end = str.size();
  std::string authority = str.substr(auth_begin, auth_end - auth_begin);
  // userinfo is not allowed: "https://trusted.com@evil.com/x.js" must not look trusted
  if (authority.find('@') != std::string::npos) return std::nullopt;
  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    std::string port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](char c) { return std::isdigit((unsigned char)c); })) {
      return std::nullopt;
    }
    ret.port = std::stoi(port);
    if (ret.port == 0 || ret.port > 65535) return std::nullopt;
    authority.resize(colon);
  }
  if (authority.empty() || !IsValidHostname(authority)) return std::nullopt;
  ret.host = Lower(authority);

  std::string rest = str.substr(auth_end);
  if (size_t hash = rest.find('#'); hash != std::string::npos) rest.resize(hash);
  if (size_t q = rest.find('?'); q != std::string::npos) {
    ret.query = rest.substr(q + 1);
    rest.resize(q);
  }
  ret.path = rest.empty() ? "/" : rest;
  for (char c : ret.path) {
    if (std::isspace((unsigned char)c) || std::iscntrl((unsigned char)c)) return std::nullopt;
  }
  return ret;
}

bool IsHttpUrl(const std::string& str) {
  auto url = ParseUrl(str);
  return url && (url->scheme == "http" || url->scheme == "https");
}

bool IsScriptUrl(const std::string& str) {
  auto url = ParseUrl(str);
  if (!url) return false;
  const std::string& path = url->path;
  if (path.size() < 3) return false;
  return Lower(path.substr(path.size() - 3)) == ".js";
}

bool IsValidHostname(const std::string& host) {
  if (host.empty() || host.size() > 253) return false;
  size_t label = 0;
  for (size_t i = 0; i < host.size(); i++) {
    char c = host[i];
    if (c == '.') {
      if (label == 0) return false;
      label = 0;
      continue;
    }
    if (!std::isalnum((unsigned char)c) && c != '-') return false;
    if (++label > 63) return false;
  }
  return label > 0;
}

std::string GuessLibraryName(const std::string& url) {
  auto stem = ScriptStem(url);
  if (!stem) return "Unknown Library";
  static const std::regex kPatterns[] = {
    std::regex(R"(^(.+?)[-.]\d)"),  // name-version or name.version
    std::regex(R"(^(.+?)\.min$)"),
    std::regex(R"(^(.+)$)"),
  };
  for (auto& pattern : kPatterns) {
    std::smatch match;
    if (std::regex_search(*stem, match, pattern) && match[1].length()) {
      std::string name = match[1];
      name[0] = std::toupper((unsigned char)name[0]);
      return name;
    }
  }
  return "Unknown Library";
}

std::string ExtractVersion(const std::string& url) {
  auto stem = ScriptStem(url);
  if (!stem) return "";
  static const std::regex kPatterns[] = {
    std::regex(R"([-.](\d+\.\d+\.\d+(?:\.\d+)?(?:-[a-zA-Z0-9]+)*))"),
    std::regex(R"(/(\d+\.\d+\.\d+(?:\.\d+)?(?:-[a-zA-Z0-9]+)*)/)"),
    std::regex(R"([-.](\d+\.\d+))"),
  };
  for (auto& pattern : kPatterns) {
    std::smatch match;
    if (std::regex_search(url, match, pattern) || std::regex_search(*stem, match, pattern)) {
      return match[1];
    }
  }
  return "";
}

std::string FormatIsoTime(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  time_t sec = ms / 1000;
  struct tm tm_buf;
  gmtime_r(&sec, &tm_buf);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                     tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)(ms % 1000));
}
