#ifndef INCLUDE_JSBOX_URL_H_
#define INCLUDE_JSBOX_URL_H_

#include <chrono>
#include <string>
#include <optional>

struct Url {
  std::string scheme; // lowercased
  std::string host;   // lowercased, no port
  int port;           // 0 if absent
  std::string path;   // starts with '/'
  std::string query;  // without '?'
  Url() : port(0) {}
};

// Absolute URLs with a scheme and a non-empty host only
std::optional<Url> ParseUrl(const std::string& str);
bool IsHttpUrl(const std::string& str);
// path ends with ".js", query string allowed
bool IsScriptUrl(const std::string& str);
// [A-Za-z0-9.-] labels, no empty label, at most 253 characters
bool IsValidHostname(const std::string& host);

// "https://x/jquery-3.6.0.min.js" -> "Jquery"; "Unknown Library" if nothing usable is left
std::string GuessLibraryName(const std::string& url);
// "3.6.0" from the file name or a "/3.6.0/" path segment; empty if none
std::string ExtractVersion(const std::string& url);

// 2024-01-02T03:04:05.678Z
std::string FormatIsoTime(std::chrono::system_clock::time_point);

#endif  // INCLUDE_JSBOX_URL_H_
