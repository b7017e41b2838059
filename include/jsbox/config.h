#ifndef INCLUDE_JSBOX_CONFIG_H_
#define INCLUDE_JSBOX_CONFIG_H_

#include <chrono>
#include <string>
#include <filesystem>

#include "jail.h"
#include "engine.h"

struct Config {
  std::chrono::milliseconds time_limit;
  std::chrono::milliseconds fetch_timeout;
  std::string template_source; // empty for the built-in bootstrap
  std::filesystem::path state_dir;
  JailOptions jail;

  Config();
  EngineOptions ToEngineOptions() const;
  // throws ConfigurationError
  void Validate() const;
};

// Reads an INI file (keys in the unnamed section) on top of the current values; box_root is
// applied to kBoxRoot directly. Returns false if the file cannot be read; throws
// ConfigurationError for invalid values.
bool ParseConfig(const std::filesystem::path& path, Config& config);

#endif  // INCLUDE_JSBOX_CONFIG_H_
