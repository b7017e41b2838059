#ifndef INCLUDE_JSBOX_LOGGER_H_
#define INCLUDE_JSBOX_LOGGER_H_

#include <memory>
#include <string>

#include <spdlog/logger.h>

// Loggers are never registered with spdlog; pass them down explicitly.
std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name, spdlog::level::level_enum level);
// Same sinks and level as parent under a new name; a null parent yields a logger that discards
std::shared_ptr<spdlog::logger> ComponentLogger(
    const std::shared_ptr<spdlog::logger>& parent, const std::string& component);
// 0: warn, 1: info, 2: debug, 3+: trace
spdlog::level::level_enum VerbosityLevel(int verbosity);

#endif  // INCLUDE_JSBOX_LOGGER_H_
