#include <jsbox/logger.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ansicolor_sink.h>

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name, spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_pattern("[%t] %+");
  logger->set_level(level);
  return logger;
}

std::shared_ptr<spdlog::logger> ComponentLogger(
    const std::shared_ptr<spdlog::logger>& parent, const std::string& component) {
  if (!parent) {
    return std::make_shared<spdlog::logger>(component, std::make_shared<spdlog::sinks::null_sink_mt>());
  }
  return parent->clone(component);
}

spdlog::level::level_enum VerbosityLevel(int verbosity) {
  switch (verbosity) {
    case 0: return spdlog::level::warn;
    case 1: return spdlog::level::info;
    case 2: return spdlog::level::debug;
    default: return spdlog::level::trace;
  }
}
