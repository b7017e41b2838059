#include <jsbox/config.h>

#include <fstream>

#include <fmt/format.h>
#include <tortellini.hh>
#include <jsbox/paths.h>
#include <jsbox/errors.h>

namespace {

constexpr std::chrono::milliseconds kWallTimeMargin{2000};

std::chrono::milliseconds PositiveMs(const char* key, long val) {
  if (val <= 0) throw ConfigurationError(fmt::format("{} must be positive, got {}", key, val));
  return std::chrono::milliseconds(val);
}

} // namespace

Config::Config() :
    time_limit(kDefaultTimeLimit),
    fetch_timeout(kNetworkTimeout),
    state_dir(DefaultStateDir()) {
  jail.wall_time = time_limit + kWallTimeMargin;
}

EngineOptions Config::ToEngineOptions() const {
  EngineOptions ret;
  ret.time_limit = time_limit;
  return ret;
}

void Config::Validate() const {
  ToEngineOptions().Validate();
  jail.Validate();
  if (fetch_timeout.count() <= 0) throw ConfigurationError("fetch timeout must be positive");
  if (jail.wall_time < time_limit) {
    throw ConfigurationError(fmt::format("context wall time ({}ms) is shorter than the time limit ({}ms)",
                                         jail.wall_time.count(), time_limit.count()));
  }
}

bool ParseConfig(const fs::path& conf_path, Config& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  config.time_limit = PositiveMs("time_limit_ms",
                                 ini[""]["time_limit_ms"] | (long)config.time_limit.count());
  config.fetch_timeout = PositiveMs("fetch_timeout_ms",
                                    ini[""]["fetch_timeout_ms"] | (long)config.fetch_timeout.count());
  config.template_source = ini[""]["template"] | config.template_source;
  config.jail.runtime = ini[""]["runtime"] | config.jail.runtime;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  std::string state_dir = ini[""]["state_dir"] | "";
  if (state_dir.size()) config.state_dir = state_dir;
  long wall = ini[""]["context_wall_time_ms"] | 0L;
  config.jail.wall_time = wall ? PositiveMs("context_wall_time_ms", wall)
                               : config.time_limit + kWallTimeMargin;
  long rss_mb = ini[""]["context_rss_mb"] | (config.jail.rss / 1024);
  if (rss_mb <= 0) throw ConfigurationError(fmt::format("context_rss_mb must be positive, got {}", rss_mb));
  config.jail.rss = rss_mb * 1024;
  config.jail.uid = config.jail.gid = ini[""]["context_uid"] | config.jail.uid;
  config.Validate();
  return true;
}
