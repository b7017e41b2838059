#include <signal.h>
#include <unistd.h>
#include <mutex>
#include <optional>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>
#include <condition_variable>

#include <fmt/ranges.h>
#include <spdlog/logger.h>
#include <argparse/argparse.hpp>
#include <jsbox/jail.h>
#include <jsbox/utils.h>
#include <jsbox/config.h>
#include <jsbox/errors.h>
#include <jsbox/logger.h>
#include <jsbox/paths.h>
#include <jsbox/engine.h>
#include <jsbox/storage.h>
#include <jsbox/libraries.h>

namespace {

constexpr char kDefaultConfig[] = "/etc/jsbox.conf";

enum ExitCode {
  kExitCompleted = 0,
  kExitRejected = 1,
  kExitTimeout = 2,
};

struct Args {
  int verbosity = 0;
  std::optional<std::string> config;
  std::optional<long> time_limit;
  std::vector<std::string> trust, untrust, add_library, remove_library;
  bool list = false;
  bool clear_libraries = false;
  bool check = false;
  std::optional<std::string> script;
};

Args ParseArgs(int argc, char** argv) {
  Args args;
  argparse::ArgumentParser parser(argc ? argv[0] : "jsbox-run");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default: " + std::string(kDefaultConfig) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++args.verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--time-limit")
    .scan<'d', long>()
    .help("Time limit of one run in milliseconds");
  parser.add_argument("--trust")
    .append()
    .help("Add an origin to the trusted list");
  parser.add_argument("--untrust")
    .append()
    .help("Remove a user-added origin from the trusted list");
  parser.add_argument("--add-library")
    .append()
    .help("Inject the script at this URL into every run");
  parser.add_argument("--remove-library")
    .append()
    .help("Stop injecting the library with this id");
  parser.add_argument("--list")
    .default_value(false)
    .implicit_value(true)
    .help("Print trusted origins and libraries");
  parser.add_argument("--clear-libraries")
    .default_value(false)
    .implicit_value(true)
    .help("Remove every library and user-added origin");
  parser.add_argument("--check")
    .default_value(false)
    .implicit_value(true)
    .help("Only check the syntax of the script");
  parser.add_argument("script")
    .nargs(argparse::nargs_pattern::optional)
    .help("Script to run; \"-\" reads standard input");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  args.config = parser.present<std::string>("--config");
  args.time_limit = parser.present<long>("--time-limit");
  if (auto val = parser.present<std::vector<std::string>>("--trust")) args.trust = *val;
  if (auto val = parser.present<std::vector<std::string>>("--untrust")) args.untrust = *val;
  if (auto val = parser.present<std::vector<std::string>>("--add-library")) args.add_library = *val;
  if (auto val = parser.present<std::vector<std::string>>("--remove-library")) {
    args.remove_library = *val;
  }
  args.list = parser["--list"] == true;
  args.clear_libraries = parser["--clear-libraries"] == true;
  args.check = parser["--check"] == true;
  args.script = parser.present<std::string>("script");
  return args;
}

bool ReadScript(const std::string& name, std::string& code) {
  std::stringstream ss;
  if (name == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream fin(name);
    if (!fin) return false;
    ss << fin.rdbuf();
  }
  code = ss.str();
  return true;
}

// false if any change was refused
bool ManageLibraries(const Args& args, LibraryManager& libraries, spdlog::logger* logger) {
  bool ok = true;
  if (args.clear_libraries) libraries.Clear();
  for (auto& i : args.trust) {
    if (!libraries.AddOrigin(i) && !libraries.IsOriginTrusted(i)) {
      logger->error("Cannot trust \"{}\": not a hostname", i);
      ok = false;
    }
  }
  for (auto& i : args.untrust) {
    if (!libraries.RemoveOrigin(i)) {
      logger->error("Cannot remove origin \"{}\"", i);
      ok = false;
    }
  }
  for (auto& i : args.add_library) {
    auto res = libraries.AddReference(i);
    if (res.success) {
      std::cout << "Added " << res.library.id << " " << res.library.name << std::endl;
    } else if (!res.needs_approval) {
      logger->error("Cannot add {}: {}", i, res.error);
      ok = false;
    } else {
      ok = false;
    }
  }
  for (auto& i : args.remove_library) {
    if (!libraries.RemoveReference(i)) {
      logger->error("No library with id {}", i);
      ok = false;
    }
  }
  if (args.list) {
    auto stats = libraries.GetStats();
    std::cout << "Trusted origins (" << stats.origin_count << ", "
              << stats.custom_origin_count << " user-added):" << std::endl;
    for (auto& i : libraries.GetTrustedOrigins()) {
      std::cout << "  " << i << (LibraryManager::IsDefaultOrigin(i) ? " (built-in)" : "") << std::endl;
    }
    std::cout << "Libraries (" << stats.library_count << "):" << std::endl;
    for (auto& i : libraries.GetLibraries()) {
      std::cout << "  " << i.id << "  " << i.name << "  " << i.url << "  " << i.added_at << std::endl;
    }
  }
  return ok;
}

class RunWaiter {
  std::mutex mtx_;
  std::condition_variable cv_;
  bool finished_ = false;
  bool rejected_ = false;
  bool timeout_ = false;
 public:
  SandboxEngine::Reporter GetReporter() {
    SandboxEngine::Reporter reporter;
    reporter.OnMessage = [](MessageKind kind, const std::vector<std::string>& args) {
      auto& out = kind == MessageKind::ERROR || kind == MessageKind::WARN ? std::cerr : std::cout;
      out << fmt::format("[{}] {}", MessageKindName(kind), fmt::join(args, " ")) << std::endl;
    };
    reporter.OnStatus = [this](RunStatus status) {
      std::lock_guard lck(mtx_);
      if (status == RunStatus::REJECTED) rejected_ = true;
      if (status == RunStatus::TIMEOUT) timeout_ = true;
      if (status == RunStatus::COMPLETED || status == RunStatus::TIMEOUT) {
        finished_ = true;
        cv_.notify_all();
      }
    };
    return reporter;
  }
  int Wait() {
    std::unique_lock lck(mtx_);
    cv_.wait(lck, [&]() { return finished_; });
    if (timeout_) return kExitTimeout;
    if (rejected_) return kExitRejected;
    return kExitCompleted;
  }
};

} // namespace

int main(int argc, char** argv) {
  signal(SIGPIPE, SIG_IGN);
  Args args = ParseArgs(argc, argv);
  auto logger = MakeLogger("jsbox", VerbosityLevel(args.verbosity));

  Config config;
  try {
    fs::path config_file = args.config ? *args.config : kDefaultConfig;
    if (!ParseConfig(config_file, config) && args.config) {
      logger->error("Failed to read configuration file {}", config_file.string());
      return 1;
    }
    if (args.time_limit) {
      config.time_limit = std::chrono::milliseconds(*args.time_limit);
      config.jail.wall_time = std::max(config.jail.wall_time,
                                       config.time_limit + std::chrono::milliseconds(2000));
    }
    config.Validate();
  } catch (const ConfigurationError& err) {
    logger->error("Invalid configuration: {}", err.what());
    return 1;
  }

  FileStore store(config.state_dir, ComponentLogger(logger, "storage"));
  HttpFetcher fetcher(ComponentLogger(logger, "fetch"));
  LibraryManager::Listener listener;
  listener.OnTrustRequest = [logger](const TrustRequest& req) {
    logger->error("{} ({}) is served from untrusted origin {}; approve it with --trust {}",
                  req.name, req.url, req.origin, req.origin);
  };
  LibraryManager libraries(store, fetcher, ComponentLogger(logger, "libraries"), listener,
                           config.fetch_timeout);
  bool managed = ManageLibraries(args, libraries, logger.get());
  if (!args.script) return managed ? 0 : 1;

  std::string code;
  if (!ReadScript(*args.script, code)) {
    logger->error("Cannot read {}", *args.script);
    return 1;
  }
  NodeSyntaxChecker checker(config.jail.runtime, ComponentLogger(logger, "syntax"));
  if (args.check) {
    auto res = checker.Check(code);
    if (res.valid) {
      std::cout << "OK" << std::endl;
      return kExitCompleted;
    }
    std::cerr << res.ToString() << std::endl;
    return kExitRejected;
  }

  if (geteuid() != 0) {
    logger->error("Must be run as root.");
    return 1;
  }
  try {
    JailedContextFactory factory(config.jail, ComponentLogger(logger, "context"));
    BootstrapTemplate bootstrap(config.template_source, fetcher, ComponentLogger(logger, "bootstrap"));
    SecureRandom random;
    RunWaiter waiter;
    SandboxEngine engine(factory, checker, bootstrap, libraries, random,
                         ComponentLogger(logger, "engine"), config.ToEngineOptions(),
                         waiter.GetReporter());
    if (!engine.Initialize()) {
      logger->error("Cannot create an execution context");
      return 1;
    }
    engine.Execute(code);
    return waiter.Wait();
  } catch (const ConfigurationError& err) {
    logger->error("Invalid configuration: {}", err.what());
    return 1;
  }
}
