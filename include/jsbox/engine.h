#ifndef INCLUDE_JSBOX_ENGINE_H_
#define INCLUDE_JSBOX_ENGINE_H_

#include <chrono>
#include <deque>
#include <mutex>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <functional>
#include <condition_variable>

#include <spdlog/logger.h>
#include "context.h"
#include "protocol.h"
#include "bootstrap.h"
#include "libraries.h"

#define ENUM_RUN_STATUS_ \
  X(IDLE, "idle") \
  X(VALIDATING, "validating") \
  X(REJECTED, "rejected") \
  X(EXECUTING, "executing") \
  X(COMPLETED, "completed") \
  X(TIMEOUT, "timeout") \
  X(RESET, "reset")
enum class RunStatus {
#define X(name, desc) name,
  ENUM_RUN_STATUS_
#undef X
};

constexpr std::chrono::milliseconds kDefaultTimeLimit{4000};

struct EngineOptions {
  std::chrono::milliseconds time_limit;
  EngineOptions() : time_limit(kDefaultTimeLimit) {}
  // throws ConfigurationError
  void Validate() const;
};

// Runs untrusted code one run at a time in a replaceable execution context.
//
// Every Execute call gets a fresh secret; a message reaches the sinks only if it comes from the
// current context and carries the current secret. Context messages and timer expiry are handled
// on a dispatcher thread owned by the engine; Execute/Reset report from the calling thread.
// Sinks must not call back into the engine synchronously.
class SandboxEngine {
 public:
  struct Reporter {
    // these functions should not block
    std::function<void(MessageKind, const std::vector<std::string>&)> OnMessage;
    std::function<void(RunStatus)> OnStatus;
  };

 private:
  enum class EventType { MESSAGE, TIMER };
  struct Event {
    EventType type;
    long id; // context handle for MESSAGE, run id for TIMER
    std::string line;
  };

  ContextFactory& factory_;
  SyntaxChecker& checker_;
  BootstrapTemplate& bootstrap_;
  LibraryManager& libraries_;
  RandomSource& random_;
  std::shared_ptr<spdlog::logger> logger_;
  EngineOptions options_;
  Reporter reporter_;

  // run state; lock order is mtx_ before queue_mtx_
  std::mutex mtx_;
  RunStatus status_;
  long context_;
  std::string secret_; // empty while no run is active
  long run_id_;
  bool initialized_;
  bool busy_; // context_ runs a program that has not sent done yet

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<Event> events_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  long timer_run_id_;
  bool stopping_;
  std::thread dispatcher_;

  void SetStatusLocked_(RunStatus);
  void ReportMessage_(MessageKind, const std::vector<std::string>&);
  void ArmTimerLocked_();
  void CancelTimerLocked_();
  bool EnsureContextLocked_();
  void ResetLocked_();
  void HandleMessage_(long handle, const std::string& line);
  void HandleTimer_(long run_id);
  void DispatchLoop_();

 public:
  SandboxEngine(ContextFactory& factory, SyntaxChecker& checker, BootstrapTemplate& bootstrap,
                LibraryManager& libraries, RandomSource& random,
                std::shared_ptr<spdlog::logger> logger,
                const EngineOptions& options = EngineOptions(), Reporter reporter = {});
  ~SandboxEngine();
  SandboxEngine(const SandboxEngine&) = delete;
  SandboxEngine& operator=(const SandboxEngine&) = delete;

  // Loads the bootstrap template and creates the first context. Never throws for template
  // problems; returns false only if no context could be created.
  bool Initialize();
  SyntaxResult ValidateSyntax(const std::string& code);
  // Results arrive through the reporter. Supersedes any run in flight.
  void Execute(const std::string& code);
  // Discards the context and whatever runs in it; status returns to idle
  void Reset();

  RunStatus CurrentStatus();
  std::chrono::milliseconds TimeLimit() const { return options_.time_limit; }
};

#endif  // INCLUDE_JSBOX_ENGINE_H_
