#ifndef INCLUDE_JSBOX_JAIL_H_
#define INCLUDE_JSBOX_JAIL_H_

#include <chrono>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>

#include <spdlog/logger.h>
#include "context.h"

constexpr std::chrono::milliseconds kSyntaxCheckTimeout{5000};

struct JailOptions {
  std::string runtime; // JavaScript runtime, resolved outside the jail
  // hard limit for one program, whether or not its context is still wanted
  std::chrono::milliseconds wall_time;
  long rss; // KiB
  int uid, gid;
  int proc_num;
  int file_num;
  // bind-mounted into every box
  std::vector<std::string> dirs;

  JailOptions();
  // throws ConfigurationError
  void Validate() const;
};

// Every context is a box directory; every program sent to it is one runtime process under cjail,
// started through the jsbox-context helper, with networking unshared from the host.
// Envelopes come back one per line over a pipe bound to the program's stdout.
// Writes to child pipes, so the host process must ignore SIGPIPE.
class JailedContextFactory : public ContextFactory {
  struct Program;
  struct HandlerSlot {
    std::mutex mtx;
    MessageHandler handler;
  };

  JailOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<HandlerSlot> slot_;
  std::mutex mtx_;
  long next_handle_;
  long next_program_;
  // nullptr while the context has no program
  std::unordered_map<long, std::shared_ptr<Program>> contexts_;

  void StopLocked_(long handle);
  std::shared_ptr<Program> Start_(long handle, long program_id, const std::string& program);

 public:
  JailedContextFactory(const JailOptions& options, std::shared_ptr<spdlog::logger> logger);
  ~JailedContextFactory();

  long Create() override;
  void Destroy(long handle) override;
  bool Send(long handle, const std::string& program) override;
  void OnMessage(MessageHandler handler) override;
};

// Compiles the code with vm.Script in a short-lived runtime process; the code is never run.
// If the runtime itself cannot be used the code is reported valid and left to fail at run time.
// The code goes to the runtime over a pipe; the host process must ignore SIGPIPE.
class NodeSyntaxChecker : public SyntaxChecker {
  std::string runtime_;
  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::milliseconds timeout_;
 public:
  NodeSyntaxChecker(std::string runtime, std::shared_ptr<spdlog::logger> logger,
                    std::chrono::milliseconds timeout = kSyntaxCheckTimeout);
  SyntaxResult Check(const std::string& code) override;
};

#endif  // INCLUDE_JSBOX_JAIL_H_
