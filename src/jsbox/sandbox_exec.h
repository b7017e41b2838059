#ifndef SANDBOX_EXEC_H_
#define SANDBOX_EXEC_H_

#include <sys/types.h>
#include <spdlog/logger.h>

#include "sandbox.h"

// Descriptor the helper hands to cjail as the program's stdout
constexpr int kHelperMessageFd = 3;

// A started jsbox-context helper. The helper leads its own process group, so killing -pid
// also reaches the jailed program as long as it stays in that group.
struct SandboxProcess {
  pid_t pid;
  int result_fd; // yields struct cjail_result once the program ends
  SandboxProcess() : pid(-1), result_fd(-1) {}
};

// fork+exec the helper with message_fd as its kHelperMessageFd, then send it the options.
// opt.fd_output is overridden. message_fd is left open in the caller.
bool SandboxSpawn(spdlog::logger&, SandboxOptions opt, int message_fd, SandboxProcess* proc);
// Blocks until the helper exits; timekill == -1 and oomkill == errno on failure
struct cjail_result SandboxWait(spdlog::logger&, SandboxProcess& proc);

#endif  // SANDBOX_EXEC_H_
