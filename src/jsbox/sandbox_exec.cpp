#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>

#include <fmt/ranges.h>
#include <jsbox/paths.h>

#include "utils.h"

bool SandboxSpawn(spdlog::logger& logger, SandboxOptions opt, int message_fd, SandboxProcess* proc) {
  opt.fd_output = kHelperMessageFd;
  auto cmd = ContextHelperPath();
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  pid_t pid;
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    // only async-signal-safe calls from here on
    setpgid(0, 0);
    int opt_fd = MoveFdAbove(outpipe[0], 10);
    int res_fd = MoveFdAbove(inpipe[1], 10);
    int msg_fd = MoveFdAbove(message_fd, 10);
    if (opt_fd < 0 || res_fd < 0 || msg_fd < 0) _exit(1);
    if (dup2(opt_fd, 0) < 0 || dup2(res_fd, 1) < 0 || dup2(msg_fd, kHelperMessageFd) < 0) _exit(1);
    CloseFrom(kHelperMessageFd + 1);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  // also in the parent, so that a kill right after spawning cannot miss the group
  setpgid(pid, pid);
  close(inpipe[1]);
  close(outpipe[0]);
  inpipe[1] = outpipe[0] = -1;
  logger.debug("jsbox-context pid={} childpid={} boxdir={} command={}",
               getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
  {
    auto vec = opt.Serialize();
    long size = vec.size();
    if (!WriteAll(outpipe[1], &size, sizeof(size)) ||
        !WriteAll(outpipe[1], vec.data(), vec.size())) {
      int err = errno;
      kill(-pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      errno = err;
      goto err;
    }
  }
  close(outpipe[1]);
  proc->pid = pid;
  proc->result_fd = inpipe[0];
  return true;
err:
  logger.warn("SandboxSpawn error: errno={} {}", errno, strerror(errno));
  for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) {
    if (fd >= 0) close(fd);
  }
  return false;
}

struct cjail_result SandboxWait(spdlog::logger& logger, SandboxProcess& proc) {
  struct cjail_result ret = {};
  bool ok = proc.result_fd >= 0 && ReadAll(proc.result_fd, &ret, sizeof(ret));
  int err = errno;
  if (proc.result_fd >= 0) close(proc.result_fd);
  proc.result_fd = -1;
  if (proc.pid > 0) {
    while (waitpid(proc.pid, nullptr, 0) < 0 && errno == EINTR);
    proc.pid = -1;
  }
  if (!ok) {
    // killed before reporting
    ret = {};
    ret.oomkill = err;
    ret.timekill = -1;
    return ret;
  }
  if (ret.timekill == -1) {
    logger.warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
}
