#include <jsbox/jail.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <thread>
#include <cstring>

#include <fmt/format.h>
#include <jsbox/paths.h>
#include <jsbox/errors.h>

#include "utils.h"
#include "sandbox_exec.h"

namespace {

constexpr size_t kMaxLineSize = 4 << 20;

} // namespace

JailOptions::JailOptions() :
    runtime("/usr/bin/node"),
    wall_time(6000),
    rss(512 * 1024),
    uid(65534), gid(65534),
    proc_num(64),
    file_num(256),
    dirs{"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"} {}

void JailOptions::Validate() const {
  if (runtime.empty() || runtime[0] != '/') {
    throw ConfigurationError("runtime must be an absolute path, got \"" + runtime + "\"");
  }
  if (wall_time.count() <= 0) {
    throw ConfigurationError(fmt::format("context wall time must be positive, got {}ms", wall_time.count()));
  }
  if (rss <= 0) throw ConfigurationError(fmt::format("context rss must be positive, got {}KiB", rss));
  if (uid < 0 || gid < 0) throw ConfigurationError("context uid/gid must not be negative");
}

// One started program and the thread reading its messages. Shared with that thread, which
// outlives Destroy() until the program is gone.
struct JailedContextFactory::Program {
  long handle;
  fs::path box;
  SandboxProcess proc;
  int msg_fd;
  int stop_fd[2];
  std::atomic_bool stopped;
  std::shared_ptr<spdlog::logger> logger;
  std::shared_ptr<HandlerSlot> slot;

  Program() : msg_fd(-1), stop_fd{-1, -1}, stopped(false) {}

  void Stop() {
    if (stopped.exchange(true)) return;
    char c = 0;
    IGNORE_RETURN(write(stop_fd[1], &c, 1));
  }

  void Deliver(const std::string& line) {
    std::lock_guard lck(slot->mtx);
    if (stopped || !slot->handler) return;
    slot->handler(handle, line);
  }

  void ReadLoop() {
    std::string buf;
    bool discarding = false, killed = false;
    while (true) {
      struct pollfd pfds[2] = {{msg_fd, POLLIN, 0}, {stop_fd[0], POLLIN, 0}};
      int r = poll(pfds, 2, -1);
      if (r < 0) {
        if (errno == EINTR) continue;
        logger->warn("poll failed on context {}: {}", handle, strerror(errno));
        killed = true;
        break;
      }
      if (pfds[1].revents) {
        killed = true;
        break;
      }
      if (!pfds[0].revents) continue;
      char chunk[65536];
      ssize_t n = read(msg_fd, chunk, sizeof(chunk));
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
      if (n <= 0) break;
      buf.append(chunk, n);
      size_t start = 0;
      for (size_t nl; (nl = buf.find('\n', start)) != std::string::npos; start = nl + 1) {
        if (discarding) {
          discarding = false;
          continue;
        }
        Deliver(buf.substr(start, nl - start));
      }
      buf.erase(0, start);
      if (buf.size() > kMaxLineSize) {
        if (!discarding) logger->warn("Discarding oversized message from context {}", handle);
        buf.clear();
        discarding = true;
      }
    }
    close(msg_fd);
    msg_fd = -1;
    if (killed && proc.pid > 0) kill(-proc.pid, SIGKILL);
    struct cjail_result res = SandboxWait(*logger, proc);
    if (!killed && res.timekill == 1) {
      logger->warn("Program in context {} hit the wall time limit", handle);
    } else if (!killed && res.oomkill > 0 && res.timekill != -1) {
      logger->warn("Program in context {} ran out of memory", handle);
    } else {
      logger->debug("Program in context {} ended (killed={} status={})",
                    handle, killed, res.info.si_status);
    }
    for (int& fd : stop_fd) {
      close(fd);
      fd = -1;
    }
    RemoveAll(*logger, box);
  }
};

JailedContextFactory::JailedContextFactory(const JailOptions& options,
                                           std::shared_ptr<spdlog::logger> logger) :
    options_(options), logger_(std::move(logger)), slot_(std::make_shared<HandlerSlot>()),
    next_handle_(0), next_program_(0) {
  options_.Validate();
}

JailedContextFactory::~JailedContextFactory() {
  std::lock_guard lck(mtx_);
  for (auto& i : contexts_) StopLocked_(i.first);
  contexts_.clear();
}

long JailedContextFactory::Create() {
  std::lock_guard lck(mtx_);
  long handle = ++next_handle_;
  contexts_[handle] = nullptr;
  logger_->debug("Context {} created", handle);
  return handle;
}

void JailedContextFactory::StopLocked_(long handle) {
  auto it = contexts_.find(handle);
  if (it == contexts_.end() || !it->second) return;
  it->second->Stop();
  it->second = nullptr;
}

void JailedContextFactory::Destroy(long handle) {
  std::lock_guard lck(mtx_);
  StopLocked_(handle);
  if (contexts_.erase(handle)) logger_->debug("Context {} destroyed", handle);
}

std::shared_ptr<JailedContextFactory::Program> JailedContextFactory::Start_(
    long handle, long program_id, const std::string& program) {
  auto prog = std::make_shared<Program>();
  prog->handle = handle;
  prog->box = ContextBoxPath(handle, program_id);
  prog->logger = logger_;
  prog->slot = slot_;

  if (!CreateDirs(*logger_, prog->box, kPerm755) ||
      !WriteFile(*logger_, ContextBoxProgram(handle, program_id), program, kPerm644)) {
    RemoveAll(*logger_, prog->box);
    return nullptr;
  }

  SandboxOptions opt;
  opt.boxdir = prog->box;
  opt.command = {options_.runtime, ContextBoxProgram(-1, -1, true)};
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.workdir = "/";
  opt.sharenet = false;
  opt.uid = options_.uid;
  opt.gid = options_.gid;
  opt.wall_time = std::chrono::duration_cast<std::chrono::microseconds>(options_.wall_time).count();
  opt.rss = options_.rss;
  opt.proc_num = options_.proc_num;
  opt.file_num = options_.file_num;
  opt.dirs = options_.dirs;
  opt.FilterDirs();

  int msg_pipe[2];
  if (pipe2(msg_pipe, O_CLOEXEC) < 0) {
    logger_->warn("Failed creating message pipe: {}", strerror(errno));
    RemoveAll(*logger_, prog->box);
    return nullptr;
  }
  if (pipe2(prog->stop_fd, O_CLOEXEC) < 0) {
    logger_->warn("Failed creating stop pipe: {}", strerror(errno));
    close(msg_pipe[0]);
    close(msg_pipe[1]);
    RemoveAll(*logger_, prog->box);
    return nullptr;
  }
  bool spawned = SandboxSpawn(*logger_, std::move(opt), msg_pipe[1], &prog->proc);
  // the program holds the only write end from now on, so its exit shows up as EOF
  close(msg_pipe[1]);
  if (!spawned) {
    close(msg_pipe[0]);
    for (int fd : prog->stop_fd) close(fd);
    RemoveAll(*logger_, prog->box);
    return nullptr;
  }
  prog->msg_fd = msg_pipe[0];
  std::thread([prog]() { prog->ReadLoop(); }).detach();
  return prog;
}

bool JailedContextFactory::Send(long handle, const std::string& program) {
  std::lock_guard lck(mtx_);
  auto it = contexts_.find(handle);
  if (it == contexts_.end()) {
    logger_->warn("Send to unknown context {}", handle);
    return false;
  }
  StopLocked_(handle);
  long program_id = ++next_program_;
  auto prog = Start_(handle, program_id, program);
  if (!prog) return false;
  it->second = std::move(prog);
  logger_->debug("Context {} running program {}", handle, program_id);
  return true;
}

void JailedContextFactory::OnMessage(MessageHandler handler) {
  std::lock_guard lck(slot_->mtx);
  slot_->handler = std::move(handler);
}
