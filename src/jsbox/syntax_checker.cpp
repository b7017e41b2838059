#include <jsbox/jail.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>

#include <nlohmann/json.hpp>

#include "utils.h"

namespace {

// Reads the code from stdin, compiles it without running it, prints one JSON object
const char kCheckScript[] = R"js(
const vm = require('vm');
const chunks = [];
process.stdin.on('data', (c) => chunks.push(c));
process.stdin.on('end', () => {
  const code = Buffer.concat(chunks).toString('utf8');
  let reply = { valid: true };
  try {
    new vm.Script(code, { filename: 'user-code.js' });
  } catch (e) {
    reply = { valid: false, name: String(e && e.name), message: String(e && e.message) };
  }
  process.stdout.write(JSON.stringify(reply));
});
)js";

constexpr size_t kMaxReply = 1 << 16;

} // namespace

std::string SyntaxResult::ToString() const {
  if (valid) return "";
  if (name.empty()) return error;
  return name + ": " + error;
}

NodeSyntaxChecker::NodeSyntaxChecker(std::string runtime, std::shared_ptr<spdlog::logger> logger,
                                     std::chrono::milliseconds timeout) :
    runtime_(std::move(runtime)), logger_(std::move(logger)), timeout_(timeout) {}

SyntaxResult NodeSyntaxChecker::Check(const std::string& code) {
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) {
    logger_->warn("Syntax check unavailable: pipe: {}", strerror(errno));
    for (int fd : {inpipe[0], inpipe[1]}) {
      if (fd >= 0) close(fd);
    }
    return SyntaxResult();
  }
  pid_t pid = fork();
  if (pid < 0) {
    logger_->warn("Syntax check unavailable: fork: {}", strerror(errno));
    for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) close(fd);
    return SyntaxResult();
  }
  if (pid == 0) {
    int in_fd = MoveFdAbove(inpipe[0], 10);
    int out_fd = MoveFdAbove(outpipe[1], 10);
    if (in_fd < 0 || out_fd < 0 || dup2(in_fd, 0) < 0 || dup2(out_fd, 1) < 0) _exit(127);
    CloseFrom(3);
    execl(runtime_.c_str(), runtime_.c_str(), "-e", kCheckScript, nullptr);
    _exit(127);
  }
  close(inpipe[0]);
  close(outpipe[1]);

  // the checker only reads stdin to the end, so this write cannot deadlock against our read
  bool written = WriteAll(inpipe[1], code.data(), code.size());
  close(inpipe[1]);

  std::string reply;
  bool timed_out = false;
  auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (reply.size() < kMaxReply) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
      timed_out = true;
      break;
    }
    struct pollfd pfd = {outpipe[0], POLLIN, 0};
    int r = poll(&pfd, 1, (int)left);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) {
      timed_out = r == 0;
      break;
    }
    char buf[4096];
    ssize_t n = read(outpipe[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    reply.append(buf, n);
  }
  close(outpipe[0]);
  if (timed_out) kill(pid, SIGKILL);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);

  if (timed_out) {
    logger_->warn("Syntax check timed out after {}ms", timeout_.count());
    return SyntaxResult();
  }
  if (!written || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    logger_->warn("Syntax check unavailable: {} exited abnormally (status {})", runtime_, status);
    return SyntaxResult();
  }
  try {
    auto obj = nlohmann::json::parse(reply);
    if (obj.value("valid", true)) return SyntaxResult();
    return SyntaxResult(obj.value("name", std::string("SyntaxError")),
                        obj.value("message", std::string()));
  } catch (nlohmann::json::exception& e) {
    logger_->warn("Syntax check returned malformed reply: {}", e.what());
    return SyntaxResult();
  }
}
