#include "utils.h"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <jsbox/logger.h>

std::shared_ptr<spdlog::logger> TestLogger(const std::string& name) {
  return MakeLogger(name, log_level);
}

long FakeContextFactory::Create() {
  std::lock_guard lck(mtx_);
  if (fail_create) return 0;
  long handle = ++next_handle_;
  created_.push_back(handle);
  return handle;
}

void FakeContextFactory::Destroy(long handle) {
  std::lock_guard lck(mtx_);
  destroyed_.push_back(handle);
}

bool FakeContextFactory::Send(long handle, const std::string& program) {
  {
    std::lock_guard lck(mtx_);
    if (fail_send) return false;
    sent_.emplace_back(handle, program);
  }
  if (on_send) on_send(handle, program);
  return true;
}

void FakeContextFactory::OnMessage(MessageHandler handler) {
  std::lock_guard lck(mtx_);
  handler_ = std::move(handler);
}

void FakeContextFactory::Emit(long handle, const std::string& line) {
  std::lock_guard lck(mtx_);
  if (handler_) handler_(handle, line);
}

std::vector<long> FakeContextFactory::Created() {
  std::lock_guard lck(mtx_);
  return created_;
}

std::vector<long> FakeContextFactory::Destroyed() {
  std::lock_guard lck(mtx_);
  return destroyed_;
}

std::vector<std::pair<long, std::string>> FakeContextFactory::Sent() {
  std::lock_guard lck(mtx_);
  return sent_;
}

SyntaxResult FakeSyntaxChecker::Check(const std::string& code) {
  checks++;
  std::string stack;
  for (char c : code) {
    if (c == '(' || c == '[' || c == '{') {
      stack.push_back(c);
    } else if (c == ')' || c == ']' || c == '}') {
      char open = c == ')' ? '(' : c == ']' ? '[' : '{';
      if (stack.empty() || stack.back() != open) {
        return SyntaxResult("SyntaxError", std::string("Unexpected token '") + c + "'");
      }
      stack.pop_back();
    }
  }
  if (stack.size()) return SyntaxResult("SyntaxError", "Unexpected end of input");
  return SyntaxResult();
}

bool FixedRandom::Fill(uint8_t* buf, size_t len) {
  if (fail) return false;
  seq_++;
  for (size_t i = 0; i < len; i++) buf[i] = (uint8_t)(seq_ * 31 + i);
  return true;
}

void FakeFetcher::Serve(const std::string& location, const std::string& body) {
  std::lock_guard lck(mtx_);
  FetchResult res;
  res.ok = true;
  res.status = 200;
  res.body = body;
  responses_[location] = res;
}

void FakeFetcher::Fail(const std::string& location, const std::string& error) {
  std::lock_guard lck(mtx_);
  FetchResult res;
  res.error = error;
  responses_[location] = res;
}

int FakeFetcher::Calls(const std::string& location) {
  std::lock_guard lck(mtx_);
  auto it = calls_.find(location);
  return it == calls_.end() ? 0 : it->second;
}

FetchResult FakeFetcher::Fetch(const std::string& location, std::chrono::milliseconds) {
  std::lock_guard lck(mtx_);
  calls_[location]++;
  auto it = responses_.find(location);
  if (it != responses_.end()) return it->second;
  FetchResult res;
  res.status = 404;
  res.error = "HTTP 404";
  return res;
}

SandboxEngine::Reporter Recorder::GetReporter() {
  SandboxEngine::Reporter reporter;
  reporter.OnMessage = [this](MessageKind kind, const std::vector<std::string>& args) {
    std::lock_guard lck(mtx_);
    messages_.push_back({kind, args});
    cv_.notify_all();
  };
  reporter.OnStatus = [this](RunStatus status) {
    std::lock_guard lck(mtx_);
    statuses_.push_back(status);
    status_times_.push_back(std::chrono::steady_clock::now());
    cv_.notify_all();
  };
  return reporter;
}

bool Recorder::WaitForStatus(RunStatus status, int count, std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx_);
  return cv_.wait_for(lck, timeout, [&]() {
    return std::count(statuses_.begin(), statuses_.end(), status) >= count;
  });
}

bool Recorder::WaitForMessages(size_t count, std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx_);
  return cv_.wait_for(lck, timeout, [&]() { return messages_.size() >= count; });
}

std::vector<Recorder::Message> Recorder::Messages() {
  std::lock_guard lck(mtx_);
  return messages_;
}

std::vector<RunStatus> Recorder::Statuses() {
  std::lock_guard lck(mtx_);
  return statuses_;
}

std::chrono::steady_clock::time_point Recorder::StatusTime(RunStatus status) {
  std::lock_guard lck(mtx_);
  for (size_t i = 0; i < statuses_.size(); i++) {
    if (statuses_[i] == status) return status_times_[i];
  }
  return {};
}

int Recorder::CountStatus(RunStatus status) {
  std::lock_guard lck(mtx_);
  return std::count(statuses_.begin(), statuses_.end(), status);
}

std::string ExtractSecret(const std::string& program) {
  const std::string prefix = "const SECRET = \"";
  size_t pos = program.find(prefix);
  if (pos == std::string::npos) return "";
  pos += prefix.size();
  return program.substr(pos, program.find('"', pos) - pos);
}

std::string MakeEnvelopeLine(const std::string& secret, const std::string& type,
                             const std::vector<std::string>& args) {
  nlohmann::json obj = {
    {"__sandbox", true},
    {"secret", secret},
    {"type", type},
    {"args", args},
  };
  return obj.dump();
}
