#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <condition_variable>

#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <jsbox/engine.h>
#include <jsbox/context.h>
#include <jsbox/fetcher.h>
#include <jsbox/protocol.h>

extern spdlog::level::level_enum log_level;

std::shared_ptr<spdlog::logger> TestLogger(const std::string& name);

// Records everything; messages are delivered only through Emit
class FakeContextFactory : public ContextFactory {
  std::mutex mtx_;
  MessageHandler handler_;
  long next_handle_;
  std::vector<long> created_, destroyed_;
  std::vector<std::pair<long, std::string>> sent_;
 public:
  bool fail_create = false;
  bool fail_send = false;
  // called after a successful Send, without the factory lock
  std::function<void(long, const std::string&)> on_send;

  FakeContextFactory() : next_handle_(0) {}

  long Create() override;
  void Destroy(long handle) override;
  bool Send(long handle, const std::string& program) override;
  void OnMessage(MessageHandler handler) override;

  // as if the program running in the context printed line
  void Emit(long handle, const std::string& line);

  std::vector<long> Created();
  std::vector<long> Destroyed();
  std::vector<std::pair<long, std::string>> Sent();
};

// Bracket balance only
class FakeSyntaxChecker : public SyntaxChecker {
 public:
  int checks = 0;
  SyntaxResult Check(const std::string& code) override;
};

// Deterministic bytes that change on every call
class FixedRandom : public RandomSource {
  uint8_t seq_;
 public:
  bool fail = false;
  FixedRandom() : seq_(0) {}
  bool Fill(uint8_t* buf, size_t len) override;
};

class FakeFetcher : public Fetcher {
  std::mutex mtx_;
  std::map<std::string, FetchResult> responses_;
  std::map<std::string, int> calls_;
 public:
  void Serve(const std::string& location, const std::string& body);
  void Fail(const std::string& location, const std::string& error);
  int Calls(const std::string& location);
  FetchResult Fetch(const std::string& location, std::chrono::milliseconds timeout) override;
};

class Recorder {
 public:
  struct Message {
    MessageKind kind;
    std::vector<std::string> args;
  };
 private:
  std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<Message> messages_;
  std::vector<RunStatus> statuses_;
  std::vector<std::chrono::steady_clock::time_point> status_times_;
 public:
  SandboxEngine::Reporter GetReporter();

  // false on timeout
  bool WaitForStatus(RunStatus status, int count = 1,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
  bool WaitForMessages(size_t count,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  std::vector<Message> Messages();
  std::vector<RunStatus> Statuses();
  // time of the first report of status
  std::chrono::steady_clock::time_point StatusTime(RunStatus status);
  int CountStatus(RunStatus status);
};

// The run secret embedded in a program rendered from the built-in template
std::string ExtractSecret(const std::string& program);
std::string MakeEnvelopeLine(const std::string& secret, const std::string& type,
                             const std::vector<std::string>& args = {});

#endif // TEST_UTILS_H_
