#include <jsbox/engine.h>

#include <fmt/ranges.h>
#include <jsbox/utils.h>
#include <jsbox/errors.h>

void EngineOptions::Validate() const {
  if (time_limit.count() <= 0) {
    throw ConfigurationError(fmt::format("time limit must be positive, got {}ms", time_limit.count()));
  }
}

SandboxEngine::SandboxEngine(ContextFactory& factory, SyntaxChecker& checker,
                             BootstrapTemplate& bootstrap, LibraryManager& libraries,
                             RandomSource& random, std::shared_ptr<spdlog::logger> logger,
                             const EngineOptions& options, Reporter reporter) :
    factory_(factory), checker_(checker), bootstrap_(bootstrap), libraries_(libraries),
    random_(random), logger_(std::move(logger)), options_(options),
    reporter_(std::move(reporter)), status_(RunStatus::IDLE), context_(0), run_id_(0),
    initialized_(false), busy_(false), timer_run_id_(0), stopping_(false) {
  options_.Validate();
  factory_.OnMessage([this](long handle, const std::string& line) {
    std::lock_guard lck(queue_mtx_);
    if (stopping_) return;
    events_.push_back({EventType::MESSAGE, handle, line});
    queue_cv_.notify_one();
  });
  dispatcher_ = std::thread(&SandboxEngine::DispatchLoop_, this);
}

SandboxEngine::~SandboxEngine() {
  factory_.OnMessage(nullptr);
  {
    std::lock_guard lck(mtx_);
    CancelTimerLocked_();
    if (context_) factory_.Destroy(context_);
    context_ = 0;
    secret_.clear();
  }
  {
    std::lock_guard lck(queue_mtx_);
    stopping_ = true;
    queue_cv_.notify_one();
  }
  dispatcher_.join();
}

void SandboxEngine::SetStatusLocked_(RunStatus status) {
  logger_->debug("Status {} -> {}", RunStatusName(status_), RunStatusName(status));
  status_ = status;
  if (reporter_.OnStatus) reporter_.OnStatus(status);
}

void SandboxEngine::ReportMessage_(MessageKind kind, const std::vector<std::string>& args) {
  if (reporter_.OnMessage) reporter_.OnMessage(kind, args);
}

void SandboxEngine::ArmTimerLocked_() {
  std::lock_guard lck(queue_mtx_);
  deadline_ = std::chrono::steady_clock::now() + options_.time_limit;
  timer_run_id_ = run_id_;
  queue_cv_.notify_one();
}

void SandboxEngine::CancelTimerLocked_() {
  std::lock_guard lck(queue_mtx_);
  deadline_.reset();
}

bool SandboxEngine::EnsureContextLocked_() {
  if (context_) return true;
  context_ = factory_.Create();
  if (!context_) {
    logger_->error("Failed to create execution context");
    return false;
  }
  logger_->debug("Created context {}", context_);
  return true;
}

void SandboxEngine::ResetLocked_() {
  CancelTimerLocked_();
  if (context_) {
    logger_->debug("Destroying context {}", context_);
    factory_.Destroy(context_);
    context_ = 0;
  }
  busy_ = false;
  secret_.clear();
  ++run_id_;
  EnsureContextLocked_();
  SetStatusLocked_(RunStatus::RESET);
  SetStatusLocked_(RunStatus::IDLE);
}

bool SandboxEngine::Initialize() {
  std::lock_guard lck(mtx_);
  bootstrap_.Initialize();
  initialized_ = true;
  return EnsureContextLocked_();
}

SyntaxResult SandboxEngine::ValidateSyntax(const std::string& code) {
  return checker_.Check(code);
}

void SandboxEngine::Execute(const std::string& code) {
  long run_id;
  {
    std::lock_guard lck(mtx_);
    if (!initialized_) {
      bootstrap_.Initialize();
      initialized_ = true;
    }
    // supersede whatever is in flight before anything else can fail
    run_id = ++run_id_;
    CancelTimerLocked_();
    bool strong;
    secret_ = GenerateSecret(random_, &strong);
    if (!strong) logger_->warn("Secure random source unavailable; using a weaker run secret");
    SetStatusLocked_(RunStatus::VALIDATING);
  }

  SyntaxResult syntax = checker_.Check(code);
  if (!syntax.valid) {
    std::lock_guard lck(mtx_);
    if (run_id != run_id_) return;
    logger_->info("Rejected code: {}", syntax.ToString());
    SetStatusLocked_(RunStatus::REJECTED);
    ReportMessage_(MessageKind::ERROR, {syntax.ToString()});
    SetStatusLocked_(RunStatus::COMPLETED);
    // the superseded program lost its timer above and may never finish
    if (busy_) {
      logger_->info("Discarding context {} of the superseded run", context_);
      ResetLocked_();
    }
    return;
  }

  // bounded by the fetch timeouts; no engine lock is held meanwhile
  std::string bundle = libraries_.BuildBundle();
  std::string policy = libraries_.BuildPolicy();

  std::lock_guard lck(mtx_);
  if (run_id != run_id_) {
    logger_->debug("Run {} superseded before start", run_id);
    return;
  }
  std::string program = bootstrap_.Render(code, secret_, bundle, policy);
  if (!EnsureContextLocked_() || !factory_.Send(context_, program)) {
    logger_->error("Failed to start run {} in context {}", run_id, context_);
    ReportMessage_(MessageKind::ERROR, {"Failed to start the execution context"});
    secret_.clear();
    SetStatusLocked_(RunStatus::COMPLETED);
    return;
  }
  busy_ = true;
  logger_->info("Run {} started in context {}", run_id, context_);
  SetStatusLocked_(RunStatus::EXECUTING);
  ArmTimerLocked_();
}

void SandboxEngine::Reset() {
  std::lock_guard lck(mtx_);
  logger_->info("Reset requested");
  ResetLocked_();
}

RunStatus SandboxEngine::CurrentStatus() {
  std::lock_guard lck(mtx_);
  return status_;
}

void SandboxEngine::HandleMessage_(long handle, const std::string& line) {
  DropReason reason = DropReason::MALFORMED;
  auto env = ParseEnvelope(line, &reason);
  std::lock_guard lck(mtx_);
  if (!env) {
    // not an envelope at all; stray output of the program
  } else if (handle != context_) {
    reason = DropReason::STALE_CONTEXT;
  } else if (!env->authentic) {
    reason = DropReason::NOT_AUTHENTIC;
  } else if (secret_.empty()) {
    reason = DropReason::NO_ACTIVE_RUN;
  } else if (env->secret != secret_) {
    reason = DropReason::SECRET_MISMATCH;
  } else {
    if (env->kind == MessageKind::DONE) {
      if (status_ != RunStatus::EXECUTING) return;
      CancelTimerLocked_();
      busy_ = false;
      logger_->info("Run {} completed", run_id_);
      SetStatusLocked_(RunStatus::COMPLETED);
      return;
    }
    if (env->kind == MessageKind::ERROR) {
      logger_->warn("Context error: {}", fmt::join(env->args, " "));
    }
    ReportMessage_(env->kind, env->args);
    return;
  }
  logger_->debug("Dropped message from context {}: {}", handle, DropReasonName(reason));
}

void SandboxEngine::HandleTimer_(long run_id) {
  std::lock_guard lck(mtx_);
  if (run_id != run_id_ || status_ != RunStatus::EXECUTING) return;
  logger_->warn("Run {} exceeded {}ms", run_id, options_.time_limit.count());
  SetStatusLocked_(RunStatus::TIMEOUT);
  ReportMessage_(MessageKind::ERROR,
      {fmt::format("Execution timeout ({}ms). Context reset.", options_.time_limit.count())});
  ResetLocked_();
}

void SandboxEngine::DispatchLoop_() {
  std::unique_lock lck(queue_mtx_);
  while (!stopping_) {
    // expiry goes ahead of queued messages so that a flood cannot delay it
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
      events_.push_front({EventType::TIMER, timer_run_id_, ""});
      deadline_.reset();
    }
    if (events_.empty()) {
      if (deadline_) {
        queue_cv_.wait_until(lck, *deadline_);
      } else {
        queue_cv_.wait(lck);
      }
      continue;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    lck.unlock();
    if (event.type == EventType::MESSAGE) {
      HandleMessage_(event.id, event.line);
    } else {
      HandleTimer_(event.id);
    }
    lck.lock();
  }
}
