#include "procsup/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "procsup/internal/log.hpp"
#include "procsup/process_launcher.hpp"

namespace procsup {

const char* to_string(RunPhase phase) noexcept {
  switch (phase) {
    case RunPhase::not_configured:
      return "not_configured";
    case RunPhase::configured:
      return "configured";
    case RunPhase::started:
      return "started";
    case RunPhase::completed_ok:
      return "completed_ok";
    case RunPhase::completed_failed:
      return "completed_failed";
    case RunPhase::timed_out:
      return "timed_out";
    case RunPhase::stopped:
      return "stopped";
  }
  return "unknown";
}

Supervisor::Supervisor(std::string name)
    : Service(std::move(name)),
      reporter_([this](const FailureRecord& record) { note_failure(record); }) {}

Supervisor::Supervisor(std::string name, const Environment& env,
                       std::vector<std::string> command)
    : Supervisor(std::move(name)) {
  auto configured = configure(env, std::move(command));
  if (!configured) {
    internal::throw_error(configured.error());
  }
}

Supervisor::~Supervisor() {
  stop();
  std::unique_ptr<Launcher> launcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    launcher = std::move(launcher_);
  }
  launcher.reset();
  watcher_.join();
}

Result<void> Supervisor::configure(const Environment& env, std::vector<std::string> command) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (launcher_) {
    return Error{.code = make_error_code(errc::already_configured),
                 .context = name() + ": process already configured"};
  }
  if (command.empty() || command.front().empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = name() + ": empty command"};
  }

  std::unique_ptr<Launcher> launcher =
      factory_ ? factory_(name(), command) : std::make_unique<ProcessLauncher>(name(), command);
  launcher->set_events(this);
  launcher->put_env(env);
  if (output_log_) {
    launcher->set_output_log(*output_log_);
  }
  if (recent_line_limit_) {
    launcher->set_recent_line_limit(*recent_line_limit_);
  }
  launcher_ = std::move(launcher);
  internal::logger()->debug("{}: configured {}", name(), command.front());
  return {};
}

bool Supervisor::is_configured() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return launcher_ != nullptr;
}

void Supervisor::set_timeout(std::chrono::milliseconds duration, int timeout_code) {
  std::lock_guard<std::mutex> lock(mutex_);
  timeout_ = TimeoutConfig{.duration = duration, .exit_code = timeout_code};
}

TimeoutConfig Supervisor::timeout() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timeout_;
}

void Supervisor::set_output_log(std::shared_ptr<spdlog::logger> log) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_log_ = log;
  if (launcher_) {
    launcher_->set_output_log(std::move(log));
  }
}

void Supervisor::set_recent_line_limit(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  recent_line_limit_ = limit;
  if (launcher_) {
    launcher_->set_recent_line_limit(limit);
  }
}

Result<void> Supervisor::set_launcher_factory(LauncherFactory factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (launcher_) {
    return Error{.code = make_error_code(errc::already_configured),
                 .context = name() + ": launcher already created"};
  }
  factory_ = std::move(factory);
  return {};
}

std::optional<int> Supervisor::exit_code() const {
  if (auto* process = launcher()) {
    return process->exit_code();
  }
  return std::nullopt;
}

int Supervisor::exit_code_sign_corrected() const {
  if (auto* process = launcher()) {
    return process->exit_code_sign_corrected().value_or(-1);
  }
  return -1;
}

RunPhase Supervisor::phase() const {
  if (!started_.load()) {
    if (is_in_state(ServiceState::stopped)) {
      return RunPhase::stopped;
    }
    return is_configured() ? RunPhase::configured : RunPhase::not_configured;
  }
  if (!latch_.is_completed()) {
    return RunPhase::started;
  }
  return outcome_.load();
}

std::vector<std::string> Supervisor::recent_output() const {
  if (auto* process = launcher()) {
    return process->recent_output();
  }
  return {};
}

std::vector<std::string> Supervisor::recent_output(bool want_final,
                                                   std::chrono::milliseconds wait) const {
  if (auto* process = launcher()) {
    return process->recent_output(want_final, wait);
  }
  return {};
}

Result<void> Supervisor::on_service_start() {
  Launcher* process = launcher();
  if (process == nullptr) {
    return Error{.code = make_error_code(errc::not_configured),
                 .context = name() + ": process not yet configured"};
  }
  return process->start();
}

void Supervisor::on_service_stop() {
  // Wakes a waiting watcher; a run stopped from outside is never a failure.
  if (latch_.try_set_completed()) {
    outcome_.store(RunPhase::stopped);
  }
  request_termination();
  watcher_.join();
}

void Supervisor::on_process_started() {
  TimeoutConfig config;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config = timeout_;
  }
  started_.store(true);
  internal::logger()->debug("{}: process started", name());
  if (config.duration > std::chrono::milliseconds::zero()) {
    watcher_.schedule(latch_, config.duration,
                      [this, code = config.exit_code](std::chrono::milliseconds elapsed) {
                        handle_timeout(elapsed, code);
                      });
  }
}

void Supervisor::on_process_exited(int raw_code, int corrected_code) {
  std::optional<FailureRecord> record;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bool won = latch_.try_set_completed();
    internal::logger()->debug("{}: process has exited with exit code {} (raw {})", name(),
                              corrected_code, raw_code);
    if (won) {
      outcome_.store(corrected_code != 0 ? RunPhase::completed_failed : RunPhase::completed_ok);
    }
    if (won && corrected_code != 0) {
      record = FailureRecord{
          .kind = FailureKind::exit,
          .code = corrected_code,
          .message = fmt::format("{} failed with code {}", name(), corrected_code)};
    }
  }
  if (record) {
    reporter_.report(std::move(*record));
  }
  stop();
}

void Supervisor::handle_timeout(std::chrono::milliseconds elapsed, int code) {
  outcome_.store(RunPhase::timed_out);
  internal::logger()->info("{}: process timeout: reporting error code {}", name(), code);
  if (is_in_state(ServiceState::started)) {
    request_termination();
  }
  reporter_.report(FailureRecord{
      .kind = FailureKind::timeout,
      .code = code,
      .message = fmt::format("{}: timeout after {} millis: exit code ={}", name(),
                             elapsed.count(), code)});
}

void Supervisor::request_termination() {
  Launcher* process = launcher();
  if (process == nullptr || !process->is_running()) {
    return;
  }
  if (termination_requested_.exchange(true)) {
    return;
  }
  process->stop();
}

Launcher* Supervisor::launcher() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return launcher_.get();
}

}  // namespace procsup
