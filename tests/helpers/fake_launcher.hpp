#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "procsup/launcher.hpp"

namespace procsup::testing {

/// @brief State shared between a test and the FakeLauncher a Supervisor owns.
struct FakeProcess {
  // Behaviour knobs, set before start.
  std::optional<Error> start_error;
  /// @brief Exit on its own this long after starting, with exit_raw/exit_corrected.
  std::optional<std::chrono::milliseconds> exit_after;
  int exit_raw = 0;
  int exit_corrected = 0;
  /// @brief Codes reported when stop() terminates the process.
  int stopped_raw = -15;
  int stopped_corrected = 143;
  std::vector<std::string> output;

  // Observations.
  std::atomic<int> launchers_created{0};
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  std::vector<std::string> command;
  Environment env;
  std::shared_ptr<spdlog::logger> output_log;
  bool output_log_set = false;
  std::optional<std::size_t> line_limit;

  std::mutex mutex;
  std::condition_variable cv;
  bool running = false;
  bool exited = false;
  std::optional<std::pair<int, int>> pending_exit;
  std::optional<std::pair<int, int>> codes;

  /// @brief Make the running process exit with the given codes.
  void exit(int raw, int corrected) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (!pending_exit) {
        pending_exit = std::make_pair(raw, corrected);
      }
    }
    cv.notify_all();
  }

  bool wait_running(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return running || exited; });
  }
};

/// @brief Launcher double that delivers its notifications from its own thread.
class FakeLauncher final : public Launcher {
 public:
  FakeLauncher(std::shared_ptr<FakeProcess> process, std::vector<std::string> command)
      : process_(std::move(process)) {
    ++process_->launchers_created;
    process_->command = std::move(command);
  }

  ~FakeLauncher() override {
    process_->exit(process_->stopped_raw, process_->stopped_corrected);
    if (!notifier_.joinable()) {
      return;
    }
    if (notifier_.get_id() == std::this_thread::get_id()) {
      notifier_.detach();
    } else {
      notifier_.join();
    }
  }

  void set_events(LauncherEvents* events) override { events_ = events; }
  void put_env(const Environment& env) override {
    for (const auto& [key, value] : env) {
      process_->env[key] = value;
    }
  }
  void set_output_log(std::shared_ptr<spdlog::logger> log) override {
    process_->output_log = std::move(log);
    process_->output_log_set = true;
  }
  void set_recent_line_limit(std::size_t limit) override { process_->line_limit = limit; }

  Result<void> start() override {
    ++process_->start_calls;
    if (process_->start_error) {
      return *process_->start_error;
    }
    notifier_ = std::thread([this] { run(); });
    return {};
  }

  void stop() override {
    ++process_->stop_calls;
    process_->exit(process_->stopped_raw, process_->stopped_corrected);
  }

  [[nodiscard]] bool is_running() const override {
    std::lock_guard<std::mutex> lock(process_->mutex);
    return process_->running;
  }

  [[nodiscard]] std::optional<int> exit_code() const override {
    std::lock_guard<std::mutex> lock(process_->mutex);
    if (!process_->codes) {
      return std::nullopt;
    }
    return process_->codes->first;
  }

  [[nodiscard]] std::optional<int> exit_code_sign_corrected() const override {
    std::lock_guard<std::mutex> lock(process_->mutex);
    if (!process_->codes) {
      return std::nullopt;
    }
    return process_->codes->second;
  }

  [[nodiscard]] std::vector<std::string> recent_output() const override {
    return process_->output;
  }

  [[nodiscard]] std::vector<std::string> recent_output(
      bool /*want_final*/, std::chrono::milliseconds /*wait*/) const override {
    return process_->output;
  }

 private:
  void run() {
    {
      std::lock_guard<std::mutex> lock(process_->mutex);
      process_->running = true;
    }
    process_->cv.notify_all();
    if (events_ != nullptr) {
      events_->on_process_started();
    }

    std::pair<int, int> codes;
    {
      std::unique_lock<std::mutex> lock(process_->mutex);
      auto has_exit = [this] { return process_->pending_exit.has_value(); };
      if (process_->exit_after) {
        if (!process_->cv.wait_for(lock, *process_->exit_after, has_exit)) {
          process_->pending_exit = std::make_pair(process_->exit_raw, process_->exit_corrected);
        }
      } else {
        process_->cv.wait(lock, has_exit);
      }
      codes = *process_->pending_exit;
      process_->codes = codes;
      process_->running = false;
      process_->exited = true;
    }
    process_->cv.notify_all();
    if (events_ != nullptr) {
      events_->on_process_exited(codes.first, codes.second);
    }
  }

  std::shared_ptr<FakeProcess> process_;
  LauncherEvents* events_ = nullptr;
  std::thread notifier_;
};

/// @brief Factory producing FakeLaunchers bound to `process`.
inline LauncherFactory fake_launcher_factory(std::shared_ptr<FakeProcess> process) {
  return [process = std::move(process)](const std::string& /*name*/,
                                        const std::vector<std::string>& command) {
    return std::make_unique<FakeLauncher>(process, command);
  };
}

}  // namespace procsup::testing
