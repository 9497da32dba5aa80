#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/fwd.h>

#include "procsup/completion_latch.hpp"
#include "procsup/failure.hpp"
#include "procsup/launcher.hpp"
#include "procsup/result.hpp"
#include "procsup/service.hpp"
#include "procsup/timeout_watcher.hpp"

namespace procsup {

/// @brief Execution deadline for one run.
struct TimeoutConfig {
  /// @brief Duration meaning "no deadline".
  static constexpr std::chrono::milliseconds kUnbounded{-1};
  /// @brief Default failure code reported on timeout.
  static constexpr int kDefaultTimeoutCode = 1;

  /// @brief Deadline; only positive values arm the watcher.
  std::chrono::milliseconds duration{kUnbounded};
  /// @brief Code placed in the FailureRecord when the deadline fires.
  int exit_code{kDefaultTimeoutCode};
};

/// @brief Observable progress of a supervised run.
enum class RunPhase : std::uint8_t {
  not_configured,
  configured,
  started,
  completed_ok,
  completed_failed,
  timed_out,
  stopped,
};

/// @brief Lower-case name of a phase, for logs.
const char* to_string(RunPhase phase) noexcept;

/// @brief Service that runs one external process and turns its outcome into a failure.
///
/// Configure exactly once, either through the configuring constructor or through
/// configure(), then start(). When the process exits the service stops itself; a
/// non-zero exit, or a configured deadline passing first, is noted as the service's
/// single FailureRecord. Stopping the service terminates the process without
/// recording a failure.
class Supervisor final : public Service, private LauncherEvents {
 public:
  /// @brief Create an unconfigured supervisor; call configure() before start().
  explicit Supervisor(std::string name);
  /// @brief Create and configure a supervisor. Throws if the command is empty.
  Supervisor(std::string name, const Environment& env, std::vector<std::string> command);
  /// @brief Stop the service, then release the launcher and the watcher.
  ~Supervisor() override;

  /// @brief Create the launcher for `command` with `env` layered over the parent environment.
  Result<void> configure(const Environment& env, std::vector<std::string> command);
  [[nodiscard]] bool is_configured() const;

  /// @brief Set the deadline and the code reported when it fires. Applies from the next start;
  /// a run already started keeps the values it started with.
  void set_timeout(std::chrono::milliseconds duration, int timeout_code);
  [[nodiscard]] TimeoutConfig timeout() const;

  /// @brief Logger for process output; null disables output logging.
  void set_output_log(std::shared_ptr<spdlog::logger> log);
  /// @brief Number of recent output lines kept by the launcher.
  void set_recent_line_limit(std::size_t limit);
  /// @brief Replace the launcher factory. Fails once configured.
  Result<void> set_launcher_factory(LauncherFactory factory);

  /// @brief Raw exit code, empty until the process has exited.
  [[nodiscard]] std::optional<int> exit_code() const;
  /// @brief Sign-corrected exit code, or -1 if unknown.
  [[nodiscard]] int exit_code_sign_corrected() const;

  [[nodiscard]] bool is_process_started() const noexcept { return started_.load(); }
  /// @brief Started and not yet completed.
  [[nodiscard]] bool is_process_running() const noexcept {
    return started_.load() && !latch_.is_completed();
  }
  [[nodiscard]] bool is_process_terminated() const noexcept { return latch_.is_completed(); }
  /// @brief Outcome once the run completed; `stopped` if it was stopped without one.
  ///
  /// Reports `started` until the winner of the completion race has recorded its outcome.
  [[nodiscard]] RunPhase phase() const;

  /// @brief Recent output lines, or an empty list before configuration.
  [[nodiscard]] std::vector<std::string> recent_output() const;
  /// @brief Recent output after waiting up to `wait` for final (or any) output.
  [[nodiscard]] std::vector<std::string> recent_output(bool want_final,
                                                       std::chrono::milliseconds wait) const;

 protected:
  Result<void> on_service_start() override;
  void on_service_stop() override;

 private:
  void on_process_started() override;
  void on_process_exited(int raw_code, int corrected_code) override;

  void handle_timeout(std::chrono::milliseconds elapsed, int timeout_code);
  /// @brief Ask a running launcher to terminate, at most once per run.
  void request_termination();
  [[nodiscard]] Launcher* launcher() const;

  mutable std::mutex mutex_;
  std::unique_ptr<Launcher> launcher_;
  LauncherFactory factory_;
  TimeoutConfig timeout_;
  std::optional<std::shared_ptr<spdlog::logger>> output_log_;
  std::optional<std::size_t> recent_line_limit_;

  CompletionLatch latch_;
  FailureReporter reporter_;
  TimeoutWatcher watcher_;
  std::atomic<bool> started_{false};
  std::atomic<bool> termination_requested_{false};
  /// @brief Recorded by the completion winner; `started` while undecided.
  std::atomic<RunPhase> outcome_{RunPhase::started};
};

}  // namespace procsup
