#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/fwd.h>

#include "procsup/result.hpp"

namespace procsup {

/// @brief Environment variables layered over the parent environment.
using Environment = std::map<std::string, std::string>;

/// @brief Notifications a Launcher delivers about its process.
///
/// `on_process_started` always precedes `on_process_exited` for a run. Both are invoked
/// on the launcher's notification thread, with no launcher lock held.
class LauncherEvents {
 public:
  virtual void on_process_started() = 0;
  /// @brief The process exited; `corrected_code` is the sign-corrected exit code.
  virtual void on_process_exited(int raw_code, int corrected_code) = 0;

 protected:
  ~LauncherEvents() = default;
};

/// @brief Runs one external process and reports on it asynchronously.
class Launcher {
 public:
  virtual ~Launcher() = default;

  /// @brief Target for lifecycle notifications; must be set before start().
  virtual void set_events(LauncherEvents* events) = 0;
  /// @brief Merge variables into the child's environment; later keys override.
  virtual void put_env(const Environment& env) = 0;
  /// @brief Logger for process output lines; null disables output logging.
  virtual void set_output_log(std::shared_ptr<spdlog::logger> log) = 0;
  /// @brief Number of recent output lines retained.
  virtual void set_recent_line_limit(std::size_t limit) = 0;

  /// @brief Begin execution; returns once the process is spawned, not when it exits.
  virtual Result<void> start() = 0;
  /// @brief Ask the process to terminate. No-op if it is not running.
  virtual void stop() = 0;
  [[nodiscard]] virtual bool is_running() const = 0;

  /// @brief Raw exit code, once the process has exited.
  [[nodiscard]] virtual std::optional<int> exit_code() const = 0;
  /// @brief Sign-corrected exit code, once the process has exited.
  [[nodiscard]] virtual std::optional<int> exit_code_sign_corrected() const = 0;

  /// @brief Recent output lines, oldest first. Never blocks.
  [[nodiscard]] virtual std::vector<std::string> recent_output() const = 0;
  /// @brief Recent output after waiting up to `wait` for final (or any) output.
  [[nodiscard]] virtual std::vector<std::string> recent_output(
      bool want_final, std::chrono::milliseconds wait) const = 0;
};

/// @brief Creates the launcher for a named service and its command.
using LauncherFactory = std::function<std::unique_ptr<Launcher>(
    const std::string& name, const std::vector<std::string>& command)>;

}  // namespace procsup
