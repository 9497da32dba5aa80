#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "procsup/launcher.hpp"
#include "procsup/status.hpp"

namespace procsup {

/// @brief Launcher that forks a real child process.
///
/// stdin is attached to /dev/null; stdout and stderr are piped, split into lines, logged
/// to the output log and kept in a RecentOutputBuffer. A notification thread reports
/// start and exit to the LauncherEvents target. Exit is reported as soon as the process
/// is reaped; the recent output is marked final once the pipes reach EOF (or after
/// kFinalOutputGrace if descendants keep them open).
class ProcessLauncher final : public Launcher {
 public:
  /// @brief Default delay between SIGTERM and SIGKILL in stop().
  static constexpr std::chrono::milliseconds kDefaultKillGrace{200};
  /// @brief How long output may keep draining after the process exits.
  static constexpr std::chrono::milliseconds kFinalOutputGrace{1000};

  /// @brief Prepare a launcher; `command[0]` is the program, resolved on PATH.
  ProcessLauncher(std::string name, std::vector<std::string> command);
  /// @brief Stop the process if running and join the launcher threads.
  ~ProcessLauncher() override;
  ProcessLauncher(const ProcessLauncher&) = delete;
  ProcessLauncher& operator=(const ProcessLauncher&) = delete;

  void set_events(LauncherEvents* events) override;
  void put_env(const Environment& env) override;
  void set_output_log(std::shared_ptr<spdlog::logger> log) override;
  void set_recent_line_limit(std::size_t limit) override;
  /// @brief Run the child in `dir` instead of the current directory.
  void set_working_dir(std::filesystem::path dir);
  /// @brief Delay between SIGTERM and SIGKILL in stop().
  void set_kill_grace(std::chrono::milliseconds grace);

  Result<void> start() override;
  /// @brief SIGTERM, then SIGKILL if the process is still running after the kill grace.
  void stop() override;
  [[nodiscard]] bool is_running() const override;

  /// @brief Process id, or -1 before start.
  [[nodiscard]] int pid() const;
  /// @brief Full exit status, once the process has exited.
  [[nodiscard]] std::optional<ExitStatus> exit_status() const;
  [[nodiscard]] std::optional<int> exit_code() const override;
  [[nodiscard]] std::optional<int> exit_code_sign_corrected() const override;

  [[nodiscard]] std::vector<std::string> recent_output() const override;
  [[nodiscard]] std::vector<std::string> recent_output(
      bool want_final, std::chrono::milliseconds wait) const override;

 private:
  /// @brief Opaque state shared with the launcher threads.
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace procsup
