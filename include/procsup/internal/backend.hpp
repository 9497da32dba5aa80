#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "procsup/result.hpp"
#include "procsup/status.hpp"

namespace procsup::internal {

/// @brief Fully lowered description of a process to spawn.
struct SpawnSpec {
  /// @brief Argument vector; argv[0] is the program.
  std::vector<std::string> argv;
  /// @brief Complete environment as KEY=VALUE entries.
  std::vector<std::string> envp;
  /// @brief Optional working directory for the child.
  std::optional<std::filesystem::path> cwd;
};

/// @brief Parent-side view of a spawned child.
struct Spawned {
  int pid = -1;
  /// @brief Read end of the child's stdout, owned by the caller.
  std::optional<int> stdout_fd;
  /// @brief Read end of the child's stderr, owned by the caller.
  std::optional<int> stderr_fd;
};

/// @brief OS seam used by ProcessLauncher; replaceable in tests.
class Backend {
 public:
  virtual ~Backend() = default;
  /// @brief Spawn a child with stdin on /dev/null and piped stdout/stderr.
  virtual Result<Spawned> spawn(const SpawnSpec& spec) = 0;
  /// @brief Block until the child exits and reap it.
  virtual Result<ExitStatus> wait(Spawned& spawned) = 0;
  /// @brief Send SIGTERM.
  virtual Result<void> terminate(Spawned& spawned) = 0;
  /// @brief Send SIGKILL.
  virtual Result<void> kill(Spawned& spawned) = 0;
};

/// @brief Installs a backend for the lifetime of the object, restoring the previous one.
class ScopedBackendOverride {
 public:
  explicit ScopedBackendOverride(Backend& backend);
  ~ScopedBackendOverride();
  ScopedBackendOverride(const ScopedBackendOverride&) = delete;
  ScopedBackendOverride& operator=(const ScopedBackendOverride&) = delete;

 private:
  Backend* previous_ = nullptr;
};

/// @brief The active backend: the innermost override, or the POSIX backend.
Backend& default_backend();

}  // namespace procsup::internal
