#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <string_view>

#include "procsup/internal/backend.hpp"
#include "procsup/internal/fd.hpp"
#include "procsup/unix.hpp"

namespace procsup::internal {

namespace {

constexpr long kFallbackMaxFd = 256;
constexpr int kExecFailureExitCode = 127;

std::optional<std::string> find_env_value(const std::vector<std::string>& envp,
                                          std::string_view key) {
  for (const auto& entry : envp) {
    if (entry.size() <= key.size()) {
      continue;
    }
    if (entry.compare(0, key.size(), key) != 0 || entry[key.size()] != '=') {
      continue;
    }
    return entry.substr(key.size() + 1);
  }
  return std::nullopt;
}

std::filesystem::path resolve_search_dir(std::string_view raw_dir,
                                         const std::optional<std::filesystem::path>& cwd) {
  std::filesystem::path dir =
      raw_dir.empty() ? std::filesystem::path(".") : std::filesystem::path(raw_dir);
  if (cwd && dir.is_relative()) {
    return *cwd / dir;
  }
  return dir;
}

// Resolve argv[0] before fork so the child only needs async-signal-safe syscalls.
std::string resolve_exec_path(const std::string& argv0, const std::vector<std::string>& envp,
                              const std::optional<std::filesystem::path>& cwd) {
  if (argv0.find('/') != std::string::npos) {
    return argv0;
  }
  std::string path_value = find_env_value(envp, "PATH").value_or("/usr/bin:/bin");
  std::size_t start = 0;
  while (start <= path_value.size()) {
    std::size_t end = path_value.find(':', start);
    std::size_t len = (end == std::string::npos) ? path_value.size() - start : end - start;
    std::string_view dir = std::string_view(path_value).substr(start, len);
    std::filesystem::path candidate = resolve_search_dir(dir, cwd) / argv0;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return argv0;
}

// Descriptors opened by other threads without O_CLOEXEC must not leak into the child.
void close_inherited_fds_after_fork(int keep_fd) {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = kFallbackMaxFd;
  }
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != keep_fd) {
      ::close(fd);
    }
  }
}

[[noreturn]] void fail_in_child(int error_fd) {
  int err = errno;
  ssize_t ignored = ::write(error_fd, &err, sizeof(err));
  (void)ignored;
  _exit(kExecFailureExitCode);
}

Result<ExitStatus> wait_pid(pid_t pid) {
  int status = 0;
  while (true) {
    pid_t rv = ::waitpid(pid, &status, 0);
    if (rv == pid) {
      return unix::from_wait_status(status);
    }
    if (errno == EINTR) {
      continue;
    }
    return Error{.code = std::error_code(errno, std::system_category()), .context = "waitpid"};
  }
}

Result<void> send_signal(const Spawned& spawned, int signo) {
  if (spawned.pid <= 0) {
    return Error{.code = make_error_code(errc::kill_failed), .context = "kill: no process"};
  }
  if (::kill(spawned.pid, signo) == -1) {
    return Error{.code = std::error_code(errno, std::system_category()), .context = "kill"};
  }
  return {};
}

std::vector<char*> to_c_strings(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

class PosixBackend final : public Backend {
 public:
  Result<Spawned> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty()) {
      return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
    }

    auto null_in = open_null_for_read();
    if (!null_in) {
      return null_in.error();
    }
    auto out_pipe = create_pipe();
    if (!out_pipe) {
      return out_pipe.error();
    }
    auto err_pipe = create_pipe();
    if (!err_pipe) {
      return err_pipe.error();
    }
    // Error pipe communicates child setup/exec failures back to the parent.
    auto error_pipe = create_pipe();
    if (!error_pipe) {
      return error_pipe.error();
    }

    std::vector<std::string> argv_copy = spec.argv;
    std::vector<std::string> envp_copy = spec.envp;
    std::vector<char*> argv_c = to_c_strings(argv_copy);
    std::vector<char*> envp_c = to_c_strings(envp_copy);
    std::string exec_path = resolve_exec_path(argv_copy.front(), envp_copy, spec.cwd);

    int child_stdin = null_in->get();
    int child_stdout = out_pipe->write_end.get();
    int child_stderr = err_pipe->write_end.get();
    int error_write_fd = error_pipe->write_end.get();

    pid_t pid = ::fork();
    if (pid == -1) {
      return Error{.code = make_error_code(errc::spawn_failed), .context = "fork"};
    }

    if (pid == 0) {
      if (spec.cwd && ::chdir(spec.cwd->c_str()) == -1) {
        fail_in_child(error_write_fd);
      }
      if (::dup2(child_stdin, STDIN_FILENO) == -1 ||
          ::dup2(child_stdout, STDOUT_FILENO) == -1 ||
          ::dup2(child_stderr, STDERR_FILENO) == -1) {
        fail_in_child(error_write_fd);
      }
      close_inherited_fds_after_fork(error_write_fd);
      ::execve(exec_path.c_str(), argv_c.data(), envp_c.data());
      fail_in_child(error_write_fd);
    }

    // Parent: drop the child's ends so EOF arrives when the child exits.
    null_in->reset();
    out_pipe->write_end.reset();
    err_pipe->write_end.reset();
    error_pipe->write_end.reset();

    int child_errno = 0;
    ssize_t read_result = -1;
    while (true) {
      read_result = ::read(error_pipe->read_end.get(), &child_errno, sizeof(child_errno));
      if (read_result == -1 && errno == EINTR) {
        continue;
      }
      break;
    }
    if (read_result != 0) {
      // Exec failed (or the error pipe broke): reap the child and report.
      int ignored_status = 0;
      while (::waitpid(pid, &ignored_status, 0) == -1 && errno == EINTR) {
      }
      if (read_result > 0) {
        return Error{.code = std::error_code(child_errno, std::system_category()),
                     .context = "spawn " + argv_copy.front()};
      }
      return Error{.code = make_error_code(errc::spawn_failed), .context = "read(error pipe)"};
    }

    Spawned spawned;
    spawned.pid = pid;
    spawned.stdout_fd = out_pipe->read_end.release();
    spawned.stderr_fd = err_pipe->read_end.release();
    return spawned;
  }

  Result<ExitStatus> wait(Spawned& spawned) override { return wait_pid(spawned.pid); }

  Result<void> terminate(Spawned& spawned) override { return send_signal(spawned, SIGTERM); }

  Result<void> kill(Spawned& spawned) override { return send_signal(spawned, SIGKILL); }
};

std::atomic<Backend*> g_backend_override{nullptr};

}  // namespace

ScopedBackendOverride::ScopedBackendOverride(Backend& backend)
    : previous_(g_backend_override.exchange(&backend)) {}

ScopedBackendOverride::~ScopedBackendOverride() { g_backend_override.store(previous_); }

Backend& default_backend() {
  if (auto* override_backend = g_backend_override.load()) {
    return *override_backend;
  }
  static PosixBackend backend;
  return backend;
}

}  // namespace procsup::internal
