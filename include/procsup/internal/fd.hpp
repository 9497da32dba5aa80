#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>

#include "procsup/platform.hpp"
#include "procsup/result.hpp"

namespace procsup::internal {

/// @brief Owning file descriptor, closed on destruction.
class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }
  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

/// @brief Both ends of a pipe, close-on-exec.
struct PipeEnds {
  unique_fd read_end;
  unique_fd write_end;
};

inline Error errno_error(const char* context) {
  return Error{.code = std::error_code(errno, std::system_category()), .context = context};
}

inline Result<void> set_cloexec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  if (flags == -1) {
    return errno_error("fcntl(F_GETFD)");
  }
  if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return errno_error("fcntl(F_SETFD)");
  }
  return {};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    return errno_error("fcntl(F_GETFL)");
  }
  if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return errno_error("fcntl(F_SETFL)");
  }
  return {};
}

inline Result<PipeEnds> create_pipe() {
  std::array<int, 2> fds{};
#if PROCSUP_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return Error{.code = make_error_code(errc::pipe_failed), .context = "pipe2"};
  }
  return PipeEnds{unique_fd(fds[0]), unique_fd(fds[1])};
#else
  if (::pipe(fds.data()) == -1) {
    return Error{.code = make_error_code(errc::pipe_failed), .context = "pipe"};
  }
  PipeEnds ends{unique_fd(fds[0]), unique_fd(fds[1])};
  for (int fd : fds) {
    auto cloexec = set_cloexec(fd);
    if (!cloexec) {
      return cloexec.error();
    }
  }
  return ends;
#endif
}

inline Result<unique_fd> open_null_for_read() {
  int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    return errno_error("open(/dev/null)");
  }
  return unique_fd(fd);
}

}  // namespace procsup::internal
