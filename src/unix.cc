#include "procsup/unix.hpp"

#include <sys/wait.h>

namespace procsup::unix {

std::optional<int> terminating_signal(const procsup::ExitStatus& status) noexcept {
  int raw = static_cast<int>(status.native());
  if (WIFSIGNALED(raw)) {
    return WTERMSIG(raw);
  }
  return std::nullopt;
}

std::optional<int> raw_wait_status(const procsup::ExitStatus& status) noexcept {
  return static_cast<int>(status.native());
}

procsup::ExitStatus from_wait_status(int status) noexcept {
  auto native = static_cast<std::uint32_t>(status);
  if (WIFSIGNALED(status)) {
    return procsup::ExitStatus::signaled(WTERMSIG(status), native);
  }
  return procsup::ExitStatus::exited(WEXITSTATUS(status), native);
}

}  // namespace procsup::unix
