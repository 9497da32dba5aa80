#include "procsup/status.hpp"

namespace procsup {

ExitStatus ExitStatus::exited(
    int code, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.code_ = code;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::signaled(
    int signo, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::signaled;
  status.code_ = signo;
  status.native_ = native;
  return status;
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return code_;
}

std::optional<int> ExitStatus::signal() const noexcept {
  if (kind_ != Kind::signaled) {
    return std::nullopt;
  }
  return code_;
}

int ExitStatus::raw_code() const noexcept { return kind_ == Kind::exited ? code_ : -code_; }

int ExitStatus::sign_corrected_code() const noexcept {
  return kind_ == Kind::exited ? code_ : kSignalExitBase + code_;
}

}  // namespace procsup
