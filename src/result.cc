#include "procsup/result.hpp"

#include <stdexcept>

namespace procsup {

namespace {

class procsup_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "procsup"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::not_configured:
        return "process not yet configured";
      case errc::already_configured:
        return "process already configured";
      case errc::invalid_state:
        return "invalid state";
      case errc::empty_argv:
        return "empty argv";
      case errc::pipe_failed:
        return "pipe failed";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::read_failed:
        return "read failed";
      case errc::kill_failed:
        return "kill failed";
      case errc::process_exit_failure:
        return "process exited with a failure code";
      case errc::timeout:
        return "timeout";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static procsup_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  if (error.context.empty()) {
    throw std::runtime_error(error.code.message());
  }
  throw std::runtime_error(error.context + ": " + error.code.message());
}

}  // namespace internal

}  // namespace procsup
