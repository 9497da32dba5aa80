#include <spdlog/cfg/env.h>

#include <chrono>
#include <iostream>

#include "procsup/supervisor.hpp"

int main() {
  spdlog::cfg::load_env_levels();

  constexpr int kTimeoutCode = 124;
  procsup::Supervisor supervisor("sleeper", {}, {"/bin/sleep", "5"});
  supervisor.set_timeout(std::chrono::milliseconds(100), kTimeoutCode);

  auto started = supervisor.start();
  if (!started) {
    std::cerr << "start failed: " << started.error().context << " "
              << started.error().code.message() << "\n";
    return 1;
  }
  if (!supervisor.wait_for_service_to_stop(std::chrono::seconds(10))) {
    std::cerr << "service did not stop\n";
    return 1;
  }

  auto failure = supervisor.failure();
  if (!failure || failure->kind != procsup::FailureKind::timeout) {
    std::cerr << "expected timeout but got " << procsup::to_string(supervisor.phase()) << "\n";
    return 1;
  }
  auto error = failure->to_error();
  if (error.code != procsup::make_error_code(procsup::errc::timeout) ||
      failure->code != kTimeoutCode) {
    std::cerr << "unexpected failure: " << error.context << "\n";
    return 1;
  }

  return 0;
}
