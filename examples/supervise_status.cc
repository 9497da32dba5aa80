#include <spdlog/cfg/env.h>

#include <chrono>
#include <iostream>

#include "procsup/supervisor.hpp"

int main() {
  spdlog::cfg::load_env_levels();

  procsup::Supervisor supervisor("exit-seven", {}, {"/bin/sh", "-c", "exit 7"});
  supervisor.add_fault_handler([](const procsup::FailureRecord& record) {
    std::cout << "fault: " << record.message << "\n";
  });

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
  if (!failure || failure->code != 7 || supervisor.exit_code() != 7) {
    std::cerr << "unexpected outcome: " << procsup::to_string(supervisor.phase()) << "\n";
    return 1;
  }

  return 0;
}
