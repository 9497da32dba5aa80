#include <spdlog/cfg/env.h>

#include <chrono>
#include <iostream>
#include <thread>

#include "procsup/supervisor.hpp"

int main() {
  spdlog::cfg::load_env_levels();

  procsup::Supervisor supervisor("long-running", {}, {"/bin/sleep", "30"});
  auto started = supervisor.start();
  if (!started) {
    std::cerr << "start failed: " << started.error().context << " "
              << started.error().code.message() << "\n";
    return 1;
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  supervisor.stop();
  supervisor.stop();

  if (!supervisor.is_process_terminated() || supervisor.failure()) {
    std::cerr << "stop should end the run without a failure\n";
    return 1;
  }

  return 0;
}
