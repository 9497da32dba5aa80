#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

#include "procsup/supervisor.hpp"

int main() {
  spdlog::cfg::load_env_levels();

  procsup::Supervisor supervisor("printer");
  supervisor.set_output_log(spdlog::stdout_color_mt("printer-output"));
  supervisor.set_recent_line_limit(2);

  // clang-format off
  auto configured = supervisor.configure(
      {{"GREETING", "hello"}},
      {"/bin/sh", "-c", "echo first; echo \"$GREETING\"; echo last >&2"});
  // clang-format on
  if (!configured) {
    std::cerr << "configure failed: " << configured.error().context << "\n";
    return 1;
  }

  auto started = supervisor.start();
  if (!started) {
    std::cerr << "start failed: " << started.error().context << " "
              << started.error().code.message() << "\n";
    return 1;
  }

  auto lines = supervisor.recent_output(true, std::chrono::seconds(5));
  if (lines.size() != 2) {
    std::cerr << "expected two recent lines, got " << lines.size() << "\n";
    return 1;
  }
  for (const auto& line : lines) {
    std::cout << "recent: " << line << "\n";
  }

  return supervisor.failure() ? 1 : 0;
}
