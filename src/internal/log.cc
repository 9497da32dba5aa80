#include "procsup/internal/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace procsup::internal {

std::shared_ptr<spdlog::logger> logger() {
  if (auto registered = spdlog::get(kLoggerName)) {
    return registered;
  }
  static std::shared_ptr<spdlog::logger> fallback = [] {
    if (auto registered = spdlog::get(kLoggerName)) {
      return registered;
    }
    return spdlog::stderr_color_mt(kLoggerName);
  }();
  return fallback;
}

}  // namespace procsup::internal
