#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace procsup::internal {

/// @brief Name of the library logger in the spdlog registry.
inline constexpr const char* kLoggerName = "procsup";

/// @brief The library logger; reuses an application-registered "procsup" logger if present.
std::shared_ptr<spdlog::logger> logger();

}  // namespace procsup::internal
