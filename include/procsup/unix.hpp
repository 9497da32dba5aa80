#pragma once

#include <optional>

#include "procsup/status.hpp"

namespace procsup::unix {

/// @brief Extract terminating signal from a POSIX wait status, if present.
std::optional<int> terminating_signal(const procsup::ExitStatus& status) noexcept;
/// @brief Access raw POSIX wait status.
std::optional<int> raw_wait_status(const procsup::ExitStatus& status) noexcept;
/// @brief Convert a POSIX wait status into an ExitStatus.
procsup::ExitStatus from_wait_status(int status) noexcept;

}  // namespace procsup::unix
