#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "procsup/internal/backend.hpp"
#include "procsup/result.hpp"

namespace procsup::internal {

/// @brief Inputs collected by a launcher before spawning.
struct LaunchInputs {
  std::vector<std::string> command;
  /// @brief Variables layered over the inherited environment.
  std::map<std::string, std::string, std::less<>> env_overrides;
  std::optional<std::filesystem::path> cwd;
};

/// @brief Build a SpawnSpec: validate argv and assemble the child's environment.
Result<SpawnSpec> lower_launch(const LaunchInputs& inputs);

}  // namespace procsup::internal
