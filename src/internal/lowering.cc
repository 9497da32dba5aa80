#include "procsup/internal/lowering.hpp"

#include <unistd.h>

#include <string_view>
#include <utility>

#include "procsup/platform.hpp"

#if PROCSUP_PLATFORM_MACOS
#include <crt_externs.h>
#endif

namespace procsup::internal {

namespace {

char** process_environ() {
#if PROCSUP_PLATFORM_MACOS
  char*** envp = _NSGetEnviron();
  return (envp != nullptr) ? *envp : nullptr;
#else
  return ::environ;
#endif
}

}  // namespace

Result<SpawnSpec> lower_launch(const LaunchInputs& inputs) {
  if (inputs.command.empty() || inputs.command.front().empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
  }

  SpawnSpec spec;
  spec.argv = inputs.command;
  spec.cwd = inputs.cwd;

  std::map<std::string, std::string, std::less<>> env_map;
  for (char** env = process_environ(); env && *env != nullptr; ++env) {
    std::string_view entry(*env);
    auto pos = entry.find('=');
    if (pos == std::string_view::npos) {
      continue;
    }
    env_map.insert_or_assign(std::string(entry.substr(0, pos)),
                             std::string(entry.substr(pos + 1)));
  }
  for (const auto& [key, value] : inputs.env_overrides) {
    env_map.insert_or_assign(key, value);
  }

  spec.envp.reserve(env_map.size());
  for (const auto& [key, value] : env_map) {
    std::string entry;
    entry.reserve(key.size() + value.size() + 1);
    entry.append(key).append("=").append(value);
    spec.envp.push_back(std::move(entry));
  }
  return spec;
}

}  // namespace procsup::internal
