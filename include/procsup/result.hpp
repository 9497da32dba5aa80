#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "procsup/platform.hpp"

#if defined(__cpp_lib_expected) && (__cpp_lib_expected >= 202202L)
#include <expected>
#define PROCSUP_HAS_STD_EXPECTED 1
#else
#define PROCSUP_HAS_STD_EXPECTED 0
#endif

#if !PROCSUP_HAS_STD_EXPECTED
#include "procsup/internal/expected.hpp"
#endif

namespace procsup {

/// @brief Error codes for procsup operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Lifecycle misuse
  /// @brief The supervisor was started before a process was configured.
  not_configured,
  /// @brief A process was configured twice.
  already_configured,
  /// @brief Operation is not valid in the current service state.
  invalid_state,
  /// @brief Command has no argv entries.
  empty_argv,

  // OS/syscall failures
  /// @brief Pipe creation failed.
  pipe_failed,
  /// @brief Process creation failed.
  spawn_failed,
  /// @brief Wait operation failed.
  wait_failed,
  /// @brief Read operation failed.
  read_failed,
  /// @brief Termination/kill operation failed.
  kill_failed,

  // Run outcomes
  /// @brief The supervised process exited with a non-zero code.
  process_exit_failure,
  /// @brief The supervised process exceeded its execution deadline.
  timeout,
};

/// @brief Error payload returned by procsup APIs.
struct Error {
  /// @brief Error code in the procsup or system category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief procsup error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the procsup category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by procsup APIs (std::expected-compatible).
#if PROCSUP_HAS_STD_EXPECTED
template <typename T>
using Result = std::expected<T, Error>;
#else
template <typename T>
using Result = expected<T, Error>;
#endif

namespace internal {
/// @brief Throw an error as an exception (used by throwing constructors and helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace procsup

namespace std {

/// @brief Enable implicit conversion from procsup::errc to std::error_code.
template <>
struct is_error_code_enum<procsup::errc> : true_type {};

}  // namespace std
