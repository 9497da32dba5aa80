#pragma once

#include <cstdint>
#include <optional>

namespace procsup {

/// @brief Exit status of a supervised process, captured once when it exits.
class ExitStatus {
 public:
  /// @brief The kind of exit status.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process was terminated by a signal.
    signaled,
  };

  /// @brief Offset added to a terminating signal by shells and by sign correction.
  static constexpr int kSignalExitBase = 128;

  /// @brief Construct a normal exit status with an exit code.
  static ExitStatus exited(int code, std::uint32_t native = 0) noexcept;
  /// @brief Construct a signal-terminated status.
  static ExitStatus signaled(int signo, std::uint32_t native = 0) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && code_ == 0; }
  /// @brief Exit code if the process exited normally.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Terminating signal if the process was signalled.
  [[nodiscard]] std::optional<int> signal() const noexcept;

  /// @brief Exit code as reported by the platform: the exit code, or -signal when signalled.
  [[nodiscard]] int raw_code() const noexcept;
  /// @brief Exit code normalized into the non-negative range: 128 + signal when signalled.
  [[nodiscard]] int sign_corrected_code() const noexcept;

  /// @brief Native wait status.
  [[nodiscard]] std::uint32_t native() const noexcept { return native_; }

 private:
  Kind kind_{Kind::exited};
  int code_{0};
  std::uint32_t native_{0};
};

}  // namespace procsup
