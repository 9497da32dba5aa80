#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "procsup/result.hpp"

namespace procsup {

/// @brief Which path produced a failure.
enum class FailureKind : std::uint8_t {
  /// @brief The process exited with a non-zero code.
  exit,
  /// @brief The process did not finish before its deadline.
  timeout,
};

/// @brief Why a run failed. At most one is produced per run.
struct FailureRecord {
  FailureKind kind = FailureKind::exit;
  /// @brief The corrected exit code, or the configured timeout code.
  int code = 0;
  std::string message;

  /// @brief Convert into an Error (process_exit_failure or timeout).
  [[nodiscard]] Error to_error() const;
};

/// @brief Receives the failure of a run.
using FaultHandler = std::function<void(const FailureRecord&)>;

/// @brief Delivers at most one FailureRecord to its sink.
class FailureReporter {
 public:
  explicit FailureReporter(FaultHandler sink) : sink_(std::move(sink)) {}
  FailureReporter(const FailureReporter&) = delete;
  FailureReporter& operator=(const FailureReporter&) = delete;

  /// @brief Deliver the record if none was delivered before; returns true if delivered.
  bool report(FailureRecord record);
  [[nodiscard]] bool has_reported() const noexcept { return reported_.load(); }

 private:
  FaultHandler sink_;
  std::atomic<bool> reported_{false};
};

}  // namespace procsup
