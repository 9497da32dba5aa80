#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace procsup {

/// @brief Single-fire "process has finished" flag with a broadcast on set.
///
/// The flag goes from false to true exactly once. Writers are the exit path and the
/// timeout path, which race through try_set_completed() to decide who reports the
/// outcome, and the supervisor's stop hook, which only marks completion. Any number of
/// threads may wait for the flag.
class CompletionLatch {
 public:
  CompletionLatch() = default;
  CompletionLatch(const CompletionLatch&) = delete;
  CompletionLatch& operator=(const CompletionLatch&) = delete;

  /// @brief Set the flag; returns true only to the caller that performed the transition.
  [[nodiscard]] bool try_set_completed();
  /// @brief Current value of the flag. Never blocks.
  [[nodiscard]] bool is_completed() const noexcept {
    return completed_.load(std::memory_order_acquire);
  }
  /// @brief Block until the flag is set or the timeout elapses; returns the flag value.
  bool wait_until_completed_or(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> completed_{false};
};

}  // namespace procsup
