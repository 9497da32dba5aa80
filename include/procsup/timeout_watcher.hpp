#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

#include "procsup/completion_latch.hpp"

namespace procsup {

/// @brief Fire-once background task enforcing an execution deadline.
///
/// The task waits on a CompletionLatch for at most the configured timeout, then races
/// for the latch. Only if it wins is the timeout handler invoked; losing means the
/// process finished (or was stopped) first and the task exits silently. Setting the
/// latch wakes the task immediately, which is the only way to cancel it.
class TimeoutWatcher {
 public:
  /// @brief Invoked on the watcher thread with the timeout that elapsed.
  using TimeoutHandler = std::function<void(std::chrono::milliseconds)>;

  TimeoutWatcher() = default;
  /// @brief Joins the task; the latch must be set first or this waits out the deadline.
  ~TimeoutWatcher();
  TimeoutWatcher(const TimeoutWatcher&) = delete;
  TimeoutWatcher& operator=(const TimeoutWatcher&) = delete;

  /// @brief Start the task. Returns false if one was already scheduled or the latch is set.
  bool schedule(CompletionLatch& latch, std::chrono::milliseconds timeout,
                TimeoutHandler on_timeout);

  [[nodiscard]] bool is_scheduled() const noexcept { return scheduled_.load(); }
  /// @brief True once the task has won the latch and run its handler.
  [[nodiscard]] bool fired() const noexcept { return fired_.load(); }

  /// @brief Wait for the task to finish. No-op when called from the task itself.
  void join();

 private:
  std::mutex mutex_;
  std::thread thread_;
  std::atomic<bool> scheduled_{false};
  std::atomic<bool> fired_{false};
  std::atomic<std::thread::id> worker_id_{};
};

}  // namespace procsup
