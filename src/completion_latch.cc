#include "procsup/completion_latch.hpp"

namespace procsup {

bool CompletionLatch::try_set_completed() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_.load(std::memory_order_relaxed)) {
      return false;
    }
    completed_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
  return true;
}

bool CompletionLatch::wait_until_completed_or(std::chrono::milliseconds timeout) const {
  if (timeout <= std::chrono::milliseconds::zero()) {
    return is_completed();
  }
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout,
                      [this] { return completed_.load(std::memory_order_relaxed); });
}

}  // namespace procsup
