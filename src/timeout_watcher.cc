#include "procsup/timeout_watcher.hpp"

#include <exception>
#include <utility>

#include "procsup/internal/log.hpp"

namespace procsup {

TimeoutWatcher::~TimeoutWatcher() { join(); }

bool TimeoutWatcher::schedule(CompletionLatch& latch, std::chrono::milliseconds timeout,
                              TimeoutHandler on_timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (scheduled_.load() || latch.is_completed()) {
    return false;
  }
  scheduled_.store(true);
  thread_ = std::thread([this, &latch, timeout, handler = std::move(on_timeout)] {
    worker_id_.store(std::this_thread::get_id());
    if (latch.wait_until_completed_or(timeout)) {
      return;
    }
    if (!latch.try_set_completed()) {
      return;
    }
    fired_.store(true);
    try {
      handler(timeout);
    } catch (const std::exception& ex) {
      internal::logger()->error("timeout handler failed: {}", ex.what());
    }
  });
  return true;
}

void TimeoutWatcher::join() {
  if (worker_id_.load() == std::this_thread::get_id()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!thread_.joinable()) {
    return;
  }
  thread_.join();
}

}  // namespace procsup
