#include "procsup/recent_output.hpp"

#include <utility>

namespace procsup {

void RecentOutputBuffer::set_line_limit(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  line_limit_ = limit;
  trim_locked();
}

std::size_t RecentOutputBuffer::line_limit() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return line_limit_;
}

void RecentOutputBuffer::append(std::string line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    trim_locked();
  }
  cv_.notify_all();
}

void RecentOutputBuffer::mark_final() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    final_ = true;
  }
  cv_.notify_all();
}

bool RecentOutputBuffer::is_final() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return final_;
}

bool RecentOutputBuffer::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_.empty();
}

std::vector<std::string> RecentOutputBuffer::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {lines_.begin(), lines_.end()};
}

std::vector<std::string> RecentOutputBuffer::wait_for(bool want_final,
                                                      std::chrono::milliseconds wait) const {
  std::unique_lock<std::mutex> lock(mutex_);
  if (wait > std::chrono::milliseconds::zero()) {
    cv_.wait_for(lock, wait, [&] { return want_final ? final_ : (final_ || !lines_.empty()); });
  }
  return {lines_.begin(), lines_.end()};
}

void RecentOutputBuffer::trim_locked() {
  while (lines_.size() > line_limit_) {
    lines_.pop_front();
  }
}

}  // namespace procsup
