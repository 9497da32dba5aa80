#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace procsup {

/// @brief Bounded, thread-safe list of the most recent output lines of a process.
class RecentOutputBuffer {
 public:
  /// @brief Default number of lines retained.
  static constexpr std::size_t kDefaultLineLimit = 64;

  explicit RecentOutputBuffer(std::size_t line_limit = kDefaultLineLimit)
      : line_limit_(line_limit) {}
  RecentOutputBuffer(const RecentOutputBuffer&) = delete;
  RecentOutputBuffer& operator=(const RecentOutputBuffer&) = delete;

  /// @brief Change the retained line count, discarding the oldest lines if needed.
  void set_line_limit(std::size_t limit);
  [[nodiscard]] std::size_t line_limit() const;

  /// @brief Append a line, evicting the oldest beyond the limit.
  void append(std::string line);
  /// @brief Record that the producer has flushed its last line.
  void mark_final();

  [[nodiscard]] bool is_final() const;
  [[nodiscard]] bool empty() const;

  /// @brief Copy of the current lines, oldest first. Never blocks on the producer.
  [[nodiscard]] std::vector<std::string> snapshot() const;
  /// @brief Wait up to `wait` for final output (want_final) or any output, then snapshot.
  [[nodiscard]] std::vector<std::string> wait_for(bool want_final,
                                                  std::chrono::milliseconds wait) const;

 private:
  void trim_locked();

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<std::string> lines_;
  std::size_t line_limit_;
  bool final_ = false;
};

}  // namespace procsup
