#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "procsup/result.hpp"

namespace procsup {

/// @brief Read end of a child's output pipe.
class PipeReader {
 public:
  /// @brief Construct an empty reader.
  PipeReader() = default;
  /// @brief Construct from a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}
  /// @brief Move-construct a reader.
  PipeReader(PipeReader&& other) noexcept;
  /// @brief Move-assign a reader.
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;
  /// @brief Destroy the reader and close if needed.
  ~PipeReader();

  /// @brief Native file descriptor handle.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief True while the descriptor is open.
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  /// @brief Close the pipe.
  void close() noexcept;

  /// @brief Read up to buffer.size() bytes; 0 means EOF.
  [[nodiscard]] Result<std::size_t> read_some(std::span<char> buffer) const;

 private:
  /// @brief Native file descriptor, or -1 if empty.
  int fd_{-1};
};

}  // namespace procsup
