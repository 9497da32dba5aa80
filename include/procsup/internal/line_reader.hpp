#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "procsup/pipe.hpp"
#include "procsup/result.hpp"

namespace procsup::internal {

/// @brief Which child stream a line came from.
enum class OutputStream : std::uint8_t { out, err };

/// @brief Receives each complete line, without its terminator.
using LineSink = std::function<void(OutputStream, std::string)>;

/// @brief Splits a byte stream into lines, keeping an incomplete tail between feeds.
class LineSplitter {
 public:
  /// @brief Append bytes, emitting every completed line to the sink.
  void feed(const char* data, std::size_t size, OutputStream stream, const LineSink& sink);
  /// @brief Emit the pending partial line, if any.
  void flush(OutputStream stream, const LineSink& sink);

 private:
  std::string pending_;
};

/// @brief Read both pipes until EOF (or cancel), emitting lines as they complete.
///
/// Pipes are closed as they reach EOF. A pending partial line is emitted at EOF. When
/// `cancel` becomes true the loop stops before its next read without flushing.
Result<void> read_lines(PipeReader* out_pipe, PipeReader* err_pipe, const LineSink& sink,
                        const std::atomic<bool>& cancel);

}  // namespace procsup::internal
