#include "procsup/internal/line_reader.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <system_error>
#include <utility>

#include "procsup/internal/fd.hpp"

namespace procsup::internal {

namespace {

constexpr std::size_t kBufferSize = 8192;
// Bounds how long a cancel request goes unnoticed.
constexpr int kPollIntervalMs = 50;

void emit_line(std::string line, OutputStream stream, const LineSink& sink) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  sink(stream, std::move(line));
}

}  // namespace

void LineSplitter::feed(const char* data, std::size_t size, OutputStream stream,
                        const LineSink& sink) {
  std::size_t start = 0;
  for (std::size_t i = 0; i < size; ++i) {
    if (data[i] != '\n') {
      continue;
    }
    pending_.append(data + start, i - start);
    emit_line(std::move(pending_), stream, sink);
    pending_.clear();
    start = i + 1;
  }
  pending_.append(data + start, size - start);
}

void LineSplitter::flush(OutputStream stream, const LineSink& sink) {
  if (pending_.empty()) {
    return;
  }
  emit_line(std::move(pending_), stream, sink);
  pending_.clear();
}

Result<void> read_lines(PipeReader* out_pipe, PipeReader* err_pipe, const LineSink& sink,
                        const std::atomic<bool>& cancel) {
  struct Target {
    PipeReader* pipe;
    OutputStream stream;
    LineSplitter splitter;
    bool done = false;
  };

  std::array targets = {
      Target{.pipe = out_pipe, .stream = OutputStream::out, .splitter = {}, .done = false},
      Target{.pipe = err_pipe, .stream = OutputStream::err, .splitter = {}, .done = false},
  };

  int active = 0;
  for (auto& target : targets) {
    if (target.pipe != nullptr && target.pipe->is_open()) {
      ++active;
      auto nonblocking_result = set_nonblocking(target.pipe->native_handle());
      if (!nonblocking_result) {
        return nonblocking_result.error();
      }
    } else {
      target.done = true;
    }
  }

  std::array<pollfd, 2> pollfds{};
  std::array<char, kBufferSize> buffer{};

  while (active > 0) {
    if (cancel.load()) {
      return {};
    }
    int poll_count = 0;
    for (const auto& target : targets) {
      if (target.done) {
        continue;
      }
      pollfds[poll_count].fd = target.pipe->native_handle();
      pollfds[poll_count].events = POLLIN;
      pollfds[poll_count].revents = 0;
      ++poll_count;
    }

    int poll_result = ::poll(pollfds.data(), poll_count, kPollIntervalMs);
    if (poll_result == -1) {
      if (errno == EINTR) {
        continue;
      }
      return errno_error("poll");
    }
    if (poll_result == 0) {
      continue;
    }

    int poll_index = 0;
    for (auto& target : targets) {
      if (target.done) {
        continue;
      }
      auto& pfd = pollfds[poll_index++];
      if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      while (true) {
        if (cancel.load()) {
          return {};
        }
        auto read_result = target.pipe->read_some(buffer);
        if (!read_result) {
          const auto& code = read_result.error().code;
          if (code == std::errc::resource_unavailable_try_again ||
              code == std::errc::operation_would_block) {
            break;
          }
          return read_result.error();
        }
        std::size_t count = *read_result;
        if (count == 0) {
          target.splitter.flush(target.stream, sink);
          target.pipe->close();
          target.done = true;
          --active;
          break;
        }
        target.splitter.feed(buffer.data(), count, target.stream, sink);
      }
    }
  }

  return {};
}

}  // namespace procsup::internal
