#include "procsup/pipe.hpp"

#include <unistd.h>

#include <cerrno>

#include "procsup/internal/fd.hpp"

namespace procsup {

PipeReader::PipeReader(PipeReader&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

PipeReader::~PipeReader() { close(); }

void PipeReader::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<std::size_t> PipeReader::read_some(std::span<char> buffer) const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::read_failed), .context = "read: pipe closed"};
  }
  while (true) {
    ssize_t rv = ::read(fd_, buffer.data(), buffer.size());
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno == EINTR) {
      continue;
    }
    return internal::errno_error("read");
  }
}

}  // namespace procsup
