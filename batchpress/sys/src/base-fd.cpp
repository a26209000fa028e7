#include "batchpress/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "batchpress/errno-throw.hpp"
#include "batchpress/log.hpp"

namespace batchpress {

namespace {

// Returns 0 on success, the errno value otherwise.
int CloseRetryingOnEintr(int fd) noexcept {
  while (::close(fd) != 0) {
    if (errno != EINTR) {
      return errno;
    }
  }
  return 0;
}

}  // namespace

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    const int err = CloseRetryingOnEintr(_fd);
    if (err != 0) {
      log::error("close fd # {} failed: {}", _fd, std::strerror(err));
    } else {
      log::trace("fd # {} closed", _fd);
    }
    _fd = kClosedFd;
  }
}

void BaseFd::closeOrThrow() {
  if (_fd != kClosedFd) {
    const int fd = release();
    const int err = CloseRetryingOnEintr(fd);
    if (err != 0) {
      errno = err;
      throw_errno("close fd # {} failed", fd);
    }
  }
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace batchpress
