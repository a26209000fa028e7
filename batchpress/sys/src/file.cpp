#include "batchpress/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "batchpress/errno-throw.hpp"

namespace batchpress {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    case File::OpenMode::CreateExclusive:
      return O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

int OpenFd(const char* path, File::OpenMode mode) {
  const int fd = ::open(path, Flags(mode), File::kDefaultCreatePermissions);
  if (fd < 0) {
    throw_errno("Unable to open file '{}'", path);
  }
  return fd;
}

}  // namespace

File::File(const char* path, OpenMode mode) : _fd(OpenFd(path, mode)) {}

std::size_t File::size() const {
  struct stat st{};
  if (!_fd) {
    throw std::logic_error("File is not opened");
  }
  if (::fstat(_fd.fd(), &st) != 0) {
    throw_errno("fstat failed for fd # {}", _fd.fd());
  }
  return static_cast<std::size_t>(st.st_size);
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const ::ssize_t nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<::off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      throw_errno("pread failed for fd # {} at offset {}", _fd.fd(), offset);
    }
  }
}

std::string File::loadAllContent() const {
  std::string content;
  content.reserve(size());

  static constexpr std::size_t kBufSize = 8192;
  char buf[kBufSize];
  for (std::size_t nbRead = readAt(buf, 0); nbRead != 0; nbRead = readAt(buf, content.size())) {
    content.append(buf, nbRead);
  }
  return content;
}

void File::writeAll(std::string_view data) {
  while (!data.empty()) {
    const ::ssize_t nbWritten = ::write(_fd.fd(), data.data(), data.size());
    if (nbWritten < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("write of {} bytes failed for fd # {}", data.size(), _fd.fd());
    }
    data.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
}

void File::sync() {
  while (::fsync(_fd.fd()) != 0) {
    if (errno != EINTR) {
      throw_errno("fsync failed for fd # {}", _fd.fd());
    }
  }
}

}  // namespace batchpress
