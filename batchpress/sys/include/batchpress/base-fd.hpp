#pragma once

namespace batchpress {

// Simple RAII class wrapping a file descriptor.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  // Returns true if the underlying fd is valid (not closed).
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  [[nodiscard]] int release() noexcept;

  // Close the underlying file descriptor immediately.
  // Idempotent: multiple calls after first successful/failed close are no-ops.
  // Errors are logged, not reported. Use closeOrThrow() where a failed close must be observed
  // (written data may be lost on some file systems).
  void close() noexcept;

  // Same as close(), but throws std::system_error on failure. The descriptor is released in all cases.
  void closeOrThrow();

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  int _fd;
};

}  // namespace batchpress
