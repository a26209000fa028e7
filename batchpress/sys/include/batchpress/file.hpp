#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "batchpress/base-fd.hpp"

namespace batchpress {

class File {
 public:
  enum class OpenMode : std::uint8_t {
    ReadOnly,
    // Create a new file for writing, failing if it already exists (O_EXCL).
    CreateExclusive
  };

  static constexpr unsigned kDefaultCreatePermissions = 0644;

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. Throws std::system_error on error.
  // The File owns the underlying descriptor and will close it on destruction.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  explicit File(std::string_view path, OpenMode mode = OpenMode::ReadOnly) : File(std::string(path), mode) {}

  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the current file size in bytes.
  [[nodiscard]] std::size_t size() const;

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Uses pread() so it does not modify the file's current offset. EINTR is retried.
  // Returns the number of bytes read (0 on EOF). Throws std::system_error on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Read the whole file content from the start.
  [[nodiscard]] std::string loadAllContent() const;

  // Write all bytes at the current offset, retrying on EINTR and short writes.
  // Throws std::system_error on error.
  void writeAll(std::string_view data);

  // Flush file content to the storage device (fsync). Throws std::system_error on error.
  void sync();

  // Close the descriptor, reporting failures as std::system_error.
  void close() { _fd.closeOrThrow(); }

  // Returns the raw underlying file descriptor. The File remains responsible for closing it.
  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace batchpress
