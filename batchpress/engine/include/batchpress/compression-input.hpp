#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace batchpress {

// One logical item to compress: an in-memory buffer or a regular file.
// Immutable once constructed. The orchestrator only borrows inputs for the duration of a call.
class CompressionInput {
 public:
  enum class Kind : std::uint8_t { Buffer, File };

  // Buffer-backed input owning 'data'. 'id' is also used as output basename.
  // Throws CompressionError (InvalidConfiguration) if 'id' is empty.
  static CompressionInput FromBuffer(std::string id, std::string data);

  // File-backed input. 'path' must name an existing, regular and readable file, otherwise
  // CompressionError (InvalidConfiguration) is thrown.
  // 'sourceRoot', if not empty, is the directory from which the relative structure of 'path' is mirrored
  // in directory outputs. 'id' defaults to the path as given.
  static CompressionInput FromFile(std::filesystem::path path, std::filesystem::path sourceRoot = {},
                                   std::string id = {});

  [[nodiscard]] const std::string &id() const noexcept { return _id; }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isFile() const noexcept { return _kind == Kind::File; }

  // Size in bytes of the content (file size at construction time for file inputs).
  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  // Content of a buffer input. Throws std::logic_error for file inputs.
  [[nodiscard]] std::string_view buffer() const;

  // Empty for buffer inputs.
  [[nodiscard]] const std::filesystem::path &path() const noexcept { return _path; }

  [[nodiscard]] const std::filesystem::path &sourceRoot() const noexcept { return _sourceRoot; }

  // Name of the output files without codec extension: file name for file inputs, id for buffers.
  [[nodiscard]] std::string basename() const;

  // Lower case extension without dot ("js" for "app.JS"), empty if none.
  [[nodiscard]] std::string extension() const;

  // Directory of the file relative to its source root, or empty if there is no source root,
  // or if the file does not lie under it.
  [[nodiscard]] std::filesystem::path relativeSourceDir() const;

  // Whole content. File inputs are read from disk, up to size() bytes (throws std::system_error on I/O error).
  [[nodiscard]] std::string readAll() const;

 private:
  CompressionInput(Kind kind, std::string id) : _id(std::move(id)), _kind(kind) {}

  std::string _id;
  std::string _data;
  std::filesystem::path _path;
  std::filesystem::path _sourceRoot;
  std::size_t _size{};
  Kind _kind;
};

}  // namespace batchpress
