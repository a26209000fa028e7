#include "batchpress/compression-input.hpp"

#include <unistd.h>

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "batchpress/compression-error.hpp"
#include "batchpress/file.hpp"
#include "batchpress/toupperlower.hpp"

namespace batchpress {

CompressionInput CompressionInput::FromBuffer(std::string id, std::string data) {
  if (id.empty()) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Buffer input id should not be empty");
  }
  CompressionInput input(Kind::Buffer, std::move(id));
  input._size = data.size();
  input._data = std::move(data);
  return input;
}

CompressionInput CompressionInput::FromFile(std::filesystem::path path, std::filesystem::path sourceRoot,
                                            std::string id) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Input file '" + path.string() + "' does not exist");
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Input '" + path.string() + "' is not a regular file");
  }
  if (::access(path.c_str(), R_OK) != 0) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Input file '" + path.string() + "' is not readable");
  }
  const auto fileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    throw CompressionError(ErrorCode::InvalidConfiguration,
                           "Unable to stat input file '" + path.string() + "': " + ec.message());
  }

  if (id.empty()) {
    id = path.string();
  }
  CompressionInput input(Kind::File, std::move(id));
  input._size = static_cast<std::size_t>(fileSize);
  input._path = std::move(path);
  input._sourceRoot = std::move(sourceRoot);
  return input;
}

std::string_view CompressionInput::buffer() const {
  if (_kind != Kind::Buffer) {
    throw std::logic_error("buffer() called on a file input");
  }
  return _data;
}

std::string CompressionInput::basename() const {
  if (_kind == Kind::File) {
    return _path.filename().string();
  }
  return _id;
}

std::string CompressionInput::extension() const {
  const std::string name = basename();
  const auto dotPos = name.find_last_of('.');
  if (dotPos == std::string::npos || dotPos == 0 || dotPos + 1 == name.size()) {
    return {};
  }
  std::string ext = name.substr(dotPos + 1);
  for (char &ch : ext) {
    ch = tolower(ch);
  }
  return ext;
}

std::filesystem::path CompressionInput::relativeSourceDir() const {
  if (_kind != Kind::File || _sourceRoot.empty()) {
    return {};
  }
  const auto parent = std::filesystem::absolute(_path).lexically_normal().parent_path();
  auto root = std::filesystem::absolute(_sourceRoot).lexically_normal();
  if (!root.has_filename()) {
    root = root.parent_path();
  }
  auto rel = parent.lexically_relative(root);
  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    return {};
  }
  return rel;
}

std::string CompressionInput::readAll() const {
  if (_kind == Kind::Buffer) {
    return _data;
  }
  std::string content = File(_path.string()).loadAllContent();
  if (content.size() > _size) {
    content.resize(_size);
  }
  return content;
}

}  // namespace batchpress
