#include "batchpress/byte-sink.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include "batchpress/codec-id.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/file.hpp"
#include "batchpress/log.hpp"

namespace batchpress {

void RawCharsSink::write(std::string_view data) {
  if (_closed || _discarded) {
    throw std::logic_error("write on a closed sink");
  }
  _out.append(data);
}

void RawCharsSink::discard() noexcept {
  if (!_discarded) {
    _out.setSize(_initialSize);
    _discarded = true;
  }
}

FileSink::FileSink(std::filesystem::path path) : _path(std::move(path)) {
  try {
    _file = File(_path.string(), File::OpenMode::CreateExclusive);
  } catch (const std::system_error &ex) {
    throw CompressionError(ErrorCode::WriteFailed, ex.what());
  }
}

void FileSink::write(std::string_view data) {
  if (!_file) {
    throw std::logic_error("write on a closed sink");
  }
  try {
    _file.writeAll(data);
  } catch (const std::system_error &ex) {
    throw CompressionError(ErrorCode::WriteFailed,
                           "Unable to write to '" + _path.string() + "': " + ex.code().message());
  }
  _bytesWritten += data.size();
}

void FileSink::close() {
  if (!_file) {
    return;
  }
  try {
    _file.sync();
    _file.close();
  } catch (const std::system_error &ex) {
    _file = File();
    throw CompressionError(ErrorCode::WriteFailed,
                           "Unable to flush '" + _path.string() + "': " + ex.code().message());
  }
}

void FileSink::discard() noexcept {
  if (_discarded) {
    return;
  }
  log::debug("Discarding sink {} after {} bytes", _path.string(), _bytesWritten);
  // closing errors are logged by the descriptor owner, the content is dropped anyway
  _file = File();
  _discarded = true;
}

void SinkMap::set(CodecId codec, ByteSink &sink) {
  auto it = std::ranges::find(_entries, codec, &Entries::value_type::first);
  if (it == _entries.end()) {
    _entries.emplace_back(codec, &sink);
  } else {
    it->second = &sink;
  }
}

ByteSink *SinkMap::find(CodecId codec) const noexcept {
  auto it = std::ranges::find(_entries, codec, &Entries::value_type::first);
  return it == _entries.end() ? nullptr : it->second;
}

}  // namespace batchpress
