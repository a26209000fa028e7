#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>

#include "batchpress/raw-chars.hpp"

namespace batchpress {

// Bounded output area of a decompression loop, appended at the end of a RawChars.
// The window holds one byte more than the allowed maximum so that overflow is detected by exceeded().
class OutputWindow {
 public:
  OutputWindow(RawChars &out, std::size_t chunkSize, std::size_t maxBytes) noexcept
      : _out(out),
        _chunkSize(chunkSize),
        _maxSize(maxBytes == 0 || maxBytes >= std::numeric_limits<std::size_t>::max() - out.size() - 1U
                     ? std::numeric_limits<std::size_t>::max() - 1U
                     : out.size() + maxBytes),
        _limit(_maxSize + 1U) {}

  // Make room for the next piece of output. Returns false when the size limit is already reached.
  bool grow() {
    if (_out.size() >= _limit) {
      return false;
    }
    const std::size_t wanted = std::max(_out.size() + _chunkSize, _out.capacity() * 2UL);
    _out.reserve(std::min(wanted, _limit));
    return true;
  }

  [[nodiscard]] char *data() const noexcept { return _out.data() + _out.size(); }

  [[nodiscard]] std::size_t available() const noexcept { return std::min(_out.capacity(), _limit) - _out.size(); }

  void commit(std::size_t nbBytes) noexcept { _out.addSize(nbBytes); }

  [[nodiscard]] bool exceeded() const noexcept { return _out.size() > _maxSize; }

 private:
  RawChars &_out;
  std::size_t _chunkSize;
  std::size_t _maxSize;
  std::size_t _limit;
};

}  // namespace batchpress
