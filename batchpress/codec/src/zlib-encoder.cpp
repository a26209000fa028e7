#include "batchpress/zlib-encoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "batchpress/raw-chars.hpp"
#include "batchpress/safe-cast.hpp"
#include "batchpress/zlib-stream-raii.hpp"

namespace batchpress {

namespace {
// zlib counts output space with 32 bits.
uInt ClampedAvailableCapacity(const RawChars& buf) {
  return static_cast<uInt>(std::min<std::size_t>(buf.availableCapacity(), std::numeric_limits<uInt>::max()));
}
}  // namespace

std::string_view ZlibEncoderContext::encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) {
  _buf.clear();

  _zs.stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
  _zs.stream.avail_in = SafeCast<uInt>(chunk.size());

  const auto flush = chunk.empty() ? Z_FINISH : Z_NO_FLUSH;
  do {
    _buf.ensureAvailableCapacityExponential(encoderChunkSize);

    const auto availableCapacity = ClampedAvailableCapacity(_buf);

    _zs.stream.next_out = reinterpret_cast<unsigned char*>(_buf.data() + _buf.size());
    _zs.stream.avail_out = availableCapacity;

    const auto ret = deflate(&_zs.stream, flush);
    if (ret == Z_STREAM_ERROR) {
      throw std::runtime_error(fmt::format("zlib streaming error {}", ret));
    }

    _buf.addSize(availableCapacity - _zs.stream.avail_out);

    if (ret == Z_STREAM_END) {
      break;
    }
  } while (_zs.stream.avail_out == 0 || _zs.stream.avail_in > 0);

  return _buf;
}

void ZlibEncoder::encodeFull(std::size_t extraCapacity, std::string_view data, RawChars& buf) {
  ZStreamRAII zs(_level);

  auto& zstream = zs.stream;

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zstream.avail_in = SafeCast<uInt>(data.size());

  const auto maxCompressedSize = static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size())));

  buf.ensureAvailableCapacity(maxCompressedSize + extraCapacity);

  const auto availableCapacity = ClampedAvailableCapacity(buf);

  zstream.next_out = reinterpret_cast<unsigned char*>(buf.data() + buf.size());
  zstream.avail_out = availableCapacity;

  const auto rc = deflate(&zstream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error(fmt::format("Error {} during gzip compression", rc));
  }

  buf.addSize(availableCapacity - zstream.avail_out);
}

}  // namespace batchpress
