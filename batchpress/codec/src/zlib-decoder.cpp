#include <zconf.h>
#include <zlib.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string_view>

#include "batchpress/decompress.hpp"
#include "batchpress/log.hpp"
#include "batchpress/raw-chars.hpp"
#include "batchpress/zlib-stream-raii.hpp"
#include "output-window.hpp"

namespace batchpress {

bool GzipDecompress(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize, RawChars &out) {
  ZStreamRAII inflater;
  auto &stream = inflater.stream;
  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());

  OutputWindow window(out, decoderChunkSize, maxBytes);
  while (window.grow()) {
    const auto availOut =
        static_cast<uInt>(std::min<std::size_t>(window.available(), std::numeric_limits<uInt>::max()));
    stream.next_out = reinterpret_cast<Bytef *>(window.data());
    stream.avail_out = availOut;

    const int ret = inflate(&stream, Z_NO_FLUSH);
    window.commit(availOut - stream.avail_out);
    if (ret == Z_STREAM_END) {
      return stream.avail_in == 0 && !window.exceeded();
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      log::error("inflate failed with error {}", ret);
      return false;
    }
    if (stream.avail_in == 0 && stream.avail_out != 0) {
      log::debug("gzip payload is truncated");
      return false;
    }
  }
  log::debug("gzip payload exceeds the maximum of {} decompressed bytes", maxBytes);
  return false;
}

}  // namespace batchpress
