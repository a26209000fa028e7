#include <zstd.h>

#include <cstddef>
#include <memory>
#include <new>
#include <string_view>

#include "batchpress/decompress.hpp"
#include "batchpress/log.hpp"
#include "batchpress/raw-chars.hpp"
#include "output-window.hpp"

namespace batchpress {

namespace {

// Frames without content size in their header (produced by streaming compression).
bool DecompressUnknownSize(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize,
                           RawChars &out) {
  std::unique_ptr<ZSTD_DStream, decltype(&ZSTD_freeDStream)> stream(ZSTD_createDStream(), &ZSTD_freeDStream);
  if (!stream) {
    throw std::bad_alloc();
  }
  ZSTD_initDStream(stream.get());

  ZSTD_inBuffer in{input.data(), input.size(), 0};
  OutputWindow window(out, decoderChunkSize, maxBytes);
  while (window.grow()) {
    ZSTD_outBuffer output{window.data(), window.available(), 0};
    const std::size_t ret = ZSTD_decompressStream(stream.get(), &output, &in);
    if (ZSTD_isError(ret) != 0U) [[unlikely]] {
      log::error("ZSTD_decompressStream failed with error {}", ZSTD_getErrorName(ret));
      return false;
    }
    window.commit(output.pos);
    if (ret == 0) {
      return in.pos == in.size && !window.exceeded();
    }
    if (in.pos == in.size && output.pos < output.size) {
      log::debug("zstd payload is truncated");
      return false;
    }
  }
  log::debug("zstd payload exceeds the maximum of {} decompressed bytes", maxBytes);
  return false;
}

}  // namespace

bool ZstdDecompress(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize, RawChars &out) {
  const auto contentSize = ZSTD_getFrameContentSize(input.data(), input.size());
  if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
    log::error("Invalid zstd frame header");
    return false;
  }
  if (contentSize == ZSTD_CONTENTSIZE_UNKNOWN) {
    return DecompressUnknownSize(input, maxBytes, decoderChunkSize, out);
  }
  if (maxBytes != 0 && contentSize > maxBytes) {
    return false;
  }

  const auto plainSize = static_cast<std::size_t>(contentSize);
  out.ensureAvailableCapacityExponential(plainSize);
  const std::size_t ret = ZSTD_decompress(out.data() + out.size(), plainSize, input.data(), input.size());
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    log::error("ZSTD_decompress failed with error {}", ZSTD_getErrorName(ret));
    return false;
  }
  out.addSize(ret);
  return true;
}

}  // namespace batchpress
