#include <brotli/decode.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string_view>

#include "batchpress/decompress.hpp"
#include "batchpress/log.hpp"
#include "batchpress/raw-chars.hpp"
#include "output-window.hpp"

namespace batchpress {

bool BrotliDecompress(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize, RawChars &out) {
  std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state(
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
  if (!state) {
    throw std::bad_alloc();
  }

  const auto *nextIn = reinterpret_cast<const uint8_t *>(input.data());
  std::size_t availIn = input.size();

  OutputWindow window(out, decoderChunkSize, maxBytes);
  while (window.grow()) {
    auto *nextOut = reinterpret_cast<uint8_t *>(window.data());
    const std::size_t initialAvailOut = window.available();
    std::size_t availOut = initialAvailOut;

    const auto res = BrotliDecoderDecompressStream(state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);
    window.commit(initialAvailOut - availOut);
    switch (res) {
      case BROTLI_DECODER_RESULT_SUCCESS:
        return availIn == 0 && !window.exceeded();
      case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
        log::debug("brotli payload is truncated");
        return false;
      case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
        break;
      default:
        log::error("BrotliDecoderDecompressStream failed with error {}",
                   BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
        return false;
    }
  }
  log::debug("brotli payload exceeds the maximum of {} decompressed bytes", maxBytes);
  return false;
}

}  // namespace batchpress
