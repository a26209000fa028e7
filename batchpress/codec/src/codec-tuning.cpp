#include "batchpress/codec-tuning.hpp"

#include <stdexcept>

namespace batchpress {

void CodecTuning::validate() const {
  if (encoderChunkSize == 0) {
    throw std::invalid_argument("encoderChunkSize should be strictly positive");
  }
  if (inputChunkSize == 0) {
    throw std::invalid_argument("inputChunkSize should be strictly positive");
  }
  if (decoderChunkSize == 0) {
    throw std::invalid_argument("decoderChunkSize should be strictly positive");
  }
  if (zstdWindowLog != 0 && (zstdWindowLog < kMinZstdWindowLog || zstdWindowLog > kMaxZstdWindowLog)) {
    throw std::invalid_argument("Invalid zstd window log");
  }
  if (brotliWindow < kMinBrotliWindow || brotliWindow > kMaxBrotliWindow) {
    throw std::invalid_argument("Invalid brotli window");
  }
}

}  // namespace batchpress
