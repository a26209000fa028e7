#include "batchpress/codec-adapter.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "batchpress/codec-id.hpp"
#include "batchpress/codec-tuning.hpp"
#include "batchpress/decompress.hpp"
#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"

#ifdef BATCHPRESS_ENABLE_ZLIB
#include "batchpress/zlib-encoder.hpp"
#endif

#ifdef BATCHPRESS_ENABLE_ZSTD
#include "batchpress/zstd-encoder.hpp"
#endif

#ifdef BATCHPRESS_ENABLE_BROTLI
#include "batchpress/brotli-encoder.hpp"
#endif

namespace batchpress {

namespace {

[[noreturn]] void ThrowDisabled(CodecId codec) {
  throw std::runtime_error(fmt::format("{} support is not compiled in this build", CodecName(codec)));
}

void CheckLevel(CodecId codec, int level) {
  if (!IsValidLevel(codec, level)) {
    const auto &traits = GetCodecTraits(codec);
    throw std::invalid_argument(fmt::format("{} level {} is out of range [{}, {}]", traits.name, level,
                                            traits.minLevel, traits.maxLevel));
  }
}

}  // namespace

BuiltinCodecAdapter::BuiltinCodecAdapter(CodecId codec, const CodecTuning &tuning) : _codec(codec), _tuning(tuning) {
  _tuning.validate();
}

std::unique_ptr<Encoder> BuiltinCodecAdapter::makeEncoder(int level) const {
  CheckLevel(_codec, level);
  switch (_codec) {
    case CodecId::gzip:
#ifdef BATCHPRESS_ENABLE_ZLIB
      return std::make_unique<ZlibEncoder>(level);
#else
      break;
#endif
    case CodecId::br:
#ifdef BATCHPRESS_ENABLE_BROTLI
      return std::make_unique<BrotliEncoder>(level, _tuning.brotliWindow);
#else
      break;
#endif
    case CodecId::zstd:
#ifdef BATCHPRESS_ENABLE_ZSTD
      return std::make_unique<ZstdEncoder>(level, _tuning.zstdWindowLog);
#else
      break;
#endif
    default:
      std::unreachable();
  }
  ThrowDisabled(_codec);
}

void BuiltinCodecAdapter::compress(std::string_view data, int level, RawChars &out) const {
  makeEncoder(level)->encodeFull(0, data, out);
}

std::unique_ptr<EncoderContext> BuiltinCodecAdapter::makeContext(int level) const {
  return makeEncoder(level)->makeContext();
}

bool BuiltinCodecAdapter::decompress([[maybe_unused]] std::string_view data, [[maybe_unused]] std::size_t maxBytes,
                                     [[maybe_unused]] RawChars &out) const {
  switch (_codec) {
    case CodecId::gzip:
#ifdef BATCHPRESS_ENABLE_ZLIB
      return GzipDecompress(data, maxBytes, _tuning.decoderChunkSize, out);
#else
      break;
#endif
    case CodecId::br:
#ifdef BATCHPRESS_ENABLE_BROTLI
      return BrotliDecompress(data, maxBytes, _tuning.decoderChunkSize, out);
#else
      break;
#endif
    case CodecId::zstd:
#ifdef BATCHPRESS_ENABLE_ZSTD
      return ZstdDecompress(data, maxBytes, _tuning.decoderChunkSize, out);
#else
      break;
#endif
    default:
      std::unreachable();
  }
  ThrowDisabled(_codec);
}

}  // namespace batchpress
