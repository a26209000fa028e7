#include "batchpress/zstd-encoder.hpp"

#include <zstd.h>

#include <fmt/format.h>

#include <cassert>
#include <cstddef>
#include <new>
#include <stdexcept>
#include <string_view>

#include "batchpress/raw-chars.hpp"

namespace batchpress {

namespace details {

namespace {
void ZSTD_freeWrapper(ZSTD_CCtx* pCtx) { (void)ZSTD_freeCCtx(pCtx); }

void SetParameter(ZSTD_CCtx* pCtx, ZSTD_cParameter param, int value) {
  const auto ret = ZSTD_CCtx_setParameter(pCtx, param, value);
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    throw std::invalid_argument(fmt::format("ZSTD_CCtx_setParameter({}) error: {}", value, ZSTD_getErrorName(ret)));
  }
}
}  // namespace

ZstdContextRAII::ZstdContextRAII(int level, int windowLog) : ctx(ZSTD_createCCtx(), &ZSTD_freeWrapper) {
  if (!ctx) [[unlikely]] {
    throw std::bad_alloc();
  }

  SetParameter(ctx.get(), ZSTD_c_compressionLevel, level);
  if (windowLog > 0) {
    SetParameter(ctx.get(), ZSTD_c_windowLog, windowLog);
  }
}

}  // namespace details

std::string_view ZstdEncoderContext::encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) {
  ZSTD_inBuffer inBuf{chunk.data(), chunk.size(), 0};
  const auto mode = chunk.empty() ? ZSTD_e_end : ZSTD_e_continue;
  assert(encoderChunkSize > 0);

  for (_buf.clear();;) {
    _buf.ensureAvailableCapacityExponential(encoderChunkSize);

    // ZSTD_outBuffer.pos is relative to dst, so always 0 here.
    ZSTD_outBuffer outBuf{_buf.data() + _buf.size(), _buf.availableCapacity(), 0};

    const std::size_t ret = ZSTD_compressStream2(_zs.ctx.get(), &outBuf, &inBuf, mode);
    if (ZSTD_isError(ret) != 0U) [[unlikely]] {
      throw std::runtime_error(fmt::format("ZSTD_compressStream2 error: {}", ZSTD_getErrorName(ret)));
    }

    _buf.addSize(outBuf.pos);
    if (chunk.empty()) {
      if (ret == 0) [[likely]] {
        break;
      }
    } else if (inBuf.pos == inBuf.size) {
      break;
    }
  }
  return _buf;
}

void ZstdEncoder::encodeFull(std::size_t extraCapacity, std::string_view data, RawChars& buf) {
  const auto oldSize = buf.size();
  const auto maxCompressedSize = ZSTD_compressBound(data.size());

  buf.ensureAvailableCapacity(maxCompressedSize + extraCapacity);

  const auto written =
      ZSTD_compress2(_zs.ctx.get(), buf.data() + oldSize, buf.availableCapacity(), data.data(), data.size());
  if (ZSTD_isError(written) != 0U) [[unlikely]] {
    throw std::runtime_error(fmt::format("zstd compress2 error: {}", ZSTD_getErrorName(written)));
  }

  buf.addSize(written);
}

}  // namespace batchpress
