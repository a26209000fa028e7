#include "batchpress/zlib-stream-raii.hpp"

#include <zconf.h>
#include <zlib.h>

#include <fmt/format.h>

#include <stdexcept>

#include "batchpress/log.hpp"

namespace batchpress {

namespace {
// 16 added to the window bits selects the gzip wrapper.
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kMemLevel = 8;
}  // namespace

ZStreamRAII::ZStreamRAII() : _type(Type::decompress) {
  const auto ret = inflateInit2(&stream, kGzipWindowBits);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from inflateInit2 - error {}", ret));
  }
}

ZStreamRAII::ZStreamRAII(int level) : _type(Type::compress) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from deflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  switch (_type) {
    case Type::decompress: {
      const auto ret = inflateEnd(&stream);
      if (ret != Z_OK) {
        log::error("zlib: inflateEnd returned {} (ignored)", ret);
      }
      break;
    }
    case Type::compress: {
      // Z_DATA_ERROR is expected when the stream is destroyed before being finished.
      const auto ret = deflateEnd(&stream);
      if (ret != Z_OK && ret != Z_DATA_ERROR) {
        log::error("zlib: deflateEnd returned {} (ignored)", ret);
      }
      break;
    }
  }
}

}  // namespace batchpress
