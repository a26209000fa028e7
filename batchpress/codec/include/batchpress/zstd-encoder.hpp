#pragma once

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress {

namespace details {

struct ZstdContextRAII {
  ZstdContextRAII(int level, int windowLog);

  std::unique_ptr<ZSTD_CCtx, void (*)(ZSTD_CCtx*)> ctx;
};

}  // namespace details

class ZstdEncoderContext : public EncoderContext {
 public:
  ZstdEncoderContext(int level, int windowLog) : _zs(level, windowLog) {}

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  RawChars _buf;
  details::ZstdContextRAII _zs;
};

class ZstdEncoder : public Encoder {
 public:
  ZstdEncoder(int level, int windowLog) : _level(level), _windowLog(windowLog), _zs(level, windowLog) {}

  void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars& buf) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<ZstdEncoderContext>(_level, _windowLog);
  }

 private:
  int _level;
  int _windowLog;
  details::ZstdContextRAII _zs;
};

}  // namespace batchpress
