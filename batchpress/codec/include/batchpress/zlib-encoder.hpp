#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"
#include "batchpress/zlib-stream-raii.hpp"

namespace batchpress {

// gzip encoder backed by zlib.
class ZlibEncoderContext : public EncoderContext {
 public:
  explicit ZlibEncoderContext(int level) : _zs(level) {}

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  RawChars _buf;
  ZStreamRAII _zs;
};

class ZlibEncoder : public Encoder {
 public:
  explicit ZlibEncoder(int level) : _level(level) {}

  void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars& buf) override;

  std::unique_ptr<EncoderContext> makeContext() override { return std::make_unique<ZlibEncoderContext>(_level); }

 private:
  int _level;
};

}  // namespace batchpress
