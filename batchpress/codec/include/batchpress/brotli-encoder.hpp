#pragma once

#include <brotli/encode.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress {

class BrotliEncoderContext final : public EncoderContext {
 public:
  BrotliEncoderContext(int quality, int window);

  std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view chunk) override;

 private:
  std::unique_ptr<BrotliEncoderState, void (*)(BrotliEncoderState *)> _state;
  RawChars _buf;
};

class BrotliEncoder final : public Encoder {
 public:
  BrotliEncoder(int quality, int window) : _quality(quality), _window(window) {}

  void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars &buf) override;

  std::unique_ptr<EncoderContext> makeContext() override {
    return std::make_unique<BrotliEncoderContext>(_quality, _window);
  }

 private:
  int _quality;
  int _window;
};

}  // namespace batchpress
