#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "batchpress/raw-chars.hpp"

// Encoding abstraction
// --------------------
//   * Encoder: configuration-only object providing one-shot compression.
//   * EncoderContext: stateful streaming object created from an Encoder via makeContext().
// Lifecycle of a context: encodeChunk(data)* -> encodeChunk({}) (finish) -> destroy.
//
// Neither Encoder nor EncoderContext is thread-safe. Implementations throw on initialization
// or fatal internal codec errors.

namespace batchpress {

class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  // Streaming chunk encoder. If 'data' is empty, the stream is finished and trailing bytes are returned.
  // The returned view is valid until the next call on the same context.
  virtual std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view data) = 0;
};

class Encoder {
 public:
  virtual ~Encoder() = default;

  // One-shot full-buffer compression. Compressed data is appended to 'buf'.
  // 'extraCapacity': additional capacity to ensure in 'buf' before encoding (to avoid multiple reallocations).
  virtual void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars &buf) = 0;

  // Create a streaming context. Each context is independent.
  virtual std::unique_ptr<EncoderContext> makeContext() = 0;
};

}  // namespace batchpress
