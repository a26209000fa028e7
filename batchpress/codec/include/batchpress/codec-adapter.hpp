#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "batchpress/codec-id.hpp"
#include "batchpress/codec-tuning.hpp"
#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress {

// Uniform access to one compression library.
// Implementations must be safe to call concurrently: any codec state lives in the objects
// created per call (encoders, contexts), never in the adapter itself.
class CodecAdapter {
 public:
  virtual ~CodecAdapter() = default;

  [[nodiscard]] virtual CodecId id() const noexcept = 0;

  // False when the underlying library is not usable (not compiled in, failed to load...).
  [[nodiscard]] virtual bool isAvailable() const noexcept = 0;

  // True if makeContext() can be used to compress input chunk by chunk.
  [[nodiscard]] virtual bool supportsStreaming() const noexcept = 0;

  // One-shot compression of 'data' at 'level', appended to 'out'.
  // Throws std::runtime_error (or std::bad_alloc) on codec failure.
  virtual void compress(std::string_view data, int level, RawChars &out) const = 0;

  // Create a streaming encoder context at 'level'.
  [[nodiscard]] virtual std::unique_ptr<EncoderContext> makeContext(int level) const = 0;

  // Decompress 'data', appending to 'out'. Returns false if 'data' is corrupted or if more than
  // 'maxBytes' would be produced (0 means unlimited).
  [[nodiscard]] virtual bool decompress(std::string_view data, std::size_t maxBytes, RawChars &out) const = 0;
};

// Adapter over the codec libraries compiled in this build (zlib, brotli, zstd).
// A codec whose library was disabled at build time reports itself as unavailable, and its
// operations throw std::runtime_error.
class BuiltinCodecAdapter final : public CodecAdapter {
 public:
  // Throws std::invalid_argument if tuning is invalid.
  BuiltinCodecAdapter(CodecId codec, const CodecTuning &tuning);

  [[nodiscard]] CodecId id() const noexcept override { return _codec; }

  [[nodiscard]] bool isAvailable() const noexcept override { return IsCodecEnabled(_codec); }

  [[nodiscard]] bool supportsStreaming() const noexcept override { return IsCodecEnabled(_codec); }

  void compress(std::string_view data, int level, RawChars &out) const override;

  [[nodiscard]] std::unique_ptr<EncoderContext> makeContext(int level) const override;

  [[nodiscard]] bool decompress(std::string_view data, std::size_t maxBytes, RawChars &out) const override;

 private:
  [[nodiscard]] std::unique_ptr<Encoder> makeEncoder(int level) const;

  CodecId _codec;
  CodecTuning _tuning;
};

}  // namespace batchpress
