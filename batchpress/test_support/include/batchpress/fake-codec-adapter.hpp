#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "batchpress/codec-adapter.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress::test {

// Codec adapter with scripted behavior. Its "compression" copies the input unchanged.
class FakeCodecAdapter final : public CodecAdapter {
 public:
  enum class Behavior : std::uint8_t { Copy, Unavailable, Throw, ThrowBadAlloc };

  explicit FakeCodecAdapter(CodecId codec, Behavior behavior = Behavior::Copy, bool streaming = true) noexcept
      : _codec(codec), _behavior(behavior), _streaming(streaming) {}

  [[nodiscard]] CodecId id() const noexcept override { return _codec; }

  [[nodiscard]] bool isAvailable() const noexcept override { return _behavior != Behavior::Unavailable; }

  [[nodiscard]] bool supportsStreaming() const noexcept override { return _streaming; }

  void compress(std::string_view data, int level, RawChars &out) const override;

  [[nodiscard]] std::unique_ptr<EncoderContext> makeContext(int level) const override;

  [[nodiscard]] bool decompress(std::string_view data, std::size_t maxBytes, RawChars &out) const override;

  // Number of compress() and makeContext() calls.
  [[nodiscard]] int nbCalls() const noexcept { return _nbCalls.load(); }

  [[nodiscard]] int nbStreamingCalls() const noexcept { return _nbStreamingCalls.load(); }

 private:
  void maybeThrow() const;

  CodecId _codec;
  Behavior _behavior;
  bool _streaming;
  mutable std::atomic<int> _nbCalls{0};
  mutable std::atomic<int> _nbStreamingCalls{0};
};

}  // namespace batchpress::test
