#include "batchpress/fake-codec-adapter.hpp"

#include <cstddef>
#include <memory>
#include <new>
#include <stdexcept>
#include <string_view>

#include "batchpress/encoder.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress::test {

namespace {

class CopyContext final : public EncoderContext {
 public:
  std::string_view encodeChunk([[maybe_unused]] std::size_t encoderChunkSize, std::string_view data) override {
    _buf.assign(data);
    return std::string_view(_buf);
  }

 private:
  RawChars _buf;
};

}  // namespace

void FakeCodecAdapter::maybeThrow() const {
  switch (_behavior) {
    case Behavior::Throw:
      throw std::runtime_error("scripted codec failure");
    case Behavior::ThrowBadAlloc:
      throw std::bad_alloc();
    default:
      break;
  }
}

void FakeCodecAdapter::compress(std::string_view data, [[maybe_unused]] int level, RawChars &out) const {
  ++_nbCalls;
  maybeThrow();
  out.append(data);
}

std::unique_ptr<EncoderContext> FakeCodecAdapter::makeContext([[maybe_unused]] int level) const {
  ++_nbCalls;
  ++_nbStreamingCalls;
  maybeThrow();
  return std::make_unique<CopyContext>();
}

bool FakeCodecAdapter::decompress(std::string_view data, std::size_t maxBytes, RawChars &out) const {
  if (maxBytes != 0 && data.size() > maxBytes) {
    return false;
  }
  out.append(data);
  return true;
}

}  // namespace batchpress::test
