#include "batchpress/compression-orchestrator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "batchpress/algorithm-set.hpp"
#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-adapter.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/codec-tuning.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/compression-input.hpp"
#include "batchpress/file.hpp"
#include "batchpress/item-config.hpp"
#include "batchpress/item-result.hpp"
#include "batchpress/log.hpp"
#include "batchpress/raw-chars.hpp"
#include "batchpress/timedef.hpp"

namespace batchpress {

namespace {

// Read the file of 'input' chunk by chunk, feeding a streaming encoder writing into 'sink'.
// Reading stops at input.size() bytes, even if the file grew since the input was created.
void StreamFile(const CodecAdapter &adapter, const CompressionInput &input, int level, const CodecTuning &tuning,
                ByteSink &sink) {
  auto ctx = adapter.makeContext(level);
  const File file(input.path().string());
  RawChars chunk(tuning.inputChunkSize);
  std::size_t offset = 0;
  while (offset < input.size()) {
    const auto toRead = std::min<std::size_t>(chunk.capacity(), input.size() - offset);
    const auto nbRead = file.readAt(std::span<char>(chunk.data(), toRead), offset);
    if (nbRead == 0) {
      break;
    }
    offset += nbRead;
    const auto produced = ctx->encodeChunk(tuning.encoderChunkSize, std::string_view(chunk.data(), nbRead));
    if (!produced.empty()) {
      sink.write(produced);
    }
  }
  const auto tail = ctx->encodeChunk(tuning.encoderChunkSize, {});
  if (!tail.empty()) {
    sink.write(tail);
  }
}

void CompressToSink(const CodecAdapter &adapter, const CompressionInput &input, int level, const CodecTuning &tuning,
                    ByteSink &sink) {
  if (input.isFile() && adapter.supportsStreaming()) {
    StreamFile(adapter, input, level, tuning, sink);
    return;
  }
  RawChars out;
  if (input.isFile()) {
    adapter.compress(input.readAll(), level, out);
  } else {
    adapter.compress(input.buffer(), level, out);
  }
  sink.write(out);
}

double Ratio(std::size_t compressedSize, std::size_t originalSize) {
  return originalSize == 0 ? 0.0 : static_cast<double>(compressedSize) / static_cast<double>(originalSize);
}

}  // namespace

ItemResult CompressionOrchestrator::compressItem(const CompressionInput &input, const ItemConfig &config,
                                                 bool failFast) const {
  return compress(input, config, failFast, nullptr);
}

ItemResult CompressionOrchestrator::compressItemToSinks(const CompressionInput &input, const ItemConfig &config,
                                                        bool failFast, const SinkMap &sinks) const {
  return compress(input, config, failFast, &sinks);
}

void CompressionOrchestrator::compressOne(const CodecAdapter &adapter, const CompressionInput &input,
                                          const AlgorithmSpec &spec, const SinkMap *sinks,
                                          CodecOutcome &outcome) const {
  const auto &tuning = _registry->tuning();
  if (sinks != nullptr) {
    ByteSink &sink = *sinks->find(spec.codec());
    CompressToSink(adapter, input, spec.level(), tuning, sink);
    outcome.compressedSize = sink.bytesWritten();
  } else if (input.isFile()) {
    RawCharsSink sink(outcome.data);
    CompressToSink(adapter, input, spec.level(), tuning, sink);
    outcome.compressedSize = outcome.data.size();
  } else {
    adapter.compress(input.buffer(), spec.level(), outcome.data);
    outcome.compressedSize = outcome.data.size();
  }
}

ItemResult CompressionOrchestrator::compress(const CompressionInput &input, const ItemConfig &config, bool failFast,
                                             const SinkMap *sinks) const {
  ItemResult result;
  result.id = input.id();
  result.originalSize = input.size();

  if (config.exceedsMaxBytes(result.originalSize)) {
    ErrorInfo error{ErrorCode::PayloadTooLarge,
                    fmt::format("Input '{}' of {} bytes exceeds the maximum of {} bytes", input.id(),
                                result.originalSize, *config.maxBytes())};
    if (failFast) {
      throw CompressionError(error);
    }
    log::warn("{}", error.message);
    result.itemError = std::move(error);
    result.success = false;
    return result;
  }

  result.outcomes.reserve(config.algorithms().size());
  for (const AlgorithmSpec &spec : config.algorithms()) {
    if (sinks != nullptr && sinks->find(spec.codec()) == nullptr) {
      log::debug("No sink for {} of '{}', skipping it", CodecName(spec.codec()), input.id());
      continue;
    }
    CodecOutcome &outcome = result.outcomes.emplace_back();
    outcome.codec = spec.codec();
    outcome.optional = spec.optional();

    std::optional<ErrorInfo> error;
    const auto start = SteadyClock::now();
    const CodecAdapter *adapter = _registry->find(spec.codec());
    if (adapter == nullptr || !adapter->isAvailable()) {
      error = ErrorInfo{ErrorCode::CodecUnavailable, fmt::format("Codec {} is not available", CodecName(spec.codec()))};
    } else {
      try {
        compressOne(*adapter, input, spec, sinks, outcome);
      } catch (const CompressionError &ex) {
        // A sink that cannot be written invalidates the whole item, not only this codec.
        if (sinks != nullptr && ex.code() == ErrorCode::WriteFailed) {
          log::warn("{} output of '{}' could not be written: {}", CodecName(spec.codec()), input.id(), ex.what());
          throw;
        }
        error = ex.info();
      } catch (const std::exception &ex) {
        error = ErrorInfo{ErrorCode::CompressionFailed,
                          fmt::format("{} compression failed: {}", CodecName(spec.codec()), ex.what())};
      }
    }
    outcome.elapsedMs = ElapsedMs(start);

    if (!error) {
      log::debug("{} '{}': {} -> {} bytes (ratio {:.3f}) in {:.2f} ms", CodecName(spec.codec()), input.id(),
                 result.originalSize, outcome.compressedSize, Ratio(outcome.compressedSize, result.originalSize),
                 outcome.elapsedMs);
      continue;
    }

    if (sinks != nullptr) {
      sinks->find(spec.codec())->discard();
    }
    if (failFast) {
      throw CompressionError(error->code, fmt::format("Item '{}': {}", input.id(), error->message));
    }
    log::warn("{} '{}' failed: {}", CodecName(spec.codec()), input.id(), error->message);
    outcome.data.clear();
    outcome.compressedSize = 0;
    outcome.error = std::move(error);
  }

  result.computeSuccess();
  return result;
}

}  // namespace batchpress
