#pragma once

#include "batchpress/algorithm-set.hpp"
#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-adapter.hpp"
#include "batchpress/codec-registry.hpp"
#include "batchpress/compression-input.hpp"
#include "batchpress/item-config.hpp"
#include "batchpress/item-result.hpp"

namespace batchpress {

// Compresses one input with each codec of its ItemConfig, in AlgorithmSet order.
//
// A size ceiling violation is a single item-level PayloadTooLarge error, no codec is attempted.
// Each codec failure (CodecUnavailable, CompressionFailed, WriteFailed for sinks) is isolated in its
// CodecOutcome, unless 'failFast' is set, in which case it is raised as a CompressionError and the
// remaining codecs are abandoned.
//
// File inputs are read chunk by chunk and fed to streaming encoders when the adapter supports it,
// so their content is never entirely loaded in memory.
//
// Holds no mutable state: one orchestrator can serve concurrent calls.
class CompressionOrchestrator {
 public:
  explicit CompressionOrchestrator(const CodecRegistry &registry = CodecRegistry::Builtin()) noexcept
      : _registry(&registry) {}

  // Compressed bytes are stored in the outcomes.
  [[nodiscard]] ItemResult compressItem(const CompressionInput &input, const ItemConfig &config, bool failFast) const;

  // Compressed bytes are written to the sink of each codec. Codecs without a sink in 'sinks' are not attempted
  // and have no outcome. The sink of a failed codec is discarded.
  // A sink write failure throws CompressionError (WriteFailed) even when not failing fast: the caller owns the
  // sinks and should discard all of them.
  [[nodiscard]] ItemResult compressItemToSinks(const CompressionInput &input, const ItemConfig &config, bool failFast,
                                               const SinkMap &sinks) const;

  [[nodiscard]] const CodecRegistry &registry() const noexcept { return *_registry; }

 private:
  ItemResult compress(const CompressionInput &input, const ItemConfig &config, bool failFast,
                      const SinkMap *sinks) const;

  void compressOne(const CodecAdapter &adapter, const CompressionInput &input, const AlgorithmSpec &spec,
                   const SinkMap *sinks, CodecOutcome &outcome) const;

  const CodecRegistry *_registry;
};

}  // namespace batchpress
