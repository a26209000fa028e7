#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "batchpress/batch-result.hpp"
#include "batchpress/codec-registry.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/compression-input.hpp"
#include "batchpress/compression-orchestrator.hpp"
#include "batchpress/item-config.hpp"
#include "batchpress/item-result.hpp"
#include "batchpress/output-target.hpp"

namespace batchpress {

struct BatchOptions {
  // Throws CompressionError (InvalidConfiguration) if options are invalid.
  void validate() const;

  // Abort the batch on the first item-level error, and raise it. No BatchResult is returned in this case.
  bool failFast{false};

  // Number of items compressed in parallel. 0 means the number of hardware threads.
  // The effective number of workers never exceeds the number of inputs.
  std::uint32_t workerThreads{1};

  OutputTarget target{InMemoryTarget{}};

  // File inputs whose extension (case-insensitive, without dot) is listed here are left out of the batch.
  std::vector<std::string> skipExtensions;
};

// Extensions of formats that are already compressed, and that would not benefit from compression.
std::span<const std::string_view> PrecompressedExtensions();

// Same as PrecompressedExtensions, as a list suitable for BatchOptions::skipExtensions.
std::vector<std::string> PrecompressedExtensionList();

// Runs the compression of a set of inputs and routes the compressed outputs to the target of the options.
//
// Validation (options, duplicated ids, configuration of each item) is done before any compression starts,
// and always raises. Items are independent: they may be processed in parallel and a failed item does not
// prevent others from being attempted (unless failFast is set). Results are always in input order.
class BatchCoordinator {
 public:
  explicit BatchCoordinator(const CodecRegistry &registry = CodecRegistry::Builtin()) noexcept
      : _orchestrator(registry) {}

  [[nodiscard]] BatchResult run(std::span<const CompressionInput> inputs, const ItemConfigFn &configFor,
                                const BatchOptions &options) const;

  // Same as run with the same configuration for all items.
  [[nodiscard]] BatchResult run(std::span<const CompressionInput> inputs, const ItemConfig &config,
                                const BatchOptions &options) const;

 private:
  struct Context;

  ItemResult processItem(const Context &context, std::size_t pos) const;

  ItemResult toDirectory(const Context &context, const CompressionInput &input, const ItemConfig &config) const;

  ItemResult toStream(const Context &context, const CompressionInput &input, const ItemConfig &config) const;

  CompressionOrchestrator _orchestrator;
};

}  // namespace batchpress
