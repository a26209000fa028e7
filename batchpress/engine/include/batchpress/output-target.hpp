#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <variant>

#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/compression-input.hpp"
#include "batchpress/overwrite-policy.hpp"

namespace batchpress {

// Compressed payloads are returned in the ItemResult outcomes.
struct InMemoryTarget {
  static constexpr std::size_t kDefaultMaxBytesPerItem = 5UL * 1024UL * 1024UL;

  // Throws CompressionError (InvalidConfiguration) if maxBytesPerItem is 0.
  void validate() const;

  // Inputs bigger than this fail with PayloadTooLarge when 'enforce' is set.
  std::size_t maxBytesPerItem{kDefaultMaxBytesPerItem};
  bool enforce{true};
};

// Compressed payloads are published as '<basename>.<codec extension>' files under 'path'.
struct DirectoryTarget {
  // Throws CompressionError (InvalidConfiguration) if path is empty.
  void validate() const;

  std::filesystem::path path;
  // Mirror the sub directory of each file input relative to its source root.
  bool keepSourceStructure{false};
  OverwritePolicy overwritePolicy{OverwritePolicy::Fail};
  // On a write failure, remove the files already published for the same item.
  bool atomicAll{true};
  // Create missing output directories.
  bool createDirs{true};
  // Permissions applied to published files. Files are created with 0644 otherwise (minus umask).
  std::optional<std::filesystem::perms> permissions;
};

// Compressed payloads are streamed to caller supplied sinks, one per (item, codec).
struct StreamTarget {
  using SinkFactory = std::function<std::unique_ptr<ByteSink>(const CompressionInput &, CodecId)>;

  // Throws CompressionError (InvalidConfiguration) if sinkFactory is empty.
  void validate() const;

  SinkFactory sinkFactory;
};

using OutputTarget = std::variant<InMemoryTarget, DirectoryTarget, StreamTarget>;

// Throws CompressionError (InvalidConfiguration) if the target is invalid.
void ValidateOutputTarget(const OutputTarget &target);

}  // namespace batchpress
