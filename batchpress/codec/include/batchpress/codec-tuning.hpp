#pragma once

#include <cstddef>
#include <cstdint>

namespace batchpress {

// Library-level tuning shared by all codec adapters of a registry.
// Compression levels are configured per item (see AlgorithmSpec), not here.
struct CodecTuning {
  static constexpr std::int8_t kMinZstdWindowLog = 10;
  static constexpr std::int8_t kMaxZstdWindowLog = 31;
  static constexpr std::int8_t kMinBrotliWindow = 10;
  static constexpr std::int8_t kMaxBrotliWindow = 24;
  static constexpr std::int8_t kDefaultBrotliWindow = 22;

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  // Granularity of output buffer growths during streaming compression.
  std::size_t encoderChunkSize{64UL * 1024UL};

  // Size of the chunks read from file inputs and fed to streaming encoders.
  std::size_t inputChunkSize{64UL * 1024UL};

  // Granularity of output buffer growths during decompression.
  std::size_t decoderChunkSize{64UL * 1024UL};

  // zstd window log. 0 keeps the library default derived from the level.
  std::int8_t zstdWindowLog{0};

  // brotli LGWIN parameter.
  std::int8_t brotliWindow{kDefaultBrotliWindow};
};

}  // namespace batchpress
