#pragma once

#include <zlib.h>

#include <cstdint>

namespace batchpress {

// Owns a z_stream configured for the gzip wrapper.
struct ZStreamRAII {
  enum class Type : std::int8_t { compress, decompress };

  // Initialize a z_stream for decompression.
  // Throws std::runtime_error on failure.
  ZStreamRAII();

  // Initialize a z_stream for compression at the given level.
  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(int level);

  // z_stream is not moveable or copyable
  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};

 private:
  Type _type;
};

}  // namespace batchpress
