#pragma once

#include <cstddef>
#include <string_view>

#include "batchpress/raw-chars.hpp"

namespace batchpress {

// One-shot decompression of a complete compressed payload, used to verify produced outputs.
//
// Plain bytes are appended to 'out', whose capacity grows by at least 'decoderChunkSize' at a time.
// Returns false if the payload is corrupted or truncated, has trailing garbage, or would decompress
// to more than 'maxBytes' bytes (0 means no limit). 'out' content is unspecified after a failure.

bool GzipDecompress(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize, RawChars &out);

bool BrotliDecompress(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize, RawChars &out);

bool ZstdDecompress(std::string_view input, std::size_t maxBytes, std::size_t decoderChunkSize, RawChars &out);

}  // namespace batchpress
