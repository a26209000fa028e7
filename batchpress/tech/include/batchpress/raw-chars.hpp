#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "batchpress/internal/raw-bytes-base.hpp"

namespace batchpress {

// Character buffer used to hold compressed and decompressed payloads.
using RawChars = RawBytesBase<char, std::string_view, std::size_t>;

// Variant with a 32-bit size type, limited to 4 GiB.
using RawChars32 = RawBytesBase<char, std::string_view, std::uint32_t>;

}  // namespace batchpress
