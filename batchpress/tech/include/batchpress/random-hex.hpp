#pragma once

#include <cstdint>
#include <string>

namespace batchpress {

// Returns 'value' as 16 lowercase hexadecimal digits.
std::string ToHex(std::uint64_t value);

// Returns 16 lowercase hexadecimal digits drawn from a per-thread random engine.
// Suitable for unique file name suffixes, not for cryptographic use.
std::string RandomHexString();

}  // namespace batchpress
