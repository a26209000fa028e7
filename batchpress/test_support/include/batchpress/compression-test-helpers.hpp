#pragma once

#include <cstddef>
#include <string>

namespace batchpress::test {

// Bytes 0, 1, ..., 255, 0, 1, ... : very compressible.
std::string MakePatternedPayload(std::size_t size);

// Deterministic pseudo random bytes: barely compressible.
std::string MakeRandomPayload(std::size_t size);

// Repetitive ASCII text resembling a web asset.
std::string MakeTextPayload(std::size_t size);

}  // namespace batchpress::test
