#pragma once

#include <cstdint>
#include <string_view>

namespace batchpress {

// What to do when an output target already exists.
enum class OverwritePolicy : std::uint8_t {
  // Raise TargetAlreadyExists.
  Fail,
  // Atomically replace the existing file.
  Replace,
  // Keep the existing file, do not write.
  Skip
};

std::string_view OverwritePolicyName(OverwritePolicy policy) noexcept;

// Parse "fail", "replace" or "skip" (case-insensitive).
// Throws CompressionError (InvalidConfiguration) for any other value.
OverwritePolicy ParseOverwritePolicy(std::string_view str);

}  // namespace batchpress
