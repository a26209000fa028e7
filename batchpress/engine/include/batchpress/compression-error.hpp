#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace batchpress {

enum class ErrorCode : std::uint8_t {
  // Input exceeds the configured byte ceiling.
  PayloadTooLarge,
  // Codec missing from the registry, or its library is not usable.
  CodecUnavailable,
  // Codec invocation (or input read) failed.
  CompressionFailed,
  // Target exists and the overwrite policy is Fail.
  TargetAlreadyExists,
  // I/O error during staging, rename or sink writes.
  WriteFailed,
  // Invalid value object or options, detected at construction.
  InvalidConfiguration,
  // The input kind cannot be routed to the chosen output target.
  UnsupportedOutputMode
};

std::string_view ErrorCodeName(ErrorCode code) noexcept;

// Error recorded as a value in results (graceful mode).
struct ErrorInfo {
  ErrorCode code;
  std::string message;

  bool operator==(const ErrorInfo&) const noexcept = default;
};

// Error raised for construction-time validation, and for runtime conditions in fail-fast mode.
class CompressionError : public std::runtime_error {
 public:
  CompressionError(ErrorCode code, const std::string& message) : std::runtime_error(message), _code(code) {}

  explicit CompressionError(const ErrorInfo& info) : CompressionError(info.code, info.message) {}

  [[nodiscard]] ErrorCode code() const noexcept { return _code; }

  [[nodiscard]] ErrorInfo info() const { return {_code, what()}; }

 private:
  ErrorCode _code;
};

}  // namespace batchpress
