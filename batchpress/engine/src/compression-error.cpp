#include "batchpress/compression-error.hpp"

#include <string_view>
#include <utility>

namespace batchpress {

std::string_view ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::PayloadTooLarge:
      return "PayloadTooLarge";
    case ErrorCode::CodecUnavailable:
      return "CodecUnavailable";
    case ErrorCode::CompressionFailed:
      return "CompressionFailed";
    case ErrorCode::TargetAlreadyExists:
      return "TargetAlreadyExists";
    case ErrorCode::WriteFailed:
      return "WriteFailed";
    case ErrorCode::InvalidConfiguration:
      return "InvalidConfiguration";
    case ErrorCode::UnsupportedOutputMode:
      return "UnsupportedOutputMode";
    default:
      std::unreachable();
  }
}

}  // namespace batchpress
