#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "batchpress/features.hpp"
#include "batchpress/string-equal-ignore-case.hpp"

namespace batchpress {

enum class CodecId : std::uint8_t { gzip, br, zstd };

inline constexpr std::underlying_type_t<CodecId> kNbCodecs = 3;

inline constexpr std::array<CodecId, kNbCodecs> kAllCodecs{CodecId::gzip, CodecId::br, CodecId::zstd};

// Static properties of a codec. Levels follow the underlying library conventions.
struct CodecTraits {
  std::string_view name;
  // Token used in Content-Encoding / Accept-Encoding headers.
  std::string_view token;
  // File extension (without dot) of persisted outputs.
  std::string_view extension;
  int minLevel;
  int maxLevel;
  int defaultLevel;
};

inline constexpr CodecTraits kCodecTraits[kNbCodecs] = {
    {"gzip", "gzip", "gz", 1, 9, 6},
    {"brotli", "br", "br", 0, 11, 4},
    {"zstd", "zstd", "zst", 1, 22, 3},
};

constexpr const CodecTraits& GetCodecTraits(CodecId codec) {
  return kCodecTraits[static_cast<std::underlying_type_t<CodecId>>(codec)];
}

constexpr std::string_view CodecName(CodecId codec) { return GetCodecTraits(codec).name; }

constexpr std::string_view CodecToken(CodecId codec) { return GetCodecTraits(codec).token; }

constexpr std::string_view CodecExtension(CodecId codec) { return GetCodecTraits(codec).extension; }

constexpr bool IsValidLevel(CodecId codec, int level) {
  const auto& traits = GetCodecTraits(codec);
  return traits.minLevel <= level && level <= traits.maxLevel;
}

// Parse a codec from its header token, case-insensitively ("gzip", "br", "zstd").
// The codec names "brotli" and extensions are not accepted.
constexpr std::optional<CodecId> CodecIdFromToken(std::string_view token) {
  for (CodecId codec : kAllCodecs) {
    if (CaseInsensitiveEqual(token, CodecToken(codec))) {
      return codec;
    }
  }
  return std::nullopt;
}

// Whether support for this codec was compiled in.
constexpr bool IsCodecEnabled(CodecId codec) {
  switch (codec) {
    case CodecId::gzip:
      return zlibEnabled();
    case CodecId::br:
      return brotliEnabled();
    case CodecId::zstd:
      return zstdEnabled();
    default:
      return false;
  }
}

}  // namespace batchpress
