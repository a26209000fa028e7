#pragma once

#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>

#include "batchpress/codec-id.hpp"
#include "batchpress/fixedcapacityvector.hpp"

namespace batchpress {

// Selects the best codec for a weighted preference header such as Accept-Encoding
// ("br;q=1.0, gzip;q=0.8, *;q=0.1").
//
// Rules:
//  - Comma separated tokens 'name[;q=weight]', optional whitespace around names and parameters.
//  - Case-insensitive name matching. The first occurrence of a name wins.
//  - weight is an RFC 9110 qvalue ('0[.ddd]' or '1[.000]'), 1.0 when absent. Malformed weights are read as 1.0.
//  - '*' applies to available codecs not explicitly mentioned.
//  - A weight of 0 marks the name as not acceptable.
//  - Highest weight wins. Ties are broken by the order of the 'available' codecs given at construction.
//  - No codec is selected when none has a weight > 0, or when 'identity' is explicitly accepted with a weight
//    that no codec exceeds.
class EncodingSelector {
 public:
  // Available codecs in priority order (duplicates are ignored).
  explicit EncodingSelector(std::span<const CodecId> available);

  EncodingSelector(std::initializer_list<CodecId> available)
      : EncodingSelector(std::span<const CodecId>(available.begin(), available.size())) {}

  struct NegotiatedResult {
    // Selected codec, or std::nullopt to send content uncompressed.
    std::optional<CodecId> codec;

    // True when the header rejects every codec and identity as well
    // (identity;q=0, or *;q=0 without identity mentioned): nothing acceptable can be sent.
    bool reject{false};
  };

  [[nodiscard]] NegotiatedResult negotiate(std::string_view header) const;

 private:
  FixedCapacityVector<CodecId, kNbCodecs> _available;
};

// Convenience function building a selector for a single negotiation.
[[nodiscard]] std::optional<CodecId> NegotiateEncoding(std::string_view header, std::span<const CodecId> available);

[[nodiscard]] inline std::optional<CodecId> NegotiateEncoding(std::string_view header,
                                                              std::initializer_list<CodecId> available) {
  return NegotiateEncoding(header, std::span<const CodecId>(available.begin(), available.size()));
}

}  // namespace batchpress
