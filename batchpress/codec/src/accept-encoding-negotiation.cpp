#include "batchpress/accept-encoding-negotiation.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>

#include "batchpress/codec-id.hpp"
#include "batchpress/string-equal-ignore-case.hpp"
#include "batchpress/string-trim.hpp"

namespace batchpress {

namespace {

constexpr std::string_view kIdentity = "identity";
constexpr std::string_view kWildcard = "*";

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

// Parse an RFC 9110 qvalue: "0" [ "." 0*3DIGIT ] / "1" [ "." 0*3("0") ].
// Returns the weight in thousandths, or std::nullopt if malformed.
constexpr std::optional<int> ParseQValue(std::string_view val) {
  if (val.empty() || (val[0] != '0' && val[0] != '1')) {
    return std::nullopt;
  }
  const int intPart = val[0] - '0';
  if (val.size() == 1) {
    return intPart * 1000;
  }
  if (val[1] != '.' || val.size() > 5) {
    return std::nullopt;
  }
  int frac = 0;
  int scale = 100;
  for (char ch : val.substr(2)) {
    if (!IsDigit(ch)) {
      return std::nullopt;
    }
    frac += (ch - '0') * scale;
    scale /= 10;
  }
  if (intPart == 1 && frac != 0) {
    return std::nullopt;
  }
  return (intPart * 1000) + frac;
}

static_assert(ParseQValue("0") == 0);
static_assert(ParseQValue("0.5") == 500);
static_assert(ParseQValue("0.125") == 125);
static_assert(ParseQValue("1.000") == 1000);
static_assert(!ParseQValue("1.5").has_value());
static_assert(!ParseQValue("0.1234").has_value());
static_assert(!ParseQValue(".5").has_value());

constexpr int kDefaultWeight = 1000;

// Weight of a token ("name;param;q=0.5"), in thousandths.
int ParseWeight(std::string_view params) {
  for (auto paramRange : params | std::views::split(';')) {
    const auto param = TrimOws(std::string_view(paramRange.begin(), paramRange.end()));
    if (param.size() >= 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
      return ParseQValue(TrimOws(param.substr(2))).value_or(kDefaultWeight);
    }
  }
  return kDefaultWeight;
}

}  // namespace

EncodingSelector::EncodingSelector(std::span<const CodecId> available) {
  for (CodecId codec : available) {
    if (std::ranges::find(_available, codec) == _available.end()) {
      _available.push_back(codec);
    }
  }
}

EncodingSelector::NegotiatedResult EncodingSelector::negotiate(std::string_view header) const {
  // Weight per codec, in thousandths. -1 means not mentioned.
  int explicitWeights[kNbCodecs];
  std::ranges::fill(explicitWeights, -1);
  std::optional<int> wildcardWeight;
  std::optional<int> identityWeight;

  for (auto tokenRange : header | std::views::split(',')) {
    const auto token = TrimOws(std::string_view(tokenRange.begin(), tokenRange.end()));
    if (token.empty()) {
      continue;
    }
    const auto semiPos = token.find(';');
    const auto name = TrimOws(token.substr(0, semiPos));
    const int weight = semiPos == std::string_view::npos ? kDefaultWeight : ParseWeight(token.substr(semiPos + 1));

    if (name == kWildcard) {
      if (!wildcardWeight) {
        wildcardWeight = weight;
      }
    } else if (CaseInsensitiveEqual(name, kIdentity)) {
      if (!identityWeight) {
        identityWeight = weight;
      }
    } else if (const auto codec = CodecIdFromToken(name)) {
      auto &explicitWeight = explicitWeights[static_cast<std::underlying_type_t<CodecId>>(*codec)];
      if (explicitWeight == -1) {
        explicitWeight = weight;
      }
    }
  }

  NegotiatedResult ret;
  int bestWeight = 0;
  for (CodecId codec : _available) {
    int weight = explicitWeights[static_cast<std::underlying_type_t<CodecId>>(codec)];
    if (weight == -1) {
      weight = wildcardWeight.value_or(0);
    }
    // strict comparison: earlier available codecs win ties
    if (weight > bestWeight) {
      bestWeight = weight;
      ret.codec = codec;
    }
  }

  if (ret.codec) {
    if (identityWeight && *identityWeight > 0 && *identityWeight >= bestWeight) {
      ret.codec.reset();
    }
    return ret;
  }

  const int effectiveIdentityWeight = identityWeight.value_or(wildcardWeight.value_or(kDefaultWeight));
  ret.reject = effectiveIdentityWeight == 0;
  return ret;
}

std::optional<CodecId> NegotiateEncoding(std::string_view header, std::span<const CodecId> available) {
  return EncodingSelector(available).negotiate(header).codec;
}

}  // namespace batchpress
