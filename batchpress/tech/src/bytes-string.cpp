#include "batchpress/bytes-string.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "batchpress/raw-chars.hpp"

namespace batchpress {

namespace {

void AppendInt(std::uintmax_t value, RawChars& out) {
  char buf[std::numeric_limits<std::uintmax_t>::digits10 + 1];
  const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  out.append(buf, ptr);
}

void AppendIntAndUnit(std::uintmax_t value, std::string_view unit, RawChars& out) {
  AppendInt(value, out);
  out.ensureAvailableCapacityExponential(1U + unit.size());
  out.unchecked_push_back(' ');
  out.unchecked_append(unit);
}

}  // namespace

void AddFormattedSize(std::uintmax_t size, RawChars& out) {
  static constexpr std::string_view kUnits[]{"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

  std::size_t unitIdx = 0;
  std::uintmax_t divisor = 1;
  // use division to check whether next multiply would overflow
  for (; unitIdx + 1U < std::size(kUnits) && divisor <= size / 1024ULL; ++unitIdx) {
    divisor *= 1024ULL;
  }

  if (unitIdx == 0U) {
    AppendIntAndUnit(size, kUnits[0], out);
    return;
  }

  static constexpr std::uintmax_t kMaxDiv10 = std::numeric_limits<std::uintmax_t>::max() / 10U;

  if (size < divisor * 10U) {
    const std::uintmax_t intPart = size / divisor;
    const std::uintmax_t rem = size % divisor;
    // round(rem * 10 / divisor)
    const std::uintmax_t frac10 = (rem * 10U + divisor / 2U) / divisor;
    std::uintmax_t finalInt = intPart;
    std::uintmax_t finalFrac = frac10;
    if (frac10 >= 10U) {
      // 9.96 -> 10.0
      finalInt = intPart + 1U;
      finalFrac = 0U;
    }
    if (finalInt >= 10U) {
      AppendIntAndUnit(finalInt, kUnits[unitIdx], out);
      return;
    }
    AppendInt(finalInt, out);
    out.push_back('.');
    AppendInt(finalFrac, out);
    out.ensureAvailableCapacityExponential(1U + kUnits[unitIdx].size());
    out.unchecked_push_back(' ');
    out.unchecked_append(kUnits[unitIdx]);
    return;
  }

  std::uintmax_t rounded;
  if (size <= kMaxDiv10) {
    rounded = (size + divisor / 2U) / divisor;
  } else {
    rounded = size / divisor;
    if (size % divisor >= divisor / 2U) {
      ++rounded;
    }
  }
  AppendIntAndUnit(rounded, kUnits[unitIdx], out);
}

std::string FormattedSize(std::uintmax_t size) {
  RawChars out(16);
  AddFormattedSize(size, out);
  return {out.data(), out.size()};
}

}  // namespace batchpress
