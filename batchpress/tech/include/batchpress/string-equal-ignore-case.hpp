#pragma once

#include <string_view>

#include "batchpress/toupperlower.hpp"

namespace batchpress {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

// True if 'value' ends with 'suffix', ignoring ASCII case.
constexpr bool EndsWithCaseInsensitive(std::string_view value, std::string_view suffix) {
  if (value.size() < suffix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(value.size() - suffix.size()), suffix);
}

}  // namespace batchpress
