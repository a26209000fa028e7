#include "batchpress/overwrite-policy.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "batchpress/compression-error.hpp"
#include "batchpress/string-equal-ignore-case.hpp"

namespace batchpress {

std::string_view OverwritePolicyName(OverwritePolicy policy) noexcept {
  switch (policy) {
    case OverwritePolicy::Fail:
      return "fail";
    case OverwritePolicy::Replace:
      return "replace";
    case OverwritePolicy::Skip:
      return "skip";
    default:
      std::unreachable();
  }
}

OverwritePolicy ParseOverwritePolicy(std::string_view str) {
  for (auto policy : {OverwritePolicy::Fail, OverwritePolicy::Replace, OverwritePolicy::Skip}) {
    if (CaseInsensitiveEqual(str, OverwritePolicyName(policy))) {
      return policy;
    }
  }
  throw CompressionError(ErrorCode::InvalidConfiguration,
                         "Invalid overwrite policy '" + std::string(str) + "', expected fail, replace or skip");
}

}  // namespace batchpress
