#include "batchpress/output-target.hpp"

#include <variant>

#include "batchpress/compression-error.hpp"

namespace batchpress {

void InMemoryTarget::validate() const {
  if (maxBytesPerItem == 0) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "maxBytesPerItem should be strictly positive");
  }
}

void DirectoryTarget::validate() const {
  if (path.empty()) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Output directory path should not be empty");
  }
}

void StreamTarget::validate() const {
  if (!sinkFactory) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Stream target requires a sink factory");
  }
}

void ValidateOutputTarget(const OutputTarget &target) {
  std::visit([](const auto &concreteTarget) { concreteTarget.validate(); }, target);
}

}  // namespace batchpress
