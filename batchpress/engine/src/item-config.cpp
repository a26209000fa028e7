#include "batchpress/item-config.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "batchpress/algorithm-set.hpp"
#include "batchpress/compression-error.hpp"

namespace batchpress {

ItemConfig::ItemConfig(AlgorithmSet algorithms, std::optional<std::size_t> maxBytes)
    : _algorithms(std::move(algorithms)), _maxBytes(maxBytes) {
  if (_maxBytes && *_maxBytes == 0) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "maxBytes should be strictly positive when set");
  }
}

ItemConfigMap &ItemConfigMap::set(std::string id, ItemConfig config) {
  _overrides.insert_or_assign(std::move(id), std::move(config));
  return *this;
}

const ItemConfig &ItemConfigMap::resolve(std::string_view id) const {
  auto it = _overrides.find(id);
  if (it != _overrides.end()) {
    return it->second;
  }
  if (!_default) {
    throw CompressionError(ErrorCode::InvalidConfiguration,
                           "No configuration for item '" + std::string(id) + "' and no default configuration");
  }
  return *_default;
}

}  // namespace batchpress
