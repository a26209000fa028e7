#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "batchpress/algorithm-set.hpp"

namespace batchpress {

// Codecs applied to an item and its optional size ceiling. Immutable, freely shared between threads.
class ItemConfig {
 public:
  // Throws CompressionError (InvalidConfiguration) if maxBytes is 0.
  explicit ItemConfig(AlgorithmSet algorithms, std::optional<std::size_t> maxBytes = std::nullopt);

  [[nodiscard]] const AlgorithmSet &algorithms() const noexcept { return _algorithms; }

  [[nodiscard]] std::optional<std::size_t> maxBytes() const noexcept { return _maxBytes; }

  // True if 'size' exceeds the ceiling.
  [[nodiscard]] bool exceedsMaxBytes(std::size_t size) const noexcept { return _maxBytes && size > *_maxBytes; }

 private:
  AlgorithmSet _algorithms;
  std::optional<std::size_t> _maxBytes;
};

// Returns the configuration of the item with given id.
using ItemConfigFn = std::function<ItemConfig(std::string_view)>;

// A default ItemConfig with per item overrides.
class ItemConfigMap {
 public:
  ItemConfigMap() = default;

  explicit ItemConfigMap(ItemConfig defaultConfig) : _default(std::move(defaultConfig)) {}

  // Set (or replace) the configuration of item 'id'.
  ItemConfigMap &set(std::string id, ItemConfig config);

  // Override for 'id', else the default.
  // Throws CompressionError (InvalidConfiguration) if there is neither.
  [[nodiscard]] const ItemConfig &resolve(std::string_view id) const;

  ItemConfig operator()(std::string_view id) const { return resolve(id); }

 private:
  struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view str) const noexcept { return std::hash<std::string_view>{}(str); }
  };

  std::optional<ItemConfig> _default;
  std::unordered_map<std::string, ItemConfig, StringHash, std::equal_to<>> _overrides;
};

}  // namespace batchpress
