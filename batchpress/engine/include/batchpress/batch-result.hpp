#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

#include "batchpress/item-result.hpp"

namespace batchpress {

// Results of a batch run, in input order. Not mutated once returned by the coordinator.
class BatchResult {
 public:
  using const_iterator = std::vector<ItemResult>::const_iterator;

  BatchResult() noexcept = default;

  explicit BatchResult(std::vector<ItemResult> items) noexcept : _items(std::move(items)) {}

  [[nodiscard]] std::size_t size() const noexcept { return _items.size(); }

  [[nodiscard]] bool empty() const noexcept { return _items.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _items.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _items.end(); }

  [[nodiscard]] const ItemResult &operator[](std::size_t pos) const noexcept { return _items[pos]; }

  // Result of the item with given id, or nullptr.
  [[nodiscard]] const ItemResult *find(std::string_view id) const noexcept;

  [[nodiscard]] std::size_t successCount() const noexcept;

  [[nodiscard]] std::size_t failureCount() const noexcept { return size() - successCount(); }

  [[nodiscard]] bool allSucceeded() const noexcept { return successCount() == size(); }

 private:
  std::vector<ItemResult> _items;
};

}  // namespace batchpress
