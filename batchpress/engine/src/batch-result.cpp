#include "batchpress/batch-result.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "batchpress/item-result.hpp"

namespace batchpress {

const ItemResult *BatchResult::find(std::string_view id) const noexcept {
  auto it = std::ranges::find(_items, id, &ItemResult::id);
  return it == _items.end() ? nullptr : &*it;
}

std::size_t BatchResult::successCount() const noexcept {
  return static_cast<std::size_t>(std::ranges::count_if(_items, &ItemResult::success));
}

}  // namespace batchpress
