#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "batchpress/batch-result.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/fixedcapacityvector.hpp"

namespace batchpress {

// Statistics of the successful outputs of one codec.
struct CodecStats {
  CodecId codec{};
  std::size_t count{};
  std::uint64_t totalCompressedBytes{};
  // Sum of the original sizes of the items compressed with this codec, minus totalCompressedBytes.
  std::int64_t savedBytes{};
  double averageRatio{};
  double medianRatio{};
  double p95Ratio{};
  double totalTimeMs{};
  double averageTimeMs{};
  double medianTimeMs{};
  double p95TimeMs{};
};

// Derived, read-only metrics over a BatchResult.
struct BatchStats {
  static BatchStats From(const BatchResult &batchResult);

  // Stats of 'codec', or nullptr if no item was successfully compressed with it.
  [[nodiscard]] const CodecStats *find(CodecId codec) const noexcept;

  // Multi-line human readable report.
  [[nodiscard]] std::string summary() const;

  std::size_t totalItems{};
  std::size_t successCount{};
  std::size_t failureCount{};
  // successCount / totalItems, 0 for an empty batch.
  double successRate{};
  std::uint64_t totalOriginalBytes{};
  // In CodecId order.
  FixedCapacityVector<CodecStats, kNbCodecs> codecs;
};

// Nearest-rank percentile of sorted values: value at index ceil(n * p / 100) - 1 (clamped at 0).
// Returns 0 for an empty span.
double Percentile(std::span<const double> sortedValues, double percent);

}  // namespace batchpress
