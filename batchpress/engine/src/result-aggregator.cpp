#include "batchpress/result-aggregator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <numeric>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "batchpress/batch-result.hpp"
#include "batchpress/bytes-string.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/item-result.hpp"

namespace batchpress {

namespace {

struct CodecSamples {
  std::vector<double> ratios;
  std::vector<double> timesMs;
  std::uint64_t totalCompressedBytes{};
  std::uint64_t totalOriginalBytes{};
};

double Average(std::span<const double> values) {
  if (values.empty()) {
    return 0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

}  // namespace

double Percentile(std::span<const double> sortedValues, double percent) {
  if (sortedValues.empty()) {
    return 0;
  }
  const auto rank = static_cast<std::size_t>(std::ceil(static_cast<double>(sortedValues.size()) * percent / 100.0));
  const std::size_t index = rank == 0 ? 0 : std::min(rank - 1, sortedValues.size() - 1);
  return sortedValues[index];
}

BatchStats BatchStats::From(const BatchResult &batchResult) {
  BatchStats stats;
  std::array<CodecSamples, kNbCodecs> samples;

  for (const ItemResult &item : batchResult) {
    ++stats.totalItems;
    if (item.success) {
      ++stats.successCount;
    } else {
      ++stats.failureCount;
    }
    stats.totalOriginalBytes += item.originalSize;
    for (const CodecOutcome &outcome : item.outcomes) {
      if (!outcome.ok()) {
        continue;
      }
      auto &codecSamples = samples[static_cast<std::underlying_type_t<CodecId>>(outcome.codec)];
      codecSamples.ratios.push_back(*item.ratio(outcome.codec));
      codecSamples.timesMs.push_back(outcome.elapsedMs);
      codecSamples.totalCompressedBytes += outcome.compressedSize;
      codecSamples.totalOriginalBytes += item.originalSize;
    }
  }
  if (stats.totalItems != 0) {
    stats.successRate = static_cast<double>(stats.successCount) / static_cast<double>(stats.totalItems);
  }

  for (CodecId codec : kAllCodecs) {
    auto &codecSamples = samples[static_cast<std::underlying_type_t<CodecId>>(codec)];
    if (codecSamples.ratios.empty()) {
      continue;
    }
    std::ranges::sort(codecSamples.ratios);
    std::ranges::sort(codecSamples.timesMs);

    CodecStats &codecStats = stats.codecs.emplace_back();
    codecStats.codec = codec;
    codecStats.count = codecSamples.ratios.size();
    codecStats.totalCompressedBytes = codecSamples.totalCompressedBytes;
    codecStats.savedBytes = static_cast<std::int64_t>(codecSamples.totalOriginalBytes) -
                            static_cast<std::int64_t>(codecSamples.totalCompressedBytes);
    codecStats.averageRatio = Average(codecSamples.ratios);
    codecStats.medianRatio = Percentile(codecSamples.ratios, 50);
    codecStats.p95Ratio = Percentile(codecSamples.ratios, 95);
    codecStats.totalTimeMs = std::accumulate(codecSamples.timesMs.begin(), codecSamples.timesMs.end(), 0.0);
    codecStats.averageTimeMs = Average(codecSamples.timesMs);
    codecStats.medianTimeMs = Percentile(codecSamples.timesMs, 50);
    codecStats.p95TimeMs = Percentile(codecSamples.timesMs, 95);
  }
  return stats;
}

const CodecStats *BatchStats::find(CodecId codec) const noexcept {
  auto it = std::ranges::find(codecs, codec, &CodecStats::codec);
  return it == codecs.end() ? nullptr : &*it;
}

std::string BatchStats::summary() const {
  std::string out;
  auto outIt = std::back_inserter(out);
  fmt::format_to(outIt, "Items: {} total, {} succeeded, {} failed ({:.1f}% success)\n", totalItems, successCount,
                 failureCount, successRate * 100.0);
  fmt::format_to(outIt, "Original size: {}\n", FormattedSize(totalOriginalBytes));
  for (const CodecStats &codecStats : codecs) {
    const bool grew = codecStats.savedBytes < 0;
    const auto savedAbs = static_cast<std::uint64_t>(grew ? -codecStats.savedBytes : codecStats.savedBytes);
    fmt::format_to(outIt,
                   "{}: {} output(s), {} ({} {}), ratio avg {:.3f} median {:.3f} p95 {:.3f}, "
                   "time total {:.2f} ms avg {:.2f} ms median {:.2f} ms p95 {:.2f} ms\n",
                   CodecName(codecStats.codec), codecStats.count, FormattedSize(codecStats.totalCompressedBytes),
                   grew ? "grew by" : "saved", FormattedSize(savedAbs), codecStats.averageRatio,
                   codecStats.medianRatio, codecStats.p95Ratio, codecStats.totalTimeMs, codecStats.averageTimeMs,
                   codecStats.medianTimeMs, codecStats.p95TimeMs);
  }
  return out;
}

}  // namespace batchpress
