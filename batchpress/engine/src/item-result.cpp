#include "batchpress/item-result.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "batchpress/codec-id.hpp"
#include "batchpress/compression-error.hpp"

namespace batchpress {

void ItemResult::computeSuccess() noexcept {
  if (itemError) {
    success = false;
    return;
  }
  const bool requiredOk = std::ranges::all_of(
      outcomes, [](const CodecOutcome &outcome) { return outcome.optional || outcome.ok(); });
  success = requiredOk && (outcomes.empty() || nbSucceededCodecs() != 0);
}

ItemResult::Status ItemResult::status() const noexcept {
  if (itemError) {
    return Status::Failed;
  }
  const auto nbSucceeded = nbSucceededCodecs();
  if (nbSucceeded == 0 && !outcomes.empty()) {
    return Status::Failed;
  }
  if (nbSucceeded == outcomes.size()) {
    return success ? Status::Ok : Status::Failed;
  }
  return Status::Partial;
}

const CodecOutcome *ItemResult::find(CodecId codec) const noexcept {
  auto it = std::ranges::find(outcomes, codec, &CodecOutcome::codec);
  return it == outcomes.end() ? nullptr : &*it;
}

std::optional<double> ItemResult::ratio(CodecId codec) const noexcept {
  const auto *outcome = find(codec);
  if (outcome == nullptr || !outcome->ok()) {
    return std::nullopt;
  }
  if (originalSize == 0) {
    return 0.0;
  }
  return static_cast<double>(outcome->compressedSize) / static_cast<double>(originalSize);
}

std::optional<std::int64_t> ItemResult::savedBytes(CodecId codec) const noexcept {
  const auto *outcome = find(codec);
  if (outcome == nullptr || !outcome->ok()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(originalSize) - static_cast<std::int64_t>(outcome->compressedSize);
}

std::size_t ItemResult::nbSucceededCodecs() const noexcept {
  return static_cast<std::size_t>(std::ranges::count_if(outcomes, &CodecOutcome::ok));
}

std::size_t ItemResult::nbFailedCodecs() const noexcept { return outcomes.size() - nbSucceededCodecs(); }

std::string ItemResult::failureReason() const {
  std::string reason;
  const auto appendError = [&reason](std::string_view prefix, const ErrorInfo &error) {
    if (!reason.empty()) {
      reason.append("; ");
    }
    reason.append(prefix);
    reason.append(ErrorCodeName(error.code));
    reason.append(": ");
    reason.append(error.message);
  };
  if (itemError) {
    appendError("", *itemError);
  }
  for (const auto &outcome : outcomes) {
    if (outcome.error) {
      std::string prefix(CodecName(outcome.codec));
      prefix.append(" ");
      appendError(prefix, *outcome.error);
    }
  }
  return reason;
}

std::string_view StatusName(ItemResult::Status status) noexcept {
  switch (status) {
    case ItemResult::Status::Ok:
      return "ok";
    case ItemResult::Status::Partial:
      return "partial";
    case ItemResult::Status::Failed:
      return "failed";
    default:
      std::unreachable();
  }
}

}  // namespace batchpress
