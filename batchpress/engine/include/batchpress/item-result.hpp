#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "batchpress/codec-id.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress {

// Outcome of one codec on one item.
struct CodecOutcome {
  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  CodecId codec{};
  // Whether a failure of this codec blocks the success of the item.
  bool optional{false};
  // Compressed bytes, in memory mode only. Empty when the output was written elsewhere.
  RawChars data;
  // Published file, in directory mode only.
  std::filesystem::path outputPath;
  std::size_t compressedSize{};
  double elapsedMs{};
  std::optional<ErrorInfo> error;
};

struct ItemResult {
  enum class Status : std::uint8_t {
    // Success without any error.
    Ok,
    // Some output produced, some errors recorded.
    Partial,
    // No output at all, or item-level error.
    Failed
  };

  // Recompute 'success' from item error and outcomes: no item error, at least one output if something was
  // attempted, and every required codec succeeded.
  void computeSuccess() noexcept;

  [[nodiscard]] Status status() const noexcept;

  [[nodiscard]] const CodecOutcome *find(CodecId codec) const noexcept;

  // compressedSize / originalSize of a successful codec (0 for empty inputs), std::nullopt otherwise.
  [[nodiscard]] std::optional<double> ratio(CodecId codec) const noexcept;

  // originalSize - compressedSize of a successful codec, std::nullopt otherwise.
  [[nodiscard]] std::optional<std::int64_t> savedBytes(CodecId codec) const noexcept;

  [[nodiscard]] std::size_t nbSucceededCodecs() const noexcept;

  [[nodiscard]] std::size_t nbFailedCodecs() const noexcept;

  // Human readable description of what went wrong, empty if nothing did.
  [[nodiscard]] std::string failureReason() const;

  std::string id;
  std::size_t originalSize{};
  bool success{false};
  std::optional<ErrorInfo> itemError;
  // Ordered as the AlgorithmSet of the item configuration.
  std::vector<CodecOutcome> outcomes;
};

std::string_view StatusName(ItemResult::Status status) noexcept;

}  // namespace batchpress
