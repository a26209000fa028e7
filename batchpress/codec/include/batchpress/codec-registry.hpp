#pragma once

#include <array>
#include <memory>
#include <type_traits>
#include <vector>

#include "batchpress/codec-adapter.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/codec-tuning.hpp"

namespace batchpress {

// Maps each CodecId to the adapter used to run it.
// A registry is populated before use and then shared read-only by concurrent compressions.
class CodecRegistry {
 public:
  // Registry populated with a BuiltinCodecAdapter for each codec.
  // Throws std::invalid_argument if tuning is invalid.
  explicit CodecRegistry(const CodecTuning &tuning = {});

  // Process-wide registry of built-in adapters with default tuning.
  static const CodecRegistry &Builtin();

  // Replace the adapter of 'adapter->id()'. Throws std::invalid_argument on nullptr.
  void registerAdapter(std::unique_ptr<CodecAdapter> adapter);

  // Returns the adapter registered for 'codec', or nullptr if it was removed.
  [[nodiscard]] const CodecAdapter *find(CodecId codec) const noexcept {
    return _adapters[static_cast<std::underlying_type_t<CodecId>>(codec)].get();
  }

  // Remove the adapter of 'codec': it becomes unavailable.
  void remove(CodecId codec) noexcept { _adapters[static_cast<std::underlying_type_t<CodecId>>(codec)].reset(); }

  // Whether 'codec' has a registered adapter that reports itself available.
  [[nodiscard]] bool isAvailable(CodecId codec) const noexcept;

  // Available codecs, in CodecId order.
  [[nodiscard]] std::vector<CodecId> availableCodecs() const;

  [[nodiscard]] const CodecTuning &tuning() const noexcept { return _tuning; }

 private:
  CodecTuning _tuning;
  std::array<std::unique_ptr<CodecAdapter>, kNbCodecs> _adapters;
};

}  // namespace batchpress
