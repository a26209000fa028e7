#include "batchpress/codec-registry.hpp"

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "batchpress/codec-adapter.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/codec-tuning.hpp"
#include "batchpress/log.hpp"

namespace batchpress {

CodecRegistry::CodecRegistry(const CodecTuning &tuning) : _tuning(tuning) {
  _tuning.validate();
  for (CodecId codec : kAllCodecs) {
    _adapters[static_cast<std::underlying_type_t<CodecId>>(codec)] =
        std::make_unique<BuiltinCodecAdapter>(codec, _tuning);
  }
}

const CodecRegistry &CodecRegistry::Builtin() {
  static const CodecRegistry kBuiltin;
  return kBuiltin;
}

void CodecRegistry::registerAdapter(std::unique_ptr<CodecAdapter> adapter) {
  if (!adapter) {
    throw std::invalid_argument("Cannot register a null codec adapter");
  }
  const auto codec = adapter->id();
  log::debug("Registering custom adapter for {}", CodecName(codec));
  _adapters[static_cast<std::underlying_type_t<CodecId>>(codec)] = std::move(adapter);
}

bool CodecRegistry::isAvailable(CodecId codec) const noexcept {
  const auto *adapter = find(codec);
  return adapter != nullptr && adapter->isAvailable();
}

std::vector<CodecId> CodecRegistry::availableCodecs() const {
  std::vector<CodecId> codecs;
  for (CodecId codec : kAllCodecs) {
    if (isAvailable(codec)) {
      codecs.push_back(codec);
    }
  }
  return codecs;
}

}  // namespace batchpress
