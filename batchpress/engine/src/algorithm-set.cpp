#include "batchpress/algorithm-set.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <span>

#include "batchpress/codec-id.hpp"
#include "batchpress/compression-error.hpp"

namespace batchpress {

AlgorithmSpec::AlgorithmSpec(CodecId codec, bool optional)
    : _codec(codec), _level(GetCodecTraits(codec).defaultLevel), _optional(optional) {}

AlgorithmSpec::AlgorithmSpec(CodecId codec, int level, bool optional)
    : _codec(codec), _level(level), _optional(optional) {
  if (!IsValidLevel(codec, level)) {
    const auto &traits = GetCodecTraits(codec);
    throw CompressionError(ErrorCode::InvalidConfiguration,
                           fmt::format("Invalid {} level {}, expected a value in [{}, {}]", traits.name, level,
                                       traits.minLevel, traits.maxLevel));
  }
}

AlgorithmSet::AlgorithmSet(std::span<const AlgorithmSpec> specs) {
  if (specs.empty()) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "An algorithm set needs at least one codec");
  }
  for (const auto &spec : specs) {
    set(spec);
  }
}

AlgorithmSet AlgorithmSet::Defaults() {
  AlgorithmSet ret;
  for (CodecId codec : kAllCodecs) {
    ret._specs.emplace_back(codec);
  }
  return ret;
}

void AlgorithmSet::set(const AlgorithmSpec &spec) {
  auto it = std::ranges::find(_specs, spec.codec(), &AlgorithmSpec::codec);
  if (it == _specs.end()) {
    _specs.push_back(spec);
  } else {
    *it = spec;
  }
}

AlgorithmSet AlgorithmSet::with(const AlgorithmSpec &spec) const {
  AlgorithmSet ret = *this;
  ret.set(spec);
  return ret;
}

AlgorithmSet AlgorithmSet::merge(const AlgorithmSet &other) const {
  AlgorithmSet ret = *this;
  for (const auto &spec : other) {
    ret.set(spec);
  }
  return ret;
}

const AlgorithmSpec *AlgorithmSet::find(CodecId codec) const noexcept {
  auto it = std::ranges::find(_specs, codec, &AlgorithmSpec::codec);
  return it == _specs.end() ? nullptr : &*it;
}

std::optional<int> AlgorithmSet::levelOf(CodecId codec) const noexcept {
  const auto *spec = find(codec);
  if (spec == nullptr) {
    return std::nullopt;
  }
  return spec->level();
}

}  // namespace batchpress
