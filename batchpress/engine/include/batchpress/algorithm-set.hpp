#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>

#include "batchpress/codec-id.hpp"
#include "batchpress/fixedcapacityvector.hpp"

namespace batchpress {

// A codec with its compression level, validated at construction and immutable afterwards.
// An optional codec does not block the success of an item when it fails.
class AlgorithmSpec {
 public:
  // gzip at its default level.
  AlgorithmSpec() noexcept = default;

  // Codec at its default level.
  explicit AlgorithmSpec(CodecId codec, bool optional = false);

  // Throws CompressionError (InvalidConfiguration) if level is out of the codec bounds.
  AlgorithmSpec(CodecId codec, int level, bool optional = false);

  [[nodiscard]] CodecId codec() const noexcept { return _codec; }

  [[nodiscard]] int level() const noexcept { return _level; }

  [[nodiscard]] bool optional() const noexcept { return _optional; }

  bool operator==(const AlgorithmSpec &) const noexcept = default;

 private:
  CodecId _codec{CodecId::gzip};
  int _level{GetCodecTraits(CodecId::gzip).defaultLevel};
  bool _optional{false};
};

// Ordered set of AlgorithmSpec, unique by codec, never empty.
class AlgorithmSet {
 public:
  using Specs = FixedCapacityVector<AlgorithmSpec, kNbCodecs>;
  using const_iterator = Specs::const_iterator;

  // Adding a codec already present replaces its spec in place (last write wins).
  // Throws CompressionError (InvalidConfiguration) if 'specs' is empty.
  explicit AlgorithmSet(std::span<const AlgorithmSpec> specs);

  AlgorithmSet(std::initializer_list<AlgorithmSpec> specs)
      : AlgorithmSet(std::span<const AlgorithmSpec>(specs.begin(), specs.size())) {}

  static AlgorithmSet Of(std::initializer_list<AlgorithmSpec> specs) { return AlgorithmSet(specs); }

  static AlgorithmSet Single(CodecId codec, int level) { return AlgorithmSet{AlgorithmSpec(codec, level)}; }

  static AlgorithmSet Single(CodecId codec) { return AlgorithmSet{AlgorithmSpec(codec)}; }

  // All codecs at their default levels, in CodecId order.
  static AlgorithmSet Defaults();

  // New set with 'spec' added, or replacing the spec of its codec.
  [[nodiscard]] AlgorithmSet with(const AlgorithmSpec &spec) const;

  // New set where entries of 'other' override ours on conflict. New codecs are appended in 'other' order.
  [[nodiscard]] AlgorithmSet merge(const AlgorithmSet &other) const;

  [[nodiscard]] bool contains(CodecId codec) const noexcept { return find(codec) != nullptr; }

  [[nodiscard]] const AlgorithmSpec *find(CodecId codec) const noexcept;

  [[nodiscard]] std::optional<int> levelOf(CodecId codec) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _specs.size(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _specs.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _specs.end(); }

  [[nodiscard]] const AlgorithmSpec &operator[](std::size_t pos) const noexcept { return _specs[pos]; }

  bool operator==(const AlgorithmSet &) const noexcept = default;

 private:
  AlgorithmSet() noexcept = default;

  void set(const AlgorithmSpec &spec);

  Specs _specs;
};

}  // namespace batchpress
