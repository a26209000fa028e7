#include "batchpress/batch-coordinator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "batchpress/atomic-output-writer.hpp"
#include "batchpress/batch-result.hpp"
#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/compression-input.hpp"
#include "batchpress/fixedcapacityvector.hpp"
#include "batchpress/item-config.hpp"
#include "batchpress/item-result.hpp"
#include "batchpress/log.hpp"
#include "batchpress/output-target.hpp"
#include "batchpress/string-equal-ignore-case.hpp"
#include "batchpress/timedef.hpp"

namespace batchpress {

namespace {

constexpr std::array<std::string_view, 23> kPrecompressedExtensions{
    "png", "jpg", "jpeg", "gif", "webp", "avif", "woff", "woff2", "ttf", "eot", "mp4", "webm",
    "ogg", "mp3", "flac", "zip", "gz",   "br",   "zst",  "7z",    "rar", "pdf", "ico"};

bool IsSkipped(const CompressionInput &input, std::span<const std::string> skipExtensions) {
  if (!input.isFile() || skipExtensions.empty()) {
    return false;
  }
  const auto extension = input.extension();
  if (extension.empty()) {
    return false;
  }
  return std::ranges::any_of(skipExtensions, [&extension](std::string_view skipped) {
    if (skipped.starts_with('.')) {
      skipped.remove_prefix(1);
    }
    return CaseInsensitiveEqual(skipped, extension);
  });
}

ItemResult FailedItem(const CompressionInput &input, ErrorInfo error, bool failFast) {
  if (failFast) {
    throw CompressionError(error);
  }
  log::warn("Item '{}' failed: {}", input.id(), error.message);
  ItemResult result;
  result.id = input.id();
  result.originalSize = input.size();
  result.itemError = std::move(error);
  result.success = false;
  return result;
}

void DiscardAll(const SinkMap &sinks) noexcept {
  for (const auto &[codec, sink] : sinks) {
    sink->discard();
  }
}

CodecOutcome *FindOutcome(ItemResult &result, CodecId codec) {
  auto it = std::ranges::find(result.outcomes, codec, &CodecOutcome::codec);
  return it == result.outcomes.end() ? nullptr : &*it;
}

}  // namespace

void BatchOptions::validate() const {
  ValidateOutputTarget(target);
  for (const auto &extension : skipExtensions) {
    if (extension.empty() || extension == ".") {
      throw CompressionError(ErrorCode::InvalidConfiguration, "Skipped extensions should not be empty");
    }
  }
}

std::span<const std::string_view> PrecompressedExtensions() { return kPrecompressedExtensions; }

std::vector<std::string> PrecompressedExtensionList() {
  return {kPrecompressedExtensions.begin(), kPrecompressedExtensions.end()};
}

struct BatchCoordinator::Context {
  const BatchOptions &options;
  std::vector<const CompressionInput *> inputs;
  std::vector<ItemConfig> configs;
  // Canonical output directory of a directory target
  std::filesystem::path outputDir;
  std::optional<ErrorInfo> outputDirError;
};

BatchResult BatchCoordinator::run(std::span<const CompressionInput> inputs, const ItemConfig &config,
                                  const BatchOptions &options) const {
  return run(inputs, [&config](std::string_view) { return config; }, options);
}

BatchResult BatchCoordinator::run(std::span<const CompressionInput> inputs, const ItemConfigFn &configFor,
                                  const BatchOptions &options) const {
  const auto start = SteadyClock::now();

  options.validate();
  if (!configFor) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Missing item configuration function");
  }

  Context context{options, {}, {}, {}, {}};
  context.inputs.reserve(inputs.size());
  std::unordered_set<std::string_view> ids;
  for (const auto &input : inputs) {
    if (!ids.insert(input.id()).second) {
      throw CompressionError(ErrorCode::InvalidConfiguration, "Duplicate input id '" + input.id() + "'");
    }
    if (IsSkipped(input, options.skipExtensions)) {
      log::debug("Skipping '{}': already compressed format", input.id());
      continue;
    }
    context.inputs.push_back(&input);
  }

  context.configs.reserve(context.inputs.size());
  for (const CompressionInput *input : context.inputs) {
    context.configs.push_back(configFor(input->id()));
  }

  if (const auto *directoryTarget = std::get_if<DirectoryTarget>(&options.target)) {
    try {
      context.outputDir =
          AtomicOutputWriter::PrepareOutputDirectory(directoryTarget->path, directoryTarget->createDirs);
    } catch (const CompressionError &ex) {
      if (options.failFast) {
        throw;
      }
      log::error("{}", ex.what());
      context.outputDirError = ex.info();
    }
  }

  const std::size_t nbItems = context.inputs.size();
  std::size_t nbWorkers = options.workerThreads;
  if (nbWorkers == 0) {
    nbWorkers = std::max(1U, std::thread::hardware_concurrency());
  }
  nbWorkers = std::min(nbWorkers, nbItems);

  std::vector<ItemResult> results(nbItems);
  if (nbWorkers <= 1) {
    for (std::size_t pos = 0; pos < nbItems; ++pos) {
      results[pos] = processItem(context, pos);
    }
  } else {
    std::atomic<std::size_t> nextPos{0};
    std::stop_source stopSource;
    std::mutex errorMutex;
    std::exception_ptr firstError;
    {
      std::vector<std::jthread> workers;
      workers.reserve(nbWorkers);
      for (std::size_t workerPos = 0; workerPos < nbWorkers; ++workerPos) {
        workers.emplace_back([&, stopToken = stopSource.get_token()] {
          while (!stopToken.stop_requested()) {
            const std::size_t pos = nextPos.fetch_add(1, std::memory_order_relaxed);
            if (pos >= nbItems) {
              break;
            }
            try {
              results[pos] = processItem(context, pos);
            } catch (const std::exception &) {
              std::scoped_lock<std::mutex> lock(errorMutex);
              if (!firstError) {
                firstError = std::current_exception();
              }
              stopSource.request_stop();
            }
          }
        });
      }
    }
    if (firstError) {
      std::rethrow_exception(firstError);
    }
  }

  BatchResult batchResult(std::move(results));
  log::info("Compressed {} item(s) in {:.1f} ms with {} worker(s): {} succeeded, {} failed, {} skipped",
            batchResult.size(), ElapsedMs(start), std::max<std::size_t>(nbWorkers, 1), batchResult.successCount(),
            batchResult.failureCount(), inputs.size() - nbItems);
  return batchResult;
}

ItemResult BatchCoordinator::processItem(const Context &context, std::size_t pos) const {
  const CompressionInput &input = *context.inputs[pos];
  const ItemConfig &config = context.configs[pos];
  const BatchOptions &options = context.options;

  return std::visit(
      [&](const auto &target) -> ItemResult {
        using TargetType = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<TargetType, InMemoryTarget>) {
          if (target.enforce && input.size() > target.maxBytesPerItem) {
            return FailedItem(input,
                              {ErrorCode::PayloadTooLarge,
                               fmt::format("Input '{}' of {} bytes exceeds the in-memory limit of {} bytes",
                                           input.id(), input.size(), target.maxBytesPerItem)},
                              options.failFast);
          }
          return _orchestrator.compressItem(input, config, options.failFast);
        } else if constexpr (std::is_same_v<TargetType, DirectoryTarget>) {
          return toDirectory(context, input, config);
        } else {
          return toStream(context, input, config);
        }
      },
      options.target);
}

ItemResult BatchCoordinator::toDirectory(const Context &context, const CompressionInput &input,
                                         const ItemConfig &config) const {
  const bool failFast = context.options.failFast;
  if (context.outputDirError) {
    return FailedItem(input, *context.outputDirError, failFast);
  }
  if (!input.isFile()) {
    return FailedItem(input,
                      {ErrorCode::UnsupportedOutputMode,
                       fmt::format("Buffer input '{}' cannot be written to a directory target", input.id())},
                      failFast);
  }

  const auto &target = std::get<DirectoryTarget>(context.options.target);
  auto dir = context.outputDir;
  if (target.keepSourceStructure) {
    if (auto relativeDir = input.relativeSourceDir(); !relativeDir.empty()) {
      dir /= relativeDir;
    }
  }

  const AtomicOutputWriter writer(
      WriteOptions{target.overwritePolicy, target.atomicAll, target.createDirs, target.permissions});

  FixedCapacityVector<CodecId, kNbCodecs> codecs;
  for (const auto &spec : config.algorithms()) {
    codecs.push_back(spec.codec());
  }

  std::optional<ItemResult> itemResult;
  const auto producer = [&](SinkMap &sinks) {
    itemResult.emplace(_orchestrator.compressItemToSinks(input, config, failFast, sinks));
  };
  try {
    const auto published = writer.writeAllWithSinks(
        dir, input.basename(), std::span<const CodecId>(codecs.data(), codecs.size()), producer);
    for (const auto &file : published) {
      if (auto *outcome = FindOutcome(*itemResult, file.codec)) {
        outcome->outputPath = file.path;
      }
    }
    return std::move(*itemResult);
  } catch (const CompressionError &ex) {
    if (failFast) {
      throw;
    }
    log::warn("Item '{}' could not be written: {}", input.id(), ex.what());
    ItemResult result;
    if (itemResult) {
      result = std::move(*itemResult);
    } else {
      result.id = input.id();
      result.originalSize = input.size();
    }
    result.itemError = ex.info();
    result.success = false;
    return result;
  } catch (const std::exception &ex) {
    if (failFast) {
      throw;
    }
    return FailedItem(input, {ErrorCode::WriteFailed, fmt::format("Item '{}' could not be written: {}", input.id(),
                                                                  ex.what())},
                      failFast);
  }
}

ItemResult BatchCoordinator::toStream(const Context &context, const CompressionInput &input,
                                      const ItemConfig &config) const {
  const bool failFast = context.options.failFast;
  const auto &target = std::get<StreamTarget>(context.options.target);

  FixedCapacityVector<std::unique_ptr<ByteSink>, kNbCodecs> ownedSinks;
  SinkMap sinks;
  ItemResult result;
  try {
    for (const auto &spec : config.algorithms()) {
      auto sink = target.sinkFactory(input, spec.codec());
      if (!sink) {
        log::debug("No sink provided for {} of '{}'", CodecName(spec.codec()), input.id());
        continue;
      }
      sinks.set(spec.codec(), *sink);
      ownedSinks.push_back(std::move(sink));
    }
    result = _orchestrator.compressItemToSinks(input, config, failFast, sinks);
  } catch (const CompressionError &ex) {
    DiscardAll(sinks);
    return FailedItem(input, ex.info(), failFast);
  } catch (const std::exception &ex) {
    DiscardAll(sinks);
    if (failFast) {
      throw;
    }
    return FailedItem(input, {ErrorCode::WriteFailed, fmt::format("Sink of '{}' failed: {}", input.id(), ex.what())},
                      failFast);
  }

  for (const auto &[codec, sink] : sinks) {
    CodecOutcome *outcome = FindOutcome(result, codec);
    if (outcome == nullptr || !outcome->ok() || result.itemError) {
      sink->discard();
      continue;
    }
    try {
      sink->close();
    } catch (const CompressionError &ex) {
      if (failFast) {
        throw;
      }
      log::warn("{} sink of '{}' could not be closed: {}", CodecName(codec), input.id(), ex.what());
      outcome->error = ex.info();
    }
  }
  result.computeSuccess();
  return result;
}

}  // namespace batchpress
