#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/overwrite-policy.hpp"

namespace batchpress {

struct WriteOptions {
  OverwritePolicy policy{OverwritePolicy::Fail};
  // Remove the targets published by a multi-target write when one of its renames fails.
  bool atomicAll{true};
  // Create missing parent directories.
  bool createDirs{true};
  // Applied to each file before it is renamed into place.
  std::optional<std::filesystem::perms> permissions;
};

// Bytes to write for one codec.
struct WriteEntry {
  CodecId codec;
  std::string_view data;
};

struct PublishedFile {
  CodecId codec;
  std::filesystem::path path;
};

// Crash-safe publication of compressed files.
//
// Every file is first written to a uniquely named temporary file in the directory of its target
// ('<target>.tmp.<random hex>', created with O_EXCL, fully written and fsynced), then renamed over the
// target. An observer of the target path thus sees either its previous content or the complete new one.
// Temporary files are removed on any failure.
//
// Multi-target writes publish '<basename>.<codec extension>' files. They stage every entry before renaming
// any of them, so a staging failure leaves no new target behind. If a rename fails, the targets already
// renamed by the same call are removed when atomicAll is set. A target that existed before the call and
// was already replaced cannot be restored.
//
// The writer holds no mutable state and can be shared between threads. Two concurrent writes of the same
// target both succeed, the last rename wins.
//
// Errors are reported as CompressionError: TargetAlreadyExists (Fail policy), WriteFailed (I/O errors,
// with the errno text) and InvalidConfiguration (invalid basename, duplicated codecs).
class AtomicOutputWriter {
 public:
  // Receives the sinks of the codecs to write (skipped codecs have none).
  using SinksProducer = std::function<void(SinkMap &)>;
  using SinkProducer = std::function<void(ByteSink &)>;

  AtomicOutputWriter() noexcept = default;

  explicit AtomicOutputWriter(WriteOptions options) noexcept : _options(options) {}

  // Make sure that 'dir' exists (creating it recursively if 'createDirs'), and is a writable directory.
  // Returns its canonical path.
  static std::filesystem::path PrepareOutputDirectory(const std::filesystem::path &dir, bool createDirs);

  // '<dir>/<basename>.<codec extension>'
  static std::filesystem::path TargetPath(const std::filesystem::path &dir, std::string_view basename,
                                          CodecId codec);

  // Atomically write 'data' to 'target'. Returns false if the target was kept (Skip policy).
  bool writeOne(const std::filesystem::path &target, std::string_view data) const;

  // Atomically write each entry into '<dir>/<basename>.<ext>'. Returns the published files, in entries order.
  std::vector<PublishedFile> writeAll(const std::filesystem::path &dir, std::string_view basename,
                                      std::span<const WriteEntry> entries) const;

  // Streaming variant of writeAll: 'producer' writes into one temporary file backed sink per codec.
  // If 'producer' throws, nothing is published and the exception propagates.
  // Sinks that were discarded, or that received no bytes, are deleted without publishing.
  std::vector<PublishedFile> writeAllWithSinks(const std::filesystem::path &dir, std::string_view basename,
                                               std::span<const CodecId> codecs, const SinksProducer &producer) const;

  // Streaming variant of writeOne. Returns true if the target was published.
  bool writeOneWithSink(const std::filesystem::path &target, const SinkProducer &producer) const;

  [[nodiscard]] const WriteOptions &options() const noexcept { return _options; }

 private:
  WriteOptions _options;
};

}  // namespace batchpress
