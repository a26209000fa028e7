#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <utility>

#include "batchpress/codec-id.hpp"
#include "batchpress/file.hpp"
#include "batchpress/fixedcapacityvector.hpp"
#include "batchpress/raw-chars.hpp"

namespace batchpress {

// Destination of a compressed stream.
// Lifecycle: write()* -> close() to commit, or discard() to drop what was written.
// Sinks are used by a single thread at a time.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  // Throws CompressionError (WriteFailed) on I/O error, std::logic_error after close() or discard().
  virtual void write(std::string_view data) = 0;

  // Flush and release resources. Throws CompressionError (WriteFailed) on error.
  virtual void close() = 0;

  // Drop the written data. The sink cannot be used afterwards.
  virtual void discard() noexcept = 0;

  [[nodiscard]] virtual std::size_t bytesWritten() const noexcept = 0;

  [[nodiscard]] virtual bool discarded() const noexcept = 0;
};

// Sink appending to a caller owned buffer. discard() restores the buffer to its initial size.
class RawCharsSink final : public ByteSink {
 public:
  explicit RawCharsSink(RawChars &out) noexcept : _out(out), _initialSize(out.size()) {}

  void write(std::string_view data) override;

  void close() override { _closed = true; }

  void discard() noexcept override;

  [[nodiscard]] std::size_t bytesWritten() const noexcept override {
    return _discarded ? 0 : _out.size() - _initialSize;
  }

  [[nodiscard]] bool discarded() const noexcept override { return _discarded; }

 private:
  RawChars &_out;
  std::size_t _initialSize;
  bool _closed{false};
  bool _discarded{false};
};

// Sink writing to a new file created exclusively (O_EXCL) at 'path'.
// close() fsyncs the file. The file itself is never removed by the sink: its owner decides whether
// to publish it (rename) or delete it.
class FileSink final : public ByteSink {
 public:
  // Throws CompressionError (WriteFailed) if the file cannot be created.
  explicit FileSink(std::filesystem::path path);

  void write(std::string_view data) override;

  void close() override;

  void discard() noexcept override;

  [[nodiscard]] std::size_t bytesWritten() const noexcept override { return _bytesWritten; }

  [[nodiscard]] bool discarded() const noexcept override { return _discarded; }

  [[nodiscard]] const std::filesystem::path &path() const noexcept { return _path; }

 private:
  std::filesystem::path _path;
  File _file;
  std::size_t _bytesWritten{};
  bool _discarded{false};
};

// Sinks of one item, at most one per codec.
class SinkMap {
 public:
  using Entries = FixedCapacityVector<std::pair<CodecId, ByteSink *>, kNbCodecs>;

  // Add (or replace) the sink of 'codec'.
  void set(CodecId codec, ByteSink &sink);

  // Sink of 'codec', or nullptr.
  [[nodiscard]] ByteSink *find(CodecId codec) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] auto end() const noexcept { return _entries.end(); }

 private:
  Entries _entries;
};

}  // namespace batchpress
