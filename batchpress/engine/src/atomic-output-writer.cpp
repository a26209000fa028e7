#include "batchpress/atomic-output-writer.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/log.hpp"
#include "batchpress/overwrite-policy.hpp"
#include "batchpress/random-hex.hpp"

namespace batchpress {

namespace {

[[noreturn]] void ThrowWriteFailed(std::string_view what, const std::filesystem::path &path,
                                   const std::error_code &ec) {
  std::string msg(what);
  msg.append(" '");
  msg.append(path.string());
  msg.append("': ");
  msg.append(ec.message());
  throw CompressionError(ErrorCode::WriteFailed, msg);
}

void EnsureDirectory(const std::filesystem::path &dir, bool createDirs) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return;
  }
  if (std::filesystem::exists(dir, ec)) {
    ThrowWriteFailed("Unable to use output directory", dir, std::make_error_code(std::errc::not_a_directory));
  }
  if (!createDirs) {
    ThrowWriteFailed("Unable to use output directory", dir,
                     std::make_error_code(std::errc::no_such_file_or_directory));
  }
  std::filesystem::create_directories(dir, ec);
  // another writer may have created it concurrently
  std::error_code statEc;
  if (ec && !std::filesystem::is_directory(dir, statEc)) {
    ThrowWriteFailed("Unable to create output directory", dir, ec);
  }
  log::debug("Created output directory {}", dir.string());
}

std::filesystem::path ParentDir(const std::filesystem::path &target) {
  auto parent = target.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  return parent;
}

bool TargetExists(const std::filesystem::path &target) {
  std::error_code ec;
  const auto status = std::filesystem::symlink_status(target, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return false;
  }
  if (ec) {
    ThrowWriteFailed("Unable to stat target", target, ec);
  }
  return true;
}

// Whether 'target' should be written according to 'policy'.
bool ShouldWrite(const std::filesystem::path &target, OverwritePolicy policy) {
  if (!TargetExists(target)) {
    return true;
  }
  switch (policy) {
    case OverwritePolicy::Fail:
      throw CompressionError(ErrorCode::TargetAlreadyExists, "Target '" + target.string() + "' already exists");
    case OverwritePolicy::Skip:
      log::debug("Keeping existing target {}", target.string());
      return false;
    case OverwritePolicy::Replace:
      return true;
    default:
      std::unreachable();
  }
}

void ValidateBasename(std::string_view basename) {
  if (basename.empty() || basename == "." || basename == ".." ||
      basename.find_first_of(std::string_view("/\0", 2)) != std::string_view::npos) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Invalid output basename '" + std::string(basename) + "'");
  }
}

void ValidateCodecs(std::span<const CodecId> codecs) {
  for (CodecId codec : codecs) {
    if (std::ranges::count(codecs, codec) > 1) {
      throw CompressionError(ErrorCode::InvalidConfiguration,
                             "Codec " + std::string(CodecName(codec)) + " is written twice");
    }
  }
}

// Temporary file of a target, removed on destruction unless renamed over its target.
class StagedFile {
 public:
  explicit StagedFile(std::filesystem::path target)
      : _target(std::move(target)), _temp(_target.string() + ".tmp." + RandomHexString()) {}

  StagedFile(const StagedFile &) = delete;
  StagedFile(StagedFile &&other) noexcept
      : _target(std::move(other._target)), _temp(std::exchange(other._temp, std::filesystem::path{})) {}
  StagedFile &operator=(const StagedFile &) = delete;
  StagedFile &operator=(StagedFile &&) = delete;

  ~StagedFile() { removeTemp(); }

  [[nodiscard]] const std::filesystem::path &target() const noexcept { return _target; }

  [[nodiscard]] const std::filesystem::path &temp() const noexcept { return _temp; }

  [[nodiscard]] bool pending() const noexcept { return !_temp.empty(); }

  void applyPermissions(std::optional<std::filesystem::perms> permissions) const {
    if (!permissions) {
      return;
    }
    std::error_code ec;
    std::filesystem::permissions(_temp, *permissions, std::filesystem::perm_options::replace, ec);
    if (ec) {
      ThrowWriteFailed("Unable to set permissions of", _temp, ec);
    }
  }

  void rename() {
    std::error_code ec;
    std::filesystem::rename(_temp, _target, ec);
    if (ec) {
      ThrowWriteFailed("Unable to rename temporary file to", _target, ec);
    }
    log::debug("Published {}", _target.string());
    _temp.clear();
  }

  void removeTemp() noexcept {
    if (_temp.empty()) {
      return;
    }
    std::error_code ec;
    if (!std::filesystem::remove(_temp, ec) && ec) {
      log::error("Unable to remove temporary file {}: {}", _temp.string(), ec.message());
    }
    _temp.clear();
  }

 private:
  std::filesystem::path _target;
  std::filesystem::path _temp;
};

void StageBytes(const StagedFile &staged, std::string_view data, std::optional<std::filesystem::perms> permissions) {
  FileSink sink(staged.temp());
  sink.write(data);
  sink.close();
  staged.applyPermissions(permissions);
}

void RemovePublished(const std::vector<PublishedFile> &published) noexcept {
  for (const auto &file : published) {
    std::error_code ec;
    if (std::filesystem::remove(file.path, ec)) {
      log::warn("Rolled back {}", file.path.string());
    } else if (ec) {
      log::error("Unable to roll back {}: {}", file.path.string(), ec.message());
    }
  }
}

// Rename all pending staged files. 'codecs' is parallel to 'staged'.
std::vector<PublishedFile> PublishAll(std::span<StagedFile> staged, std::span<const CodecId> codecs,
                                      bool atomicAll) {
  std::vector<PublishedFile> published;
  published.reserve(staged.size());
  for (std::size_t pos = 0; pos < staged.size(); ++pos) {
    if (!staged[pos].pending()) {
      continue;
    }
    try {
      staged[pos].rename();
    } catch (const CompressionError &) {
      if (atomicAll) {
        RemovePublished(published);
      }
      throw;
    }
    published.emplace_back(codecs[pos], staged[pos].target());
  }
  return published;
}

}  // namespace

std::filesystem::path AtomicOutputWriter::PrepareOutputDirectory(const std::filesystem::path &dir, bool createDirs) {
  if (dir.empty()) {
    throw CompressionError(ErrorCode::InvalidConfiguration, "Output directory path should not be empty");
  }
  EnsureDirectory(dir, createDirs);
  std::error_code ec;
  auto canonicalDir = std::filesystem::canonical(dir, ec);
  if (ec) {
    ThrowWriteFailed("Unable to resolve output directory", dir, ec);
  }
  if (::access(canonicalDir.c_str(), W_OK | X_OK) != 0) {
    ThrowWriteFailed("Output directory is not writable", canonicalDir, std::error_code(errno, std::generic_category()));
  }
  return canonicalDir;
}

std::filesystem::path AtomicOutputWriter::TargetPath(const std::filesystem::path &dir, std::string_view basename,
                                                     CodecId codec) {
  std::string fileName(basename);
  fileName.push_back('.');
  fileName.append(CodecExtension(codec));
  return dir / fileName;
}

bool AtomicOutputWriter::writeOne(const std::filesystem::path &target, std::string_view data) const {
  EnsureDirectory(ParentDir(target), _options.createDirs);
  if (!ShouldWrite(target, _options.policy)) {
    return false;
  }
  StagedFile staged(target);
  StageBytes(staged, data, _options.permissions);
  staged.rename();
  return true;
}

std::vector<PublishedFile> AtomicOutputWriter::writeAll(const std::filesystem::path &dir, std::string_view basename,
                                                        std::span<const WriteEntry> entries) const {
  ValidateBasename(basename);
  std::vector<CodecId> codecs;
  codecs.reserve(entries.size());
  for (const auto &entry : entries) {
    codecs.push_back(entry.codec);
  }
  ValidateCodecs(codecs);
  EnsureDirectory(dir, _options.createDirs);

  // Check all targets before staging anything, so that the Fail policy does not create any file.
  std::vector<const WriteEntry *> toWrite;
  toWrite.reserve(entries.size());
  for (const auto &entry : entries) {
    if (ShouldWrite(TargetPath(dir, basename, entry.codec), _options.policy)) {
      toWrite.push_back(&entry);
    }
  }

  std::vector<StagedFile> staged;
  staged.reserve(toWrite.size());
  codecs.clear();
  for (const WriteEntry *entry : toWrite) {
    staged.emplace_back(TargetPath(dir, basename, entry->codec));
    codecs.push_back(entry->codec);
    StageBytes(staged.back(), entry->data, _options.permissions);
  }

  return PublishAll(staged, codecs, _options.atomicAll);
}

std::vector<PublishedFile> AtomicOutputWriter::writeAllWithSinks(const std::filesystem::path &dir,
                                                                 std::string_view basename,
                                                                 std::span<const CodecId> codecs,
                                                                 const SinksProducer &producer) const {
  ValidateBasename(basename);
  ValidateCodecs(codecs);
  EnsureDirectory(dir, _options.createDirs);

  std::vector<CodecId> toWrite;
  toWrite.reserve(codecs.size());
  for (CodecId codec : codecs) {
    if (ShouldWrite(TargetPath(dir, basename, codec), _options.policy)) {
      toWrite.push_back(codec);
    }
  }

  std::vector<StagedFile> staged;
  staged.reserve(toWrite.size());
  std::vector<std::unique_ptr<FileSink>> sinks;
  sinks.reserve(toWrite.size());
  SinkMap sinkMap;
  for (CodecId codec : toWrite) {
    staged.emplace_back(TargetPath(dir, basename, codec));
    sinks.push_back(std::make_unique<FileSink>(staged.back().temp()));
    sinkMap.set(codec, *sinks.back());
  }

  producer(sinkMap);

  for (std::size_t pos = 0; pos < staged.size(); ++pos) {
    FileSink &sink = *sinks[pos];
    if (sink.discarded() || sink.bytesWritten() == 0) {
      log::debug("Not publishing {}: {}", staged[pos].target().string(),
                 sink.discarded() ? "sink discarded" : "no data written");
      sink.discard();
      staged[pos].removeTemp();
      continue;
    }
    sink.close();
    staged[pos].applyPermissions(_options.permissions);
  }

  return PublishAll(staged, toWrite, _options.atomicAll);
}

bool AtomicOutputWriter::writeOneWithSink(const std::filesystem::path &target, const SinkProducer &producer) const {
  EnsureDirectory(ParentDir(target), _options.createDirs);
  if (!ShouldWrite(target, _options.policy)) {
    return false;
  }
  StagedFile staged(target);
  FileSink sink(staged.temp());

  producer(sink);

  if (sink.discarded() || sink.bytesWritten() == 0) {
    log::debug("Not publishing {}: {}", target.string(), sink.discarded() ? "sink discarded" : "no data written");
    sink.discard();
    return false;
  }
  sink.close();
  staged.applyPermissions(_options.permissions);
  staged.rename();
  return true;
}

}  // namespace batchpress
