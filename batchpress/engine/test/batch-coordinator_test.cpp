#include "batchpress/batch-coordinator.hpp"

#include <gtest/gtest.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "batchpress/algorithm-set.hpp"
#include "batchpress/batch-result.hpp"
#include "batchpress/byte-sink.hpp"
#include "batchpress/codec-id.hpp"
#include "batchpress/codec-registry.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/compression-input.hpp"
#include "batchpress/fake-codec-adapter.hpp"
#include "batchpress/item-config.hpp"
#include "batchpress/item-result.hpp"
#include "batchpress/output-target.hpp"
#include "batchpress/overwrite-policy.hpp"
#include "batchpress/sys-test-support.hpp"
#include "batchpress/temp-file.hpp"

namespace batchpress {

namespace {

// write() fails with ENOSPC for files whose path contains gFailingPathPart.
std::atomic<bool> gWriteFailureArmed{false};
std::mutex gFailingPathMutex;
std::string gFailingPathPart;

bool ShouldFailWrite(int fd) {
  if (!gWriteFailureArmed.load()) {
    return false;
  }
  const auto path = test::PathForFd(fd);
  if (!path) {
    return false;
  }
  std::scoped_lock<std::mutex> lock(gFailingPathMutex);
  return path->find(gFailingPathPart) != std::string::npos;
}

using WriteFn = ssize_t (*)(int, const void *, size_t);

}  // namespace

}  // namespace batchpress

extern "C" ssize_t write(int fd, const void *buf, size_t count) {
  if (batchpress::ShouldFailWrite(fd)) {
    errno = ENOSPC;
    return -1;
  }
  static batchpress::WriteFn realWrite = batchpress::test::ResolveNext<batchpress::WriteFn>("write");
  return realWrite(fd, buf, count);
}

namespace batchpress {

namespace {

using Behavior = test::FakeCodecAdapter::Behavior;

struct SinkRecord {
  std::string data;
  bool closed{false};
  bool discarded{false};
};

class RecordingSink final : public ByteSink {
 public:
  explicit RecordingSink(SinkRecord &record, bool failOnClose = false) noexcept
      : _record(record), _failOnClose(failOnClose) {}

  void write(std::string_view data) override { _record.data.append(data); }

  void close() override {
    if (_failOnClose) {
      throw CompressionError(ErrorCode::WriteFailed, "disk full");
    }
    _record.closed = true;
  }

  void discard() noexcept override {
    _record.discarded = true;
    _record.data.clear();
  }

  [[nodiscard]] std::size_t bytesWritten() const noexcept override { return _record.data.size(); }

  [[nodiscard]] bool discarded() const noexcept override { return _record.discarded; }

 private:
  SinkRecord &_record;
  bool _failOnClose;
};

template <class T>
ErrorCode CodeOf(T &&fn) {
  try {
    fn();
  } catch (const CompressionError &ex) {
    return ex.code();
  }
  ADD_FAILURE() << "Expected a CompressionError";
  return ErrorCode::CompressionFailed;
}

}  // namespace

class BatchCoordinatorTest : public ::testing::Test {
 protected:
  ~BatchCoordinatorTest() override { gWriteFailureArmed = false; }

  static void FailWritesTo(std::string_view pathPart) {
    {
      std::scoped_lock<std::mutex> lock(gFailingPathMutex);
      gFailingPathPart = pathPart;
    }
    gWriteFailureArmed = true;
  }

  BatchCoordinatorTest() {
    install(CodecId::gzip, Behavior::Copy);
    install(CodecId::br, Behavior::Copy);
    install(CodecId::zstd, Behavior::Copy);
  }

  test::FakeCodecAdapter &install(CodecId codec, Behavior behavior) {
    auto adapter = std::make_unique<test::FakeCodecAdapter>(codec, behavior);
    auto &ref = *adapter;
    registry.registerAdapter(std::move(adapter));
    return ref;
  }

  [[nodiscard]] int nbCalls(CodecId codec) const {
    return static_cast<const test::FakeCodecAdapter &>(*registry.find(codec)).nbCalls();
  }

  static std::vector<CompressionInput> BufferInputs(std::size_t nbInputs) {
    std::vector<CompressionInput> inputs;
    inputs.reserve(nbInputs);
    for (std::size_t pos = 0; pos < nbInputs; ++pos) {
      inputs.push_back(CompressionInput::FromBuffer("item-" + std::to_string(pos), std::string(pos * 37U, 'a')));
    }
    return inputs;
  }

  static ItemConfig GzipAndBrotli() {
    return ItemConfig(AlgorithmSet::Of({AlgorithmSpec(CodecId::gzip), AlgorithmSpec(CodecId::br)}));
  }

  std::filesystem::path writeSource(std::string_view relPath, std::string_view content) const {
    return test::WriteTestFile(srcDir(), relPath, content);
  }

  [[nodiscard]] std::filesystem::path srcDir() const { return tmpDir.dirPath() / "src"; }

  [[nodiscard]] std::filesystem::path outDir() const { return tmpDir.dirPath() / "out"; }

  StreamTarget::SinkFactory recordingFactory() {
    return [this](const CompressionInput &input, CodecId codec) -> std::unique_ptr<ByteSink> {
      std::scoped_lock<std::mutex> lock(recordsMutex);
      auto &record = records[input.id() + "." + std::string(CodecExtension(codec))];
      return std::make_unique<RecordingSink>(record);
    };
  }

  test::ScopedTempDir tmpDir;
  CodecRegistry registry;
  BatchCoordinator coordinator{registry};
  std::mutex recordsMutex;
  std::map<std::string, SinkRecord> records;
};

TEST_F(BatchCoordinatorTest, EmptyBatch) {
  const auto result = coordinator.run({}, GzipAndBrotli(), BatchOptions{});
  EXPECT_TRUE(result.empty());
  EXPECT_TRUE(result.allSucceeded());
}

TEST_F(BatchCoordinatorTest, InMemoryResultsInInputOrder) {
  const auto inputs = BufferInputs(3);
  const auto result = coordinator.run(inputs, GzipAndBrotli(), BatchOptions{});
  ASSERT_EQ(result.size(), inputs.size());
  for (std::size_t pos = 0; pos < inputs.size(); ++pos) {
    EXPECT_EQ(result[pos].id, inputs[pos].id());
    EXPECT_TRUE(result[pos].success);
    ASSERT_EQ(result[pos].outcomes.size(), 2U);
    EXPECT_EQ(std::string_view(result[pos].outcomes[0].data), inputs[pos].buffer());
  }
  EXPECT_EQ(result.successCount(), 3U);
  EXPECT_NE(result.find("item-1"), nullptr);
  EXPECT_EQ(result.find("unknown"), nullptr);
}

TEST_F(BatchCoordinatorTest, ParallelWorkersPreserveOrder) {
  const auto inputs = BufferInputs(50);
  BatchOptions options;
  options.workerThreads = 4;
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_EQ(result.size(), inputs.size());
  for (std::size_t pos = 0; pos < inputs.size(); ++pos) {
    EXPECT_EQ(result[pos].id, inputs[pos].id());
    EXPECT_EQ(result[pos].originalSize, inputs[pos].size());
  }
  EXPECT_TRUE(result.allSucceeded());
  EXPECT_EQ(nbCalls(CodecId::gzip), 50);
}

TEST_F(BatchCoordinatorTest, HardwareConcurrencyWorkers) {
  const auto inputs = BufferInputs(8);
  BatchOptions options;
  options.workerThreads = 0;
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_EQ(result.size(), 8U);
  EXPECT_TRUE(result.allSucceeded());
}

TEST_F(BatchCoordinatorTest, FailedItemDoesNotStopOthers) {
  const auto inputs = BufferInputs(6);
  ItemConfigMap configs(GzipAndBrotli());
  configs.set("item-2", ItemConfig(AlgorithmSet::Single(CodecId::gzip), 10));
  BatchOptions options;
  options.workerThreads = 3;
  const auto result = coordinator.run(inputs, configs, options);
  ASSERT_EQ(result.size(), 6U);
  EXPECT_EQ(result.failureCount(), 1U);
  EXPECT_FALSE(result[2].success);
  ASSERT_TRUE(result[2].itemError);
  EXPECT_EQ(result[2].itemError->code, ErrorCode::PayloadTooLarge);
  EXPECT_TRUE(result[5].success);
}

TEST_F(BatchCoordinatorTest, FailFastRaisesFirstError) {
  install(CodecId::br, Behavior::Throw);
  const auto inputs = BufferInputs(10);
  for (std::uint32_t nbWorkers : {1U, 4U}) {
    BatchOptions options;
    options.failFast = true;
    options.workerThreads = nbWorkers;
    EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }),
              ErrorCode::CompressionFailed);
  }
}

TEST_F(BatchCoordinatorTest, FailFastSequentialStopsAtFailingItem) {
  const auto inputs = BufferInputs(5);
  ItemConfigMap configs(GzipAndBrotli());
  configs.set("item-1", ItemConfig(AlgorithmSet::Single(CodecId::zstd), 1));
  BatchOptions options;
  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, configs, options); }), ErrorCode::PayloadTooLarge);
  // item-0 only
  EXPECT_EQ(nbCalls(CodecId::gzip), 1);
}

TEST_F(BatchCoordinatorTest, DuplicateIdsRejectedBeforeAnyWork) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromBuffer("same", "a"));
  inputs.push_back(CompressionInput::FromBuffer("other", "b"));
  inputs.push_back(CompressionInput::FromBuffer("same", "c"));
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), BatchOptions{}); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(nbCalls(CodecId::gzip), 0);
}

TEST_F(BatchCoordinatorTest, ConfigResolutionErrorRejectedBeforeAnyWork) {
  const auto inputs = BufferInputs(3);
  ItemConfigMap configs;
  configs.set("item-0", GzipAndBrotli());
  configs.set("item-1", GzipAndBrotli());
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, configs, BatchOptions{}); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(nbCalls(CodecId::gzip), 0);

  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, ItemConfigFn{}, BatchOptions{}); }),
            ErrorCode::InvalidConfiguration);
}

TEST_F(BatchCoordinatorTest, InvalidOptions) {
  const auto inputs = BufferInputs(1);
  BatchOptions options;
  options.skipExtensions = {"png", ""};
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }),
            ErrorCode::InvalidConfiguration);

  options.skipExtensions.clear();
  options.target = StreamTarget{};
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }),
            ErrorCode::InvalidConfiguration);

  options.target = DirectoryTarget{};
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }),
            ErrorCode::InvalidConfiguration);
}

TEST_F(BatchCoordinatorTest, SkipExtensions) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("logo.PNG", "png-bytes")));
  inputs.push_back(CompressionInput::FromFile(writeSource("site.css", "body{}")));
  inputs.push_back(CompressionInput::FromFile(writeSource("font.woff2", "font")));
  inputs.push_back(CompressionInput::FromFile(writeSource("README", "no extension")));
  inputs.push_back(CompressionInput::FromBuffer("buffer.png", "buffers are never skipped"));
  BatchOptions options;
  options.skipExtensions = {"png", ".WOFF2"};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_EQ(result.size(), 3U);
  EXPECT_EQ(result[0].id, inputs[1].id());
  EXPECT_EQ(result[1].id, inputs[3].id());
  EXPECT_EQ(result[2].id, "buffer.png");
  EXPECT_EQ(result.find(inputs[0].id()), nullptr);
}

TEST_F(BatchCoordinatorTest, PrecompressedExtensionList) {
  const auto extensions = PrecompressedExtensionList();
  EXPECT_EQ(extensions.size(), PrecompressedExtensions().size());
  EXPECT_NE(std::ranges::find(extensions, "png"), extensions.end());
  EXPECT_NE(std::ranges::find(extensions, "woff2"), extensions.end());
  EXPECT_EQ(std::ranges::find(extensions, "css"), extensions.end());

  BatchOptions options;
  options.skipExtensions = PrecompressedExtensionList();
  EXPECT_NO_THROW(options.validate());
}

TEST_F(BatchCoordinatorTest, InMemoryLimit) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromBuffer("small", std::string(10, 's')));
  inputs.push_back(CompressionInput::FromBuffer("large", std::string(11, 'l')));
  BatchOptions options;
  options.target = InMemoryTarget{10, true};
  auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_TRUE(result[0].success);
  ASSERT_TRUE(result[1].itemError);
  EXPECT_EQ(result[1].itemError->code, ErrorCode::PayloadTooLarge);
  EXPECT_TRUE(result[1].outcomes.empty());

  options.target = InMemoryTarget{10, false};
  result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_TRUE(result.allSucceeded());

  options.target = InMemoryTarget{10, true};
  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }), ErrorCode::PayloadTooLarge);
}

TEST_F(BatchCoordinatorTest, DirectoryTargetPublishesFiles) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("index.html", "<html></html>"), srcDir()));
  inputs.push_back(CompressionInput::FromFile(writeSource("css/site.css", "body{}"), srcDir()));
  BatchOptions options;
  options.target = DirectoryTarget{outDir()};
  options.workerThreads = 2;
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_TRUE(result.allSucceeded());
  EXPECT_EQ(test::ListDirectory(outDir()),
            (std::vector<std::string>{"index.html.br", "index.html.gz", "site.css.br", "site.css.gz"}));
  EXPECT_EQ(test::ReadTestFile(outDir() / "site.css.gz"), "body{}");

  const auto *gzipOutcome = result[0].find(CodecId::gzip);
  ASSERT_NE(gzipOutcome, nullptr);
  EXPECT_EQ(gzipOutcome->outputPath, std::filesystem::canonical(outDir()) / "index.html.gz");
  EXPECT_EQ(gzipOutcome->compressedSize, 13U);
  EXPECT_TRUE(gzipOutcome->data.empty());
}

TEST_F(BatchCoordinatorTest, DirectoryTargetKeepsSourceStructure) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("index.html", "<html></html>"), srcDir()));
  inputs.push_back(CompressionInput::FromFile(writeSource("assets/css/site.css", "body{}"), srcDir()));
  BatchOptions options;
  DirectoryTarget target{outDir()};
  target.keepSourceStructure = true;
  options.target = target;
  const auto result = coordinator.run(inputs, ItemConfig(AlgorithmSet::Single(CodecId::gzip)), options);
  ASSERT_TRUE(result.allSucceeded());
  EXPECT_EQ(test::ListDirectory(outDir()), (std::vector<std::string>{"assets", "index.html.gz"}));
  EXPECT_EQ(test::ReadTestFile(outDir() / "assets" / "css" / "site.css.gz"), "body{}");
}

TEST_F(BatchCoordinatorTest, DirectoryTargetExistingFile) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("a.js", "new-a")));
  inputs.push_back(CompressionInput::FromFile(writeSource("b.js", "new-b")));
  test::WriteTestFile(outDir(), "a.js.gz", "old-a");
  BatchOptions options;
  options.target = DirectoryTarget{outDir()};
  const ItemConfig config(AlgorithmSet::Single(CodecId::gzip));

  auto result = coordinator.run(inputs, config, options);
  ASSERT_TRUE(result[0].itemError);
  EXPECT_EQ(result[0].itemError->code, ErrorCode::TargetAlreadyExists);
  EXPECT_TRUE(result[1].success);
  EXPECT_EQ(test::ReadTestFile(outDir() / "a.js.gz"), "old-a");

  auto &target = std::get<DirectoryTarget>(options.target);
  target.overwritePolicy = OverwritePolicy::Replace;
  result = coordinator.run(inputs, config, options);
  EXPECT_TRUE(result.allSucceeded());
  EXPECT_EQ(test::ReadTestFile(outDir() / "a.js.gz"), "new-a");

  options.failFast = true;
  target.overwritePolicy = OverwritePolicy::Fail;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, config, options); }), ErrorCode::TargetAlreadyExists);
}

TEST_F(BatchCoordinatorTest, DirectoryTargetFailedCodecIsNotPublished) {
  install(CodecId::br, Behavior::Throw);
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("a.js", "content")));
  BatchOptions options;
  options.target = DirectoryTarget{outDir()};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_FALSE(result[0].success);
  EXPECT_EQ(result[0].status(), ItemResult::Status::Partial);
  EXPECT_EQ(test::ListDirectory(outDir()), std::vector<std::string>{"a.js.gz"});
  EXPECT_TRUE(result[0].find(CodecId::br)->outputPath.empty());
}

TEST_F(BatchCoordinatorTest, DirectoryTargetWriteFailureIsAllOrNothing) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("a.js", "const a = 1;")));
  inputs.push_back(CompressionInput::FromFile(writeSource("b.js", "const b = 2;")));
  BatchOptions options;
  options.target = DirectoryTarget{outDir()};
  FailWritesTo("a.js.br.tmp.");

  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_EQ(result.size(), 2U);
  EXPECT_FALSE(result[0].success);
  ASSERT_TRUE(result[0].itemError);
  EXPECT_EQ(result[0].itemError->code, ErrorCode::WriteFailed);
  EXPECT_TRUE(result[1].success);
  EXPECT_EQ(test::ListDirectory(outDir()), (std::vector<std::string>{"b.js.br", "b.js.gz"}));

  std::filesystem::remove_all(outDir());
  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }), ErrorCode::WriteFailed);
  EXPECT_TRUE(test::ListDirectory(outDir()).empty());
}

TEST_F(BatchCoordinatorTest, DirectoryTargetRejectsBufferInputs) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromBuffer("buffer", "data"));
  inputs.push_back(CompressionInput::FromFile(writeSource("a.js", "content")));
  BatchOptions options;
  options.target = DirectoryTarget{outDir()};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_TRUE(result[0].itemError);
  EXPECT_EQ(result[0].itemError->code, ErrorCode::UnsupportedOutputMode);
  EXPECT_TRUE(result[1].success);

  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }),
            ErrorCode::UnsupportedOutputMode);
}

TEST_F(BatchCoordinatorTest, UnusableOutputDirectory) {
  std::vector<CompressionInput> inputs;
  inputs.push_back(CompressionInput::FromFile(writeSource("a.js", "a")));
  inputs.push_back(CompressionInput::FromFile(writeSource("b.js", "b")));
  const auto notADir = test::WriteTestFile(tmpDir.dirPath(), "not-a-dir", "x");
  BatchOptions options;
  options.target = DirectoryTarget{notADir};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_EQ(result.failureCount(), 2U);
  for (const auto &item : result) {
    ASSERT_TRUE(item.itemError);
    EXPECT_EQ(item.itemError->code, ErrorCode::WriteFailed);
  }
  EXPECT_EQ(nbCalls(CodecId::gzip), 0);

  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }), ErrorCode::WriteFailed);
}

TEST_F(BatchCoordinatorTest, StreamTarget) {
  const auto inputs = BufferInputs(3);
  BatchOptions options;
  options.target = StreamTarget{recordingFactory()};
  options.workerThreads = 2;
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_TRUE(result.allSucceeded());
  ASSERT_EQ(records.size(), 6U);
  for (const auto &input : inputs) {
    const auto &record = records.at(input.id() + ".gz");
    EXPECT_TRUE(record.closed);
    EXPECT_FALSE(record.discarded);
    EXPECT_EQ(record.data, input.buffer());
  }
  EXPECT_EQ(result[2].find(CodecId::br)->compressedSize, inputs[2].size());
}

TEST_F(BatchCoordinatorTest, StreamTargetNullSinkSkipsCodec) {
  const auto inputs = BufferInputs(2);
  BatchOptions options;
  auto factory = recordingFactory();
  options.target = StreamTarget{[factory](const CompressionInput &input, CodecId codec) -> std::unique_ptr<ByteSink> {
    if (codec == CodecId::br) {
      return nullptr;
    }
    return factory(input, codec);
  }};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  ASSERT_TRUE(result.allSucceeded());
  EXPECT_EQ(result[0].outcomes.size(), 1U);
  EXPECT_EQ(result[0].find(CodecId::br), nullptr);
  EXPECT_EQ(nbCalls(CodecId::br), 0);
}

TEST_F(BatchCoordinatorTest, StreamTargetFailedCodecSinkIsDiscarded) {
  install(CodecId::br, Behavior::Throw);
  const auto inputs = BufferInputs(2);
  BatchOptions options;
  options.target = StreamTarget{recordingFactory()};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_EQ(result.failureCount(), 2U);
  const auto &brRecord = records.at("item-1.br");
  EXPECT_TRUE(brRecord.discarded);
  EXPECT_FALSE(brRecord.closed);
  EXPECT_TRUE(records.at("item-1.gz").closed);

  records.clear();
  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }), ErrorCode::CompressionFailed);
  EXPECT_TRUE(records.at("item-0.gz").discarded);
  EXPECT_TRUE(records.at("item-0.br").discarded);
}

TEST_F(BatchCoordinatorTest, StreamTargetCloseFailure) {
  const auto inputs = BufferInputs(2);
  BatchOptions options;
  options.target = StreamTarget{[this](const CompressionInput &input, CodecId codec) -> std::unique_ptr<ByteSink> {
    std::scoped_lock<std::mutex> lock(recordsMutex);
    auto &record = records[input.id() + "." + std::string(CodecExtension(codec))];
    return std::make_unique<RecordingSink>(record, codec == CodecId::gzip);
  }};
  const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
  EXPECT_EQ(result.failureCount(), 2U);
  const auto *gzipOutcome = result[1].find(CodecId::gzip);
  ASSERT_NE(gzipOutcome, nullptr);
  ASSERT_TRUE(gzipOutcome->error);
  EXPECT_EQ(gzipOutcome->error->code, ErrorCode::WriteFailed);
  EXPECT_TRUE(result[1].find(CodecId::br)->ok());

  options.failFast = true;
  EXPECT_EQ(CodeOf([&] { (void)coordinator.run(inputs, GzipAndBrotli(), options); }), ErrorCode::WriteFailed);
}

TEST_F(BatchCoordinatorTest, StreamTargetSinkFactoryErrorIsItemLevel) {
  const auto inputs = BufferInputs(3);
  BatchOptions options;
  auto factory = recordingFactory();
  options.target = StreamTarget{[factory](const CompressionInput &input, CodecId codec) -> std::unique_ptr<ByteSink> {
    if (input.id() == "item-1" && codec == CodecId::br) {
      throw std::runtime_error("cannot open sink");
    }
    return factory(input, codec);
  }};

  for (const std::uint32_t nbWorkers : {1U, 3U}) {
    SCOPED_TRACE(testing::Message() << "workers=" << nbWorkers);
    records.clear();
    options.workerThreads = nbWorkers;
    const auto result = coordinator.run(inputs, GzipAndBrotli(), options);
    ASSERT_EQ(result.size(), 3U);
    EXPECT_EQ(result.failureCount(), 1U);
    ASSERT_TRUE(result[1].itemError);
    EXPECT_EQ(result[1].itemError->code, ErrorCode::WriteFailed);
    EXPECT_NE(result[1].itemError->message.find("cannot open sink"), std::string::npos);
    EXPECT_TRUE(records.at("item-1.gz").discarded);
    EXPECT_TRUE(result[0].success);
    EXPECT_TRUE(result[2].success);
  }

  options.failFast = true;
  options.workerThreads = 1;
  EXPECT_THROW((void)coordinator.run(inputs, GzipAndBrotli(), options), std::runtime_error);
}

}  // namespace batchpress
