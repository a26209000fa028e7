#include "batchpress/file.hpp"

#include <gtest/gtest.h>
#include <sys/types.h>

#include <cerrno>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "batchpress/compression-test-helpers.hpp"
#include "batchpress/sys-test-support.hpp"
#include "batchpress/temp-file.hpp"

using namespace batchpress;

namespace {

// pread errnos keyed by file path.
test::ScriptedErrnos<std::string> gPreadErrnos;
// write errnos keyed by file path.
test::ScriptedErrnos<std::string> gWriteErrnos;

std::string Key(const std::filesystem::path& path) { return std::filesystem::canonical(path).string(); }

std::optional<int> PopErrno(test::ScriptedErrnos<std::string>& queue, int fd) {
  if (queue.empty()) {
    return std::nullopt;
  }
  const auto path = test::PathForFd(fd);
  if (!path) {
    return std::nullopt;
  }
  return queue.next(*path);
}

using PreadFn = ssize_t (*)(int, void*, size_t, off_t);
using WriteFn = ssize_t (*)(int, const void*, size_t);

}  // namespace

extern "C" ssize_t pread(int fd, void* buf, size_t count, off_t offset) {
  if (const auto err = PopErrno(gPreadErrnos, fd)) {
    errno = *err;
    return -1;
  }
  static PreadFn realPread = test::ResolveNext<PreadFn>("pread");
  return realPread(fd, buf, count, offset);
}

extern "C" ssize_t write(int fd, const void* buf, size_t count) {
  if (const auto err = PopErrno(gWriteErrnos, fd)) {
    errno = *err;
    return -1;
  }
  static WriteFn realWrite = test::ResolveNext<WriteFn>("write");
  return realWrite(fd, buf, count);
}

class FileTest : public ::testing::Test {
 protected:
  ~FileTest() override {
    gPreadErrnos.clear();
    gWriteErrnos.clear();
  }

  test::ScopedTempDir tmpDir;
};

TEST_F(FileTest, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
}

TEST_F(FileTest, OpenMissingFileThrows) {
  const auto missing = tmpDir.dirPath() / "missing.txt";
  try {
    File file(missing.string());
    FAIL() << "expected std::system_error";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), ENOENT);
    EXPECT_NE(std::string_view(ex.what()).find("missing.txt"), std::string_view::npos);
  }
}

TEST_F(FileTest, SizeAndReadAt) {
  const auto path = test::WriteTestFile(tmpDir.dirPath(), "data.bin", "0123456789");
  File file(path.string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 10U);

  char buf[4];
  EXPECT_EQ(file.readAt(buf, 3), 4U);
  EXPECT_EQ(std::string_view(buf, 4), "3456");
  EXPECT_EQ(file.readAt(buf, 8), 2U);
  EXPECT_EQ(std::string_view(buf, 2), "89");
  EXPECT_EQ(file.readAt(buf, 10), 0U);
}

TEST_F(FileTest, ReadAtRetriesOnEintr) {
  const auto path = test::WriteTestFile(tmpDir.dirPath(), "eintr.bin", "abc");
  File file(path.string());
  gPreadErrnos.script(Key(path), {EINTR, EINTR});
  char buf[3];
  EXPECT_EQ(file.readAt(buf, 0), 3U);
  EXPECT_EQ(std::string_view(buf, 3), "abc");
}

TEST_F(FileTest, ReadAtErrorThrows) {
  const auto path = test::WriteTestFile(tmpDir.dirPath(), "eio.bin", "abc");
  File file(path.string());
  gPreadErrnos.script(Key(path), {EIO});
  char buf[3];
  EXPECT_THROW(static_cast<void>(file.readAt(buf, 0)), std::system_error);
}

TEST_F(FileTest, LoadAllContentLargerThanReadBuffer) {
  const auto content = test::MakePatternedPayload(100000);
  const auto path = test::WriteTestFile(tmpDir.dirPath(), "big.bin", content);
  File file(path.string());
  EXPECT_EQ(file.loadAllContent(), content);
}

TEST_F(FileTest, LoadAllContentOfEmptyFile) {
  const auto path = test::WriteTestFile(tmpDir.dirPath(), "empty.bin", "");
  File file(path.string());
  EXPECT_TRUE(file.loadAllContent().empty());
}

TEST_F(FileTest, CreateExclusiveWritesAndSyncs) {
  const auto path = tmpDir.dirPath() / "out.bin";
  {
    File file(path.string(), File::OpenMode::CreateExclusive);
    file.writeAll("hello ");
    file.writeAll("world");
    file.sync();
    file.close();
    EXPECT_FALSE(file);
  }
  EXPECT_EQ(test::ReadTestFile(path), "hello world");
}

TEST_F(FileTest, CreateExclusiveFailsIfFileExists) {
  const auto path = test::WriteTestFile(tmpDir.dirPath(), "exists.bin", "x");
  try {
    File file(path.string(), File::OpenMode::CreateExclusive);
    FAIL() << "expected std::system_error";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), EEXIST);
  }
  EXPECT_EQ(test::ReadTestFile(path), "x");
}

TEST_F(FileTest, WriteAllRetriesOnEintrAndReportsErrors) {
  const auto path = tmpDir.dirPath() / "write.bin";
  File file(path.string(), File::OpenMode::CreateExclusive);
  gWriteErrnos.script(Key(path), {EINTR});
  file.writeAll("abc");

  gWriteErrnos.script(Key(path), {ENOSPC});
  try {
    file.writeAll("def");
    FAIL() << "expected std::system_error";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), ENOSPC);
  }
  file.close();
  EXPECT_EQ(test::ReadTestFile(path), "abc");
}
