#include "batchpress/output-target.hpp"

#include <gtest/gtest.h>

#include <memory>

#include "batchpress/byte-sink.hpp"
#include "batchpress/compression-error.hpp"
#include "batchpress/overwrite-policy.hpp"

namespace batchpress {

TEST(OverwritePolicyTest, Parse) {
  EXPECT_EQ(ParseOverwritePolicy("fail"), OverwritePolicy::Fail);
  EXPECT_EQ(ParseOverwritePolicy("Replace"), OverwritePolicy::Replace);
  EXPECT_EQ(ParseOverwritePolicy("SKIP"), OverwritePolicy::Skip);
  EXPECT_THROW((void)ParseOverwritePolicy("overwrite"), CompressionError);
  EXPECT_THROW((void)ParseOverwritePolicy(""), CompressionError);
  EXPECT_EQ(OverwritePolicyName(OverwritePolicy::Replace), "replace");
}

TEST(OutputTargetTest, Defaults) {
  const InMemoryTarget inMemory;
  EXPECT_EQ(inMemory.maxBytesPerItem, 5UL * 1024UL * 1024UL);
  EXPECT_TRUE(inMemory.enforce);

  const DirectoryTarget directory;
  EXPECT_FALSE(directory.keepSourceStructure);
  EXPECT_EQ(directory.overwritePolicy, OverwritePolicy::Fail);
  EXPECT_TRUE(directory.atomicAll);
  EXPECT_TRUE(directory.createDirs);
  EXPECT_FALSE(directory.permissions.has_value());
}

TEST(OutputTargetTest, Validate) {
  EXPECT_NO_THROW(ValidateOutputTarget(InMemoryTarget{}));
  EXPECT_THROW(ValidateOutputTarget(InMemoryTarget{0, true}), CompressionError);

  DirectoryTarget directory;
  EXPECT_THROW(ValidateOutputTarget(directory), CompressionError);
  directory.path = "out";
  EXPECT_NO_THROW(ValidateOutputTarget(directory));

  StreamTarget stream;
  EXPECT_THROW(ValidateOutputTarget(stream), CompressionError);
  stream.sinkFactory = [](const CompressionInput &, CodecId) -> std::unique_ptr<ByteSink> { return nullptr; };
  EXPECT_NO_THROW(ValidateOutputTarget(stream));
}

}  // namespace batchpress
