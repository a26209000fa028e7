#include "batchpress/raw-chars.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <utility>

namespace batchpress {

template <typename T>
class RawCharsTest : public ::testing::Test {};

using RawCharsTypes = ::testing::Types<RawChars, RawChars32>;
TYPED_TEST_SUITE(RawCharsTest, RawCharsTypes, );

TYPED_TEST(RawCharsTest, DefaultConstructedIsEmpty) {
  TypeParam buf;
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.size(), 0U);
  EXPECT_EQ(buf.capacity(), 0U);
  EXPECT_EQ(buf.data(), nullptr);
  EXPECT_EQ(buf.begin(), buf.end());
}

TYPED_TEST(RawCharsTest, ConstructFromView) {
  TypeParam buf(std::string_view("Hello"));
  EXPECT_EQ(std::string_view(buf), "Hello");
  EXPECT_EQ(buf.capacity(), 5U);
}

TYPED_TEST(RawCharsTest, AppendGrowsCapacity) {
  TypeParam buf;
  buf.append(std::string_view("abc"));
  buf.append(std::string_view("defgh"));
  buf.push_back('!');
  EXPECT_EQ(std::string_view(buf), "abcdefgh!");
  EXPECT_GE(buf.capacity(), buf.size());
}

TYPED_TEST(RawCharsTest, EnsureAvailableCapacityThenAddSize) {
  TypeParam buf(std::string_view("ab"));
  buf.ensureAvailableCapacity(10);
  EXPECT_GE(buf.availableCapacity(), 10U);
  buf.data()[buf.size()] = 'c';
  buf.data()[buf.size() + 1] = 'd';
  buf.addSize(2);
  EXPECT_EQ(std::string_view(buf), "abcd");
  buf.setSize(1);
  EXPECT_EQ(std::string_view(buf), "a");
}

TYPED_TEST(RawCharsTest, ExponentialGrowthAtLeastDoubles) {
  TypeParam buf(8);
  buf.setSize(8);
  buf.ensureAvailableCapacityExponential(1);
  EXPECT_GE(buf.capacity(), 17U);
}

TYPED_TEST(RawCharsTest, CopyAndMove) {
  TypeParam buf(std::string_view("payload"));
  TypeParam copy(buf);
  EXPECT_EQ(copy, buf);
  EXPECT_NE(copy.data(), buf.data());

  const auto* oldPtr = buf.data();
  TypeParam moved(std::move(buf));
  EXPECT_EQ(moved.data(), oldPtr);
  EXPECT_TRUE(buf.empty());  // NOLINT(bugprone-use-after-move)

  TypeParam assigned;
  assigned = copy;
  EXPECT_EQ(std::string_view(assigned), "payload");

  TypeParam moveAssigned(std::string_view("x"));
  moveAssigned = std::move(assigned);
  EXPECT_EQ(std::string_view(moveAssigned), "payload");
}

TYPED_TEST(RawCharsTest, AssignReplacesContent) {
  TypeParam buf(std::string_view("long content here"));
  buf.assign(std::string_view("short"));
  EXPECT_EQ(std::string_view(buf), "short");
  buf.assign(std::string_view());
  EXPECT_TRUE(buf.empty());
}

TYPED_TEST(RawCharsTest, ShrinkToEmptyReleasesMemory) {
  TypeParam buf(std::string_view("data"));
  buf.shrinkToEmpty();
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.capacity(), 0U);
  EXPECT_EQ(buf.data(), nullptr);
}

TYPED_TEST(RawCharsTest, EqualityWithEmptyBuffers) {
  TypeParam lhs;
  TypeParam rhs(16);
  EXPECT_EQ(lhs, rhs);
  rhs.push_back('a');
  EXPECT_NE(lhs, rhs);
}

TYPED_TEST(RawCharsTest, Swap) {
  TypeParam lhs(std::string_view("left"));
  TypeParam rhs(std::string_view("right"));
  swap(lhs, rhs);
  EXPECT_EQ(std::string_view(lhs), "right");
  EXPECT_EQ(std::string_view(rhs), "left");
}

TEST(RawChars32Test, TooLargeGrowthThrows) {
  RawChars32 buf(std::string_view("abc"));
  EXPECT_THROW(buf.ensureAvailableCapacity(std::numeric_limits<std::uint32_t>::max()), std::bad_alloc);
}

}  // namespace batchpress
