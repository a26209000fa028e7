#include "batchpress/random-hex.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace batchpress {

TEST(RandomHexTest, ToHexIsZeroPadded) {
  EXPECT_EQ(ToHex(0), "0000000000000000");
  EXPECT_EQ(ToHex(0xABCDEFULL), "0000000000abcdef");
  EXPECT_EQ(ToHex(~0ULL), "ffffffffffffffff");
}

TEST(RandomHexTest, RandomStringsAreHexAndDistinct) {
  std::set<std::string> seen;
  for (int iter = 0; iter < 64; ++iter) {
    const auto str = RandomHexString();
    ASSERT_EQ(str.size(), 16U);
    EXPECT_EQ(str.find_first_not_of("0123456789abcdef"), std::string::npos);
    seen.insert(str);
  }
  EXPECT_EQ(seen.size(), 64U);
}

}  // namespace batchpress
