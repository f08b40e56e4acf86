/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "utils/parsers.hpp"

using filetx::util::parseByteQuantity;

TEST(ParseByteQuantityTest, PlainNumber) {
  EXPECT_EQ(parseByteQuantity("4096"), 4096u);
  EXPECT_EQ(parseByteQuantity("  17 "), 17u);
  EXPECT_EQ(parseByteQuantity("0b"), 0u);
}

/**
 * @given sizes with unit suffixes in different case
 * @when parsed
 * @then bare and *iB suffixes are binary, *B suffixes are decimal
 */
TEST(ParseByteQuantityTest, Suffixes) {
  EXPECT_EQ(parseByteQuantity("1K"), 1024u);
  EXPECT_EQ(parseByteQuantity("64 MiB"), 64u << 20);
  EXPECT_EQ(parseByteQuantity("1g"), uint64_t{1} << 30);
  EXPECT_EQ(parseByteQuantity("2TiB"), uint64_t{2} << 40);
  EXPECT_EQ(parseByteQuantity("512Mb"), 512'000'000u);
  EXPECT_EQ(parseByteQuantity("3kB"), 3000u);
}

TEST(ParseByteQuantityTest, Malformed) {
  EXPECT_FALSE(parseByteQuantity(""));
  EXPECT_FALSE(parseByteQuantity("MB"));
  EXPECT_FALSE(parseByteQuantity("-5"));
  EXPECT_FALSE(parseByteQuantity("10 parsecs"));
  EXPECT_FALSE(parseByteQuantity("10Xb"));
  EXPECT_FALSE(parseByteQuantity("1.5G"));
}

TEST(ParseByteQuantityTest, Overflow) {
  EXPECT_EQ(parseByteQuantity("18446744073709551615"),
            std::numeric_limits<uint64_t>::max());
  EXPECT_FALSE(parseByteQuantity("18446744073709551616"));
  EXPECT_FALSE(parseByteQuantity("17179869184 GiB"));
}
