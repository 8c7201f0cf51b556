/*
  Copyright (c) 2026 The Prism Authors

  This file is part of Prism.

  Prism is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Prism is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with Prism.  If not, see <http://www.gnu.org/licenses/>.
*/
#include <gtest/gtest.h>

#include "util.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace prism;
using namespace prism::test;
using ::testing::ElementsAre;

TEST(UtilHexTest, BytesToHexIsUpperCase)
{
  Bytes data;
  data.push_back(0xde);
  data.push_back(0xad);
  data.push_back(0x0f);
  EXPECT_EQ(util::BytesToHex(data), "DEAD0F");
  EXPECT_EQ(util::BytesToHex(Bytes()), "");
}

TEST(UtilHexTest, HexToBytesIgnoresCase)
{
  EXPECT_THAT(util::HexToBytes("deadBEEF"), ElementsAre(0xde, 0xad, 0xbe, 0xef));
  EXPECT_TRUE(util::HexToBytes("").empty());
}

TEST(UtilHexTest, NonHexCharacterRejected)
{
  try {
    util::HexToBytes("ZZ");
    FAIL() << "HexToBytes should reject non hex input";
  } catch (const InvalidHexError& e) {
    EXPECT_EQ(e.kind(), kInvalidHex);
    EXPECT_STREQ(e.what(), "Invalid hex string 'ZZ': non hex character");
  }
  EXPECT_THROW(util::HexToBytes("01 02"), InvalidHexError);
  EXPECT_THROW(util::HexToBytes("0x01"), InvalidHexError);
}

TEST(UtilHexTest, OddLengthRejected)
{
  try {
    util::HexToBytes("ABC");
    FAIL() << "HexToBytes should reject an odd number of digits";
  } catch (const InvalidHexError& e) {
    EXPECT_STREQ(e.what(), "Invalid hex string 'ABC': odd number of digits");
  }
}
