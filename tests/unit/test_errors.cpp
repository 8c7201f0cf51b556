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

#include "errors.hpp"
#include "test_helpers.hpp"

using namespace prism;
using namespace prism::test;
using ::testing::_;

TEST(ErrorsTest, CheckStatusAcceptsSuccess)
{
  NiceDriver driver;
  EXPECT_NO_THROW(CheckStatus(driver, kNi845xErrorNoError, "ni845xOpen"));
}

TEST(ErrorsTest, CheckStatusUsesDriverText)
{
  NiceDriver driver;
  EXPECT_CALL(driver, StatusToString(-301713, _, _)).WillOnce(DescribeAs("The resource name is invalid."));
  try {
    CheckStatus(driver, -301713, "ni845xSetTimeout");
    FAIL() << "CheckStatus should throw on a nonzero status";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), kTransfer);
    EXPECT_EQ(e.status(), -301713);
    EXPECT_EQ(e.function(), "ni845xSetTimeout");
    EXPECT_STREQ(e.what(), "Error in ni845xSetTimeout: The resource name is invalid. (Code: -301713)");
  }
}

TEST(ErrorsTest, DescribeStatusFallsBackToCode)
{
  NiceDriver driver;
  EXPECT_EQ(driver.DescribeStatus(-42), "Error code -42");
}

TEST(ErrorsTest, ErrorsAreRuntimeErrors)
{
  ConnectionError e("No device is currently open.");
  const std::runtime_error& base = e;
  EXPECT_STREQ(base.what(), "No device is currently open.");
  EXPECT_EQ(e.kind(), kConnection);
  EXPECT_EQ(e.status(), 0);
  EXPECT_TRUE(e.function().empty());
}

TEST(ErrorsTest, DriverUnavailableMessage)
{
  DriverUnavailableError e("open device USB0::A");
  EXPECT_STREQ(e.what(), "Cannot open device USB0::A: NI-845x driver not loaded");
  EXPECT_STREQ(ErrorKindName(e.kind()), "driver unavailable");
}
