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
#ifndef TEST_HELPERS_HPP__
#define TEST_HELPERS_HPP__

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <string.h>

#include "mock_driver.hpp"
#include "util.hpp"
#include <boost/shared_ptr.hpp>

namespace prism {
namespace test {

typedef ::testing::NiceMock<MockDriver> NiceDriver;

/// Handle the mock reports for a find session
const NiHandle kFindHandle = 0xf1;

inline boost::shared_ptr<NiceDriver> MakeDriver()
{
  return boost::shared_ptr<NiceDriver>(new NiceDriver);
}

/// FindDevice: report count devices, the first one named first
ACTION_P2(ReportDevices, first, count)
{
  strcpy(arg0, first);
  *arg1 = kFindHandle;
  *arg2 = count;
  return 0;
}

/// FindDeviceNext: report the next device name
ACTION_P(ReportNextDevice, name)
{
  strcpy(arg1, name);
  return 0;
}

/// ConfigurationOpen: hand out a handle
ACTION_P(ReturnHandleIn0, handle)
{
  *arg0 = handle;
  return 0;
}

/// Open: hand out a device handle
ACTION_P(ReturnHandleIn1, handle)
{
  *arg1 = handle;
  return 0;
}

/// SpiWriteRead: fill the read buffer with data and report its size
ACTION_P(SpiRespond, data)
{
  std::copy(data.begin(), data.end(), arg5);
  *arg4 = data.size();
  return 0;
}

/// I2cRead: fill the read buffer with data and report its size
ACTION_P(I2cRespond, data)
{
  std::copy(data.begin(), data.end(), arg4);
  *arg3 = data.size();
  return 0;
}

/// DioReadPort: report a port value
ACTION_P(ReadPortValue, value)
{
  *arg2 = value;
  return 0;
}

/// StatusToString: describe any status as text
ACTION_P(DescribeAs, text)
{
  strncpy(arg2, text, arg1 - 1);
  arg2[arg1 - 1] = 0;
}

inline Bytes MakeBytes(const char *hex)
{
  return util::HexToBytes(hex);
}

}
}

#endif // TEST_HELPERS_HPP__
