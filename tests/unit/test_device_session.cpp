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

#include "device_session.hpp"
#include "transfer_configuration.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace prism;
using namespace prism::test;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrEq;
using boost::shared_ptr;
using std::string;
using std::vector;

// ═══════════════════════════════════════════════════════════════════════════
// Enumeration
// ═══════════════════════════════════════════════════════════════════════════

TEST(DeviceSessionTest, EnumerateWithoutDriverIsEmpty)
{
  EXPECT_TRUE(DeviceSession::Enumerate(shared_ptr<Ni845xDriver>()).empty());
}

TEST(DeviceSessionTest, EnumerateKeepsDriverOrder)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, FindDevice(_, _, _)).WillOnce(ReportDevices("USB0::0x3923::0x7514::01A", 3));
  EXPECT_CALL(*driver, FindDeviceNext(kFindHandle, _))
      .WillOnce(ReportNextDevice("USB0::0x3923::0x7514::01B"))
      .WillOnce(ReportNextDevice("USB0::0x3923::0x7514::01C"));
  EXPECT_CALL(*driver, CloseFindDeviceHandle(kFindHandle)).Times(1);

  vector<string> devices = DeviceSession::Enumerate(driver);
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0], "USB0::0x3923::0x7514::01A");
  EXPECT_EQ(devices[1], "USB0::0x3923::0x7514::01B");
  EXPECT_EQ(devices[2], "USB0::0x3923::0x7514::01C");
}

TEST(DeviceSessionTest, EnumerateNothingFound)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, FindDevice(_, _, _)).WillOnce(ReportDevices("", 0));
  EXPECT_CALL(*driver, FindDeviceNext(_, _)).Times(0);
  EXPECT_CALL(*driver, CloseFindDeviceHandle(kFindHandle)).Times(1);

  EXPECT_TRUE(DeviceSession::Enumerate(driver).empty());
}

TEST(DeviceSessionTest, EnumerateFailureThrows)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, FindDevice(_, _, _)).WillOnce(Return(-301701));
  EXPECT_CALL(*driver, CloseFindDeviceHandle(_)).Times(0);

  EXPECT_THROW(DeviceSession::Enumerate(driver), TransferError);
}

TEST(DeviceSessionTest, EnumerateClosesFindHandleWhenNextFails)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, FindDevice(_, _, _)).WillOnce(ReportDevices("USB0::A", 2));
  EXPECT_CALL(*driver, FindDeviceNext(_, _)).WillOnce(Return(-1));
  EXPECT_CALL(*driver, CloseFindDeviceHandle(kFindHandle)).Times(1);

  EXPECT_THROW(DeviceSession::Enumerate(driver), TransferError);
}

// ═══════════════════════════════════════════════════════════════════════════
// Open / Close
// ═══════════════════════════════════════════════════════════════════════════

TEST(DeviceSessionTest, OpenWithoutDriverThrows)
{
  try {
    DeviceSession::Open(shared_ptr<Ni845xDriver>(), "USB0::A");
    FAIL() << "Open should throw without a driver";
  } catch (const DriverUnavailableError& e) {
    EXPECT_EQ(e.kind(), kDriverUnavailable);
  }
}

TEST(DeviceSessionTest, OpenFailureThrowsDeviceOpenError)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, Open(StrEq("USB0::A"), _)).WillOnce(Return(-301713));
  EXPECT_CALL(*driver, StatusToString(_, _, _)).WillRepeatedly(DescribeAs("resource not found"));
  EXPECT_CALL(*driver, Close(_)).Times(0);

  try {
    DeviceSession::Open(driver, "USB0::A");
    FAIL() << "Open should throw on a nonzero status";
  } catch (const DeviceOpenError& e) {
    EXPECT_EQ(e.kind(), kDeviceOpen);
    EXPECT_EQ(e.status(), -301713);
    EXPECT_EQ(e.function(), "ni845xOpen");
    EXPECT_STREQ(e.what(), "Error opening device USB0::A: resource not found (Code: -301713)");
  }
}

TEST(DeviceSessionTest, OpenKeepsHandleAndResource)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, Open(StrEq("USB0::A"), _)).WillOnce(ReturnHandleIn1(0x10));
  EXPECT_CALL(*driver, Close(0x10)).Times(1);

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  EXPECT_TRUE(session->IsOpen());
  EXPECT_EQ(session->handle(), 0x10u);
  EXPECT_EQ(session->resource(), "USB0::A");
  EXPECT_EQ(session->driver(), driver);
}

TEST(DeviceSessionTest, TimeoutAndVoltageReachDriver)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  ON_CALL(*driver, Open(_, _)).WillByDefault(ReturnHandleIn1(0x10));
  EXPECT_CALL(*driver, SetTimeout(0x10, 5000u)).Times(1);
  EXPECT_CALL(*driver, SetIoVoltageLevel(0x10, kNi845x33Volts)).Times(1);

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  session->SetTimeout(5000);
  session->SetIoVoltage(kNi845x33Volts);
  EXPECT_EQ(session->timeout_ms(), 5000u);
  EXPECT_EQ(session->io_voltage(), kNi845x33Volts);
}

TEST(DeviceSessionTest, FailedSetTimeoutKeepsPreviousValue)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, SetTimeout(_, 100u)).WillOnce(Return(-1));

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  EXPECT_THROW(session->SetTimeout(100), TransferError);
  EXPECT_EQ(session->timeout_ms(), 0u);
}

TEST(DeviceSessionTest, CloseReleasesConfigurationsBeforeDevice)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  ON_CALL(*driver, Open(_, _)).WillByDefault(ReturnHandleIn1(0x10));
  ON_CALL(*driver, SpiConfigurationOpen(_)).WillByDefault(ReturnHandleIn0(0x20));
  ON_CALL(*driver, I2cConfigurationOpen(_)).WillByDefault(ReturnHandleIn0(0x30));

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  shared_ptr<SpiConfiguration> spi = session->CreateSpiConfiguration();
  shared_ptr<I2cConfiguration> i2c = session->CreateI2cConfiguration();
  {
    InSequence seq;
    EXPECT_CALL(*driver, SpiConfigurationClose(0x20)).Times(1);
    EXPECT_CALL(*driver, I2cConfigurationClose(0x30)).Times(1);
    EXPECT_CALL(*driver, Close(0x10)).Times(1);
  }
  session->Close();
  EXPECT_FALSE(session->IsOpen());
  EXPECT_FALSE(spi->IsOpen());
  EXPECT_FALSE(i2c->IsOpen());
}

TEST(DeviceSessionTest, ClosedConfigurationsAreForgotten)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, SpiConfigurationClose(_)).Times(3);

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  for (int i=0; i < 3; i++) {
    shared_ptr<SpiConfiguration> config = session->CreateSpiConfiguration();
    EXPECT_EQ(session->configuration_count(), 1u);
    config->Close();
    EXPECT_EQ(session->configuration_count(), 0u);
  }
  session->Close();
}

TEST(DeviceSessionTest, CloseIsIdempotent)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, Close(_)).Times(1);

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  session->Close();
  EXPECT_NO_THROW(session->Close());
  session.reset();
}

TEST(DeviceSessionTest, CloseReleasesEverythingThenReportsFirstFailure)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, SpiConfigurationClose(_)).WillOnce(Return(-5));
  EXPECT_CALL(*driver, Close(_)).WillOnce(Return(-6));

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  session->CreateSpiConfiguration();
  try {
    session->Close();
    FAIL() << "Close should report the configuration failure";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.function(), "ni845xSpiConfigurationClose");
    EXPECT_EQ(e.status(), -5);
  }
  EXPECT_FALSE(session->IsOpen());
}

TEST(DeviceSessionTest, ClosedSessionRefusesWork)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  EXPECT_CALL(*driver, SpiConfigurationOpen(_)).Times(0);
  EXPECT_CALL(*driver, SetTimeout(_, _)).Times(0);

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  session->Close();
  EXPECT_THROW(session->handle(), HandleClosedError);
  EXPECT_THROW(session->CreateSpiConfiguration(), HandleClosedError);
  EXPECT_THROW(session->SetTimeout(1000), HandleClosedError);
}

TEST(DeviceSessionTest, DestructorClosesDevice)
{
  shared_ptr<NiceDriver> driver = MakeDriver();
  ON_CALL(*driver, Open(_, _)).WillByDefault(ReturnHandleIn1(0x10));
  EXPECT_CALL(*driver, Close(0x10)).Times(1);

  shared_ptr<DeviceSession> session = DeviceSession::Open(driver, "USB0::A");
  session.reset();
  ::testing::Mock::VerifyAndClearExpectations(driver.get());
}
